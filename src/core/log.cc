#include "log.hh"

#include <cstdio>

namespace rune::log {

    //____________________________________
    std::optional<Level> parse_level(std::string_view name) {
        if( name == "debug" ) { return Level::eDebug; }
        if( name == "info"  ) { return Level::eInfo;  }
        if( name == "warn"  ) { return Level::eWarn;  }
        if( name == "error" ) { return Level::eError; }
        return std::nullopt;
    }

    //____________________________________
    void write(Level level, std::string_view msg) {
        switch( level ) {
            case Level::eDebug: fmt::print(stdout, ">> debug  {}\n", msg); break;
            case Level::eInfo:  fmt::print(stdout, ">> info   {}\n", msg); break;
            case Level::eWarn:  fmt::print(stderr, ">> warn   {}\n", msg); break;
            case Level::eError: fmt::print(stderr, ">> error  {}\n", msg); break;
        }
    }
}
