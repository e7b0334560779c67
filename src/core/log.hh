#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace rune::log {

    enum class Level {
        eDebug,
        eInfo,
        eWarn,
        eError,
    };

    inline Level threshold = Level::eInfo;

    std::optional<Level> parse_level(std::string_view name);

    void write(Level level, std::string_view msg);

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        if( threshold <= Level::eDebug ) { write(Level::eDebug, fmt::format(format, std::forward<Args>(args)...)); }
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        if( threshold <= Level::eInfo ) { write(Level::eInfo, fmt::format(format, std::forward<Args>(args)...)); }
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        if( threshold <= Level::eWarn ) { write(Level::eWarn, fmt::format(format, std::forward<Args>(args)...)); }
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        write(Level::eError, fmt::format(format, std::forward<Args>(args)...));
    }
}
