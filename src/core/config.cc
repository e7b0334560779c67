#include "config.hh"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace rune {

    namespace {
        std::optional<u64> parse_number(const char* name, std::string_view value) {
            u64 out = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
            if( ec != std::errc() || end != value.data() + value.size() ) {
                log::warn("ignoring {}={}: not a number", name, value);
                return std::nullopt;
            }
            return out;
        }

        std::optional<bool> parse_flag(const char* name, std::string_view value) {
            if( value == "1" || value == "true"  || value == "on"  ) { return true;  }
            if( value == "0" || value == "false" || value == "off" ) { return false; }
            log::warn("ignoring {}={}: expected 0 or 1", name, value);
            return std::nullopt;
        }
    }

    //____________________________________
    Config Config::from_env(const fn<const char*(const char*)>& lookup) {
        Config config;

        if( const char* value = lookup("RUNE_WIDTH") ) {
            if( auto n = parse_number("RUNE_WIDTH", value); n && *n > 0 ) {
                config.window.width = (u32)std::min<u64>(*n, MAX_WINDOW_EXTENT);
            }
        }
        if( const char* value = lookup("RUNE_HEIGHT") ) {
            if( auto n = parse_number("RUNE_HEIGHT", value); n && *n > 0 ) {
                config.window.height = (u32)std::min<u64>(*n, MAX_WINDOW_EXTENT);
            }
        }
        if( const char* value = lookup("RUNE_FRAMES_IN_FLIGHT") ) {
            if( auto n = parse_number("RUNE_FRAMES_IN_FLIGHT", value) ) {
                config.frames_in_flight = (u32)std::clamp<u64>(*n, 1, MAX_FRAMES_IN_FLIGHT);
            }
        }
        if( const char* value = lookup("RUNE_FENCE_TIMEOUT_MS") ) {
            // 0 would time out every frame.
            if( auto n = parse_number("RUNE_FENCE_TIMEOUT_MS", value); n && *n > 0 ) {
                config.fence_timeout_ns = std::min(*n, MAX_FENCE_TIMEOUT_MS) * 1'000'000;
            }
        }
        if( const char* value = lookup("RUNE_VALIDATION") ) {
            if( auto flag = parse_flag("RUNE_VALIDATION", value) ) { config.validation = *flag; }
        }
        if( const char* value = lookup("RUNE_VSYNC") ) {
            if( auto flag = parse_flag("RUNE_VSYNC", value) ) { config.vsync = *flag; }
        }
        if( const char* value = lookup("RUNE_LOG_LEVEL") ) {
            if( auto level = log::parse_level(value) ) { config.log_level = *level; }
            else { log::warn("ignoring RUNE_LOG_LEVEL={}: unknown level", value); }
        }
        return config;
    }
}
