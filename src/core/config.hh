#pragma once

#include "types.hh"
#include "log.hh"

#include <cstdlib>
#include <string>

namespace rune {

    const u32 MAX_FRAMES_IN_FLIGHT  = 3;
    const u32 MAX_WINDOW_EXTENT     = 16384;
    const u64 MAX_FENCE_TIMEOUT_MS  = 60'000;

    //____________________________________
    // Startup settings. Defaults are usable as is; from_env() layers
    // RUNE_* environment overrides on top of them.
    struct Config {
        std::string app_name = "rune";

        struct {
            u32 width  = 1600;
            u32 height = 900;
        } window;

        u32  frames_in_flight = 2;
        u64  fence_timeout_ns = 1'000'000'000;
        bool validation       = true;
        bool vsync            = false;
        log::Level log_level  = log::Level::eInfo;

        u32 global_descriptor_sets = 10;
        u32 frame_descriptor_sets  = 1000;

        static Config from_env(const fn<const char*(const char*)>& lookup = [](const char* name) -> const char* { return std::getenv(name); });
    };
}
