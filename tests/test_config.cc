#include "config.hh"

#include <gtest/gtest.h>

#include <map>
#include <string>

using namespace rune;

namespace {
    Config with_env(const std::map<std::string, std::string>& env) {
        return Config::from_env([&](const char* name) -> const char* {
            auto it = env.find(name);
            return it == env.end() ? nullptr : it->second.c_str();
        });
    }
}

TEST(Config, DefaultsWithoutEnvironment) {
    Config config = with_env({});
    EXPECT_EQ(config.window.width, 1600u);
    EXPECT_EQ(config.window.height, 900u);
    EXPECT_EQ(config.frames_in_flight, 2u);
    EXPECT_EQ(config.fence_timeout_ns, 1'000'000'000u);
    EXPECT_TRUE(config.validation);
    EXPECT_FALSE(config.vsync);
    EXPECT_EQ(config.log_level, log::Level::eInfo);
    EXPECT_EQ(config.global_descriptor_sets, 10u);
    EXPECT_EQ(config.frame_descriptor_sets, 1000u);
}

TEST(Config, EnvironmentOverrides) {
    Config config = with_env({
        { "RUNE_WIDTH",            "800"   },
        { "RUNE_HEIGHT",           "600"   },
        { "RUNE_FRAMES_IN_FLIGHT", "3"     },
        { "RUNE_FENCE_TIMEOUT_MS", "250"   },
        { "RUNE_VALIDATION",       "off"   },
        { "RUNE_VSYNC",            "1"     },
        { "RUNE_LOG_LEVEL",        "debug" },
    });
    EXPECT_EQ(config.window.width, 800u);
    EXPECT_EQ(config.window.height, 600u);
    EXPECT_EQ(config.frames_in_flight, 3u);
    EXPECT_EQ(config.fence_timeout_ns, 250'000'000u);
    EXPECT_FALSE(config.validation);
    EXPECT_TRUE(config.vsync);
    EXPECT_EQ(config.log_level, log::Level::eDebug);
}

TEST(Config, FramesInFlightIsClamped) {
    EXPECT_EQ(with_env({{ "RUNE_FRAMES_IN_FLIGHT", "0"  }}).frames_in_flight, 1u);
    EXPECT_EQ(with_env({{ "RUNE_FRAMES_IN_FLIGHT", "12" }}).frames_in_flight, MAX_FRAMES_IN_FLIGHT);
}

TEST(Config, OutOfRangeValuesAreClamped) {
    Config config = with_env({
        { "RUNE_WIDTH",            "4294967297"           },
        { "RUNE_HEIGHT",           "20000"                },
        { "RUNE_FENCE_TIMEOUT_MS", "18446744073709551615" },
    });
    EXPECT_EQ(config.window.width, MAX_WINDOW_EXTENT);
    EXPECT_EQ(config.window.height, MAX_WINDOW_EXTENT);
    EXPECT_EQ(config.fence_timeout_ns, MAX_FENCE_TIMEOUT_MS * 1'000'000);
}

TEST(Config, MalformedValuesKeepDefaults) {
    Config config = with_env({
        { "RUNE_WIDTH",      "wide"    },
        { "RUNE_HEIGHT",     "0"       },
        { "RUNE_VALIDATION", "maybe"   },
        { "RUNE_LOG_LEVEL",  "verbose" },
        { "RUNE_FENCE_TIMEOUT_MS", "12ms" },
    });
    EXPECT_EQ(with_env({{ "RUNE_FENCE_TIMEOUT_MS", "0" }}).fence_timeout_ns, 1'000'000'000u);
    EXPECT_EQ(with_env({{ "RUNE_WIDTH", "99999999999999999999999" }}).window.width, 1600u);
    EXPECT_EQ(config.window.width, 1600u);
    EXPECT_EQ(config.window.height, 900u);
    EXPECT_TRUE(config.validation);
    EXPECT_EQ(config.log_level, log::Level::eInfo);
    EXPECT_EQ(config.fence_timeout_ns, 1'000'000'000u);
}

TEST(Log, ParseLevel) {
    EXPECT_EQ(log::parse_level("warn"), log::Level::eWarn);
    EXPECT_EQ(log::parse_level("error"), log::Level::eError);
    EXPECT_FALSE(log::parse_level("WARN").has_value());
}
