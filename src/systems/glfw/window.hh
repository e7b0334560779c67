#pragma once

#include "system.hh"
#include "types.hh"

#include <string>

struct GLFWwindow;

namespace rune {

    class Window : public System {
        public:
            Window(u32 w, u32 h, std::string t) : width(w), height(h), title(std::move(t)) {}

            Window(const Window&)            = delete;
            Window& operator=(const Window&) = delete;

            virtual void init() override;
            virtual void terminate() override;
            virtual void tick() override;

            f64 time() const;

            GLFWwindow* handle  = nullptr;
            bool        resized = false;

        private:
            u32         width;
            u32         height;
            std::string title;
    };
}
