#pragma once

#include "types.hh"
#include "config.hh"
#include "system.hh"

#include <concepts>
#include <memory>
#include <utility>
#include <vector>

namespace rune {

    //____________________________________
    // Owns the systems and runs them: init in insertion order, tick until
    // should_exit, terminate in reverse.
    class Engine {
        public:
            explicit Engine(Config cfg) : config(std::move(cfg)) {}

            void run();

            template <std::derived_from<System> SystemType, typename... Args>
            Engine& add_system(Args&&... args) {
                auto system = std::make_unique<SystemType>(std::forward<Args>(args)...);
                system->link(this);
                systems.push_back(std::move(system));
                return *this;
            }

            template <std::derived_from<System> SystemType>
            SystemType* get() {
                for( auto& system : systems ) {
                    if( auto found = dynamic_cast<SystemType*>(system.get()) ) { return found; }
                }
                return nullptr;
            }

            Config config;
            bool should_exit = false;
            std::vector<std::unique_ptr<System>> systems;

        private:
            void shutdown(size_t initialized);
    };
}
