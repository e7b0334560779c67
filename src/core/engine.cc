#include "engine.hh"
#include "system.hh"

namespace rune {

    void Engine::run() {
        size_t initialized = 0;
        try {
            for( ; initialized < systems.size(); initialized++ ) {
                systems[initialized]->init();
            }
            while( !should_exit ) {
                for( auto& system : systems ) {
                    system->tick();
                }
            }
        } catch( ... ) {
            shutdown(initialized);
            throw;
        }
        shutdown(initialized);
    }

    void Engine::shutdown(size_t initialized) {
        for( size_t i = initialized; i-- > 0; ) {
            systems[i]->terminate();
        }
    }
}
