#include "engine.hh"
#include "window.hh"
#include "render_system.hh"
#include "log.hh"

#include <exception>

int main() {
    rune::Config config = rune::Config::from_env();
    rune::log::threshold = config.log_level;
    try {
        rune::Engine(config)
            .add_system<rune::Window>           (config.window.width, config.window.height, config.app_name)
            .add_system<rune::renderer::RenderSystem>()
            .run                                ();
    } catch( const rune::Error& e ) {
        rune::log::error("{}", e.what());
        return 1;
    } catch( const std::exception& e ) {
        rune::log::error("unhandled exception :: {}", e.what());
        return 1;
    }
}
