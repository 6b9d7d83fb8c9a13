#include "component_registry.h"
#include "config.h"
#include "dispatcher.h"
#include "logger.h"
#include "signal_binding.h"
#include "utils.h"
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace parley {

void list_components(const ComponentRegistry& registry) {
    std::cout << "inputs:   " << utils::join(registry.input_kinds(), ", ") << "\n";
    std::cout << "outputs:  " << utils::join(registry.output_kinds(), ", ") << "\n";
    std::cout << "services: " << utils::join(registry.service_kinds(), ", ") << "\n";
}

} // namespace parley

int main(int argc, char* argv[]) {
    parley::ComponentRegistry registry;
    parley::register_builtin_components(registry);

    if (argc > 1 && std::string(argv[1]) == "--list-components") {
        parley::list_components(registry);
        return 0;
    }
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [config.json | --list-components]\n";
        return 1;
    }

    std::string config_path = argc > 1 ? argv[1] : "config/parley.json";

    parley::Config config;
    try {
        config = parley::Config::load_from_file(config_path);
    } catch (const std::exception& e) {
        parley::Logger::error(std::string("Configuration error: ") + e.what());
        return 1;
    }

    parley::Logger::initialize(parley::parse_log_level(config.logging.level), config.logging.file);

    int result = 0;
    // Declared outside the try so the signal binding always dies first
    std::unique_ptr<parley::Dispatcher> dispatcher;
    try {
        dispatcher = parley::Dispatcher::create(config, registry);
        parley::SignalBinding signals(*dispatcher);
        dispatcher->run();
    } catch (const std::exception& e) {
        parley::Logger::error(std::string("Startup failed: ") + e.what());
        result = 1;
    }
    dispatcher.reset();

    parley::Logger::shutdown();
    return result;
}
