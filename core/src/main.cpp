// Hearth orchestrator
// Config-based runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "hearth.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: hearth-orchestrator [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: hearth.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("Hearth orchestrator starting...");
    LOG_INFO("Loading config: " + config_path);

    // Load configuration
    hearth::runtime::RuntimeConfig config;
    std::string error;

    if (!hearth::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    // Initialize logger level
    hearth::logging::Logger::set_level(hearth::logging::string_to_level(config.logging.level));

    if (!hearth::runtime::SignalHandler::install()) {
        LOG_WARN("Failed to install signal handlers");
    }

    hearth::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }
    if (!runtime.start(error)) {
        LOG_ERROR("Runtime start failed: " + error);
        runtime.shutdown();
        return 1;
    }

    LOG_INFO("Orchestrator Ready");
    LOG_INFO("  Plugins: " << runtime.registry().size());
    LOG_INFO("  Devices: " << runtime.devices().size());
    LOG_INFO("  Links: " << runtime.graph().link_count());

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
