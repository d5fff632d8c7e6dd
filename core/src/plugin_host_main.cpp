// Hearth plugin host
// Serves one built-in plugin over the framed protocol on stdin/stdout.
// Logs go to stderr; stdout carries frames only.

#include <unistd.h>

#include <csignal>
#include <iostream>
#include <string>

#include "host/plugin_host.hpp"
#include "logging/logger.hpp"
#include "plugin/plugin_factory.hpp"
#include "plugins/builtin_plugins.hpp"
#include "transport/framed_channel.hpp"

int main(int argc, char **argv) {
    std::string implementation_id;
    std::string log_level = "info";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.substr(0, 9) == "--plugin=") {
            implementation_id = arg.substr(9);
        } else if (arg.substr(0, 12) == "--log-level=") {
            log_level = arg.substr(12);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: hearth-plugin-host --plugin=ID [--log-level=LEVEL]\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    hearth::plugin::PluginFactoryTable factories;
    hearth::plugins::register_builtin_plugins(factories);

    if (implementation_id.empty() || !factories.has(implementation_id)) {
        std::cerr << "ERROR: --plugin must name a built-in plugin:";
        for (const auto &id : factories.ids()) {
            std::cerr << " " << id;
        }
        std::cerr << "\n";
        return 1;
    }

    hearth::logging::Logger::set_level(hearth::logging::string_to_level(log_level));

    // The orchestrator may close the pipe before reading a reply
    std::signal(SIGPIPE, SIG_IGN);

    hearth::transport::FramedChannel channel(STDIN_FILENO, STDOUT_FILENO);
    hearth::host::PluginHost host(factories, implementation_id, channel);
    return host.run();
}
