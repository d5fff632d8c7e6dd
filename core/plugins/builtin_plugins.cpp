#include "builtin_plugins.hpp"

#include "diagnostic_echo.hpp"
#include "link_mirror.hpp"

namespace hearth {
namespace plugins {

void register_builtin_plugins(plugin::PluginFactoryTable &table) {
    table.register_factory(LinkMirrorPlugin::kImplementationId, [] { return std::make_unique<LinkMirrorPlugin>(); });
    table.register_factory(DiagnosticEchoPlugin::kImplementationId,
                           [] { return std::make_unique<DiagnosticEchoPlugin>(); });
}

}  // namespace plugins
}  // namespace hearth
