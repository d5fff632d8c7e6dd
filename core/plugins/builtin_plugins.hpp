#pragma once

#include "plugin/plugin_factory.hpp"

namespace hearth {
namespace plugins {

// Register every plugin shipped with the hub. Used by both executables so
// a plugin runs the same code in-process and under hearth-plugin-host.
void register_builtin_plugins(plugin::PluginFactoryTable &table);

}  // namespace plugins
}  // namespace hearth
