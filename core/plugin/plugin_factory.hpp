#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "plugin.hpp"

namespace hearth {
namespace plugin {

using PluginFactory = std::function<std::unique_ptr<IPlugin>()>;

/**
 * @brief Registration table of plugin implementations, keyed by implementation id
 *
 * Replaces runtime discovery: every implementation the orchestrator (or the
 * plugin host) can instantiate is registered explicitly at start-up.
 */
class PluginFactoryTable {
public:
    PluginFactoryTable() = default;

    PluginFactoryTable(const PluginFactoryTable &) = delete;
    PluginFactoryTable &operator=(const PluginFactoryTable &) = delete;

    // Returns false if the id is already registered
    bool register_factory(const std::string &implementation_id, PluginFactory factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        return factories_.emplace(implementation_id, std::move(factory)).second;
    }

    // nullptr if unknown or the factory produced nothing
    std::unique_ptr<IPlugin> create(const std::string &implementation_id) const {
        PluginFactory factory;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = factories_.find(implementation_id);
            if (it == factories_.end()) {
                return nullptr;
            }
            factory = it->second;
        }
        return factory();
    }

    bool has(const std::string &implementation_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return factories_.count(implementation_id) > 0;
    }

    std::vector<std::string> ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto &[id, factory] : factories_) {
            static_cast<void>(factory);
            result.push_back(id);
        }
        return result;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, PluginFactory> factories_;
};

}  // namespace plugin
}  // namespace hearth
