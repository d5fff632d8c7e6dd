#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "selector.hpp"

namespace hearth {
namespace devices {

struct Binding {
    uint64_t binding_id = 0;
    std::string plugin_id;
    std::string selector;
    int64_t created_at = 0;
};

/**
 * @brief Plugin-to-device claims, in registration order
 *
 * Bindings exist only while their plugin is loaded: the supervisor calls
 * release_plugin() on unload. Registration order decides ownership when
 * several selectors match the same device.
 */
class BindingTable {
public:
    BindingTable() = default;

    BindingTable(const BindingTable &) = delete;
    BindingTable &operator=(const BindingTable &) = delete;

    /**
     * @brief Add a binding
     *
     * Adding the same selector twice for one plugin is idempotent and returns
     * the existing binding id.
     * @return INVALID_ARGUMENT for an empty plugin id or a malformed selector
     */
    Status add(const std::string &plugin_id, const std::string &selector, uint64_t &binding_id);

    bool remove(uint64_t binding_id);

    // Remove one plugin's binding by selector expression. Returns removed count.
    size_t remove_selector(const std::string &plugin_id, const std::string &selector);

    // Remove every binding of a plugin. Returns removed count.
    size_t release_plugin(const std::string &plugin_id);

    std::vector<Binding> list() const;
    std::vector<Binding> for_plugin(const std::string &plugin_id) const;
    size_t count_for(const std::string &plugin_id) const;

    // Bindings whose selector matches, in registration order
    std::vector<Binding> matching(const Device &device) const;

private:
    struct Entry {
        Binding binding;
        Selector selector;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    uint64_t next_binding_id_ = 1;
};

}  // namespace devices
}  // namespace hearth
