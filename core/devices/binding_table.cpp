#include "binding_table.hpp"

#include "common/clock.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace devices {

Status BindingTable::add(const std::string &plugin_id, const std::string &selector, uint64_t &binding_id) {
    if (plugin_id.empty()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Binding needs a plugin id");
    }

    Selector parsed;
    std::string error;
    if (!Selector::parse(selector, parsed, error)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : entries_) {
        if (entry.binding.plugin_id == plugin_id && entry.binding.selector == parsed.expression()) {
            binding_id = entry.binding.binding_id;
            return Status::success();
        }
    }

    Entry entry;
    entry.binding.binding_id = next_binding_id_++;
    entry.binding.plugin_id = plugin_id;
    entry.binding.selector = parsed.expression();
    entry.binding.created_at = now_epoch_ms();
    entry.selector = std::move(parsed);
    binding_id = entry.binding.binding_id;

    LOG_DEBUG("[Bindings] " << plugin_id << " bound '" << entry.binding.selector << "' (#" << binding_id << ")");
    entries_.push_back(std::move(entry));
    return Status::success();
}

bool BindingTable::remove(uint64_t binding_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->binding.binding_id == binding_id) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

size_t BindingTable::remove_selector(const std::string &plugin_id, const std::string &selector) {
    Selector parsed;
    std::string error;
    const std::string expression = Selector::parse(selector, parsed, error) ? parsed.expression() : selector;

    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->binding.plugin_id == plugin_id && it->binding.selector == expression) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t BindingTable::release_plugin(const std::string &plugin_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->binding.plugin_id == plugin_id) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_DEBUG("[Bindings] Released " << removed << " binding(s) of " << plugin_id);
    }
    return removed;
}

std::vector<Binding> BindingTable::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Binding> result;
    result.reserve(entries_.size());
    for (const auto &entry : entries_) {
        result.push_back(entry.binding);
    }
    return result;
}

std::vector<Binding> BindingTable::for_plugin(const std::string &plugin_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Binding> result;
    for (const auto &entry : entries_) {
        if (entry.binding.plugin_id == plugin_id) {
            result.push_back(entry.binding);
        }
    }
    return result;
}

size_t BindingTable::count_for(const std::string &plugin_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto &entry : entries_) {
        if (entry.binding.plugin_id == plugin_id) {
            count++;
        }
    }
    return count;
}

std::vector<Binding> BindingTable::matching(const Device &device) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Binding> result;
    for (const auto &entry : entries_) {
        if (entry.selector.matches(device)) {
            result.push_back(entry.binding);
        }
    }
    return result;
}

}  // namespace devices
}  // namespace hearth
