#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace hearth {
namespace external {

/**
 * @brief Key-value cache with TTL, consumed as a plain interface
 *
 * The orchestrator only invalidates entries (plugin:<id>, plugins:*);
 * in-process plugins may use it for their own data through PluginContext.
 */
class IKeyValueCache {
public:
    virtual ~IKeyValueCache() = default;

    virtual std::optional<std::string> get(const std::string &key) = 0;

    // ttl of zero means no expiry
    virtual void set(const std::string &key, const std::string &value, std::chrono::seconds ttl) = 0;

    // Returns true if the key existed
    virtual bool remove(const std::string &key) = 0;

    // Glob pattern ("plugins:*"); returns the number of keys removed
    virtual size_t remove_pattern(const std::string &pattern) = 0;
};

// Process-local implementation, expiry checked lazily on access
class InMemoryKvCache : public IKeyValueCache {
public:
    InMemoryKvCache() = default;

    std::optional<std::string> get(const std::string &key) override;
    void set(const std::string &key, const std::string &value, std::chrono::seconds ttl) override;
    bool remove(const std::string &key) override;
    size_t remove_pattern(const std::string &pattern) override;

    size_t size() const;

private:
    struct Entry {
        std::string value;
        std::optional<std::chrono::steady_clock::time_point> expires_at;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

}  // namespace external
}  // namespace hearth
