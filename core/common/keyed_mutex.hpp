#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace hearth {

/**
 * @brief Per-key critical sections
 *
 * Serializes work on one plugin id while distinct ids proceed in parallel.
 * Shared by the install pipeline and the supervisor so that an install
 * completing and a mode switch on the same plugin never interleave.
 *
 * A key's entry lives while some Section holds or waits on it and is
 * dropped when the last one is released.
 */
class KeyedMutex {
    struct Slot {
        std::mutex mutex;
        size_t users = 0;  // guarded by map_mutex_
    };

public:
    // Held (or, from try_lock, possibly not held) section of one key
    class Section {
    public:
        Section() = default;
        ~Section() { release(); }

        Section(Section &&other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)),
              key_(std::move(other.key_)),
              slot_(std::move(other.slot_)),
              lock_(std::move(other.lock_)) {}

        Section &operator=(Section &&other) noexcept {
            if (this != &other) {
                release();
                owner_ = std::exchange(other.owner_, nullptr);
                key_ = std::move(other.key_);
                slot_ = std::move(other.slot_);
                lock_ = std::move(other.lock_);
            }
            return *this;
        }

        Section(const Section &) = delete;
        Section &operator=(const Section &) = delete;

        bool owns_lock() const { return lock_.owns_lock(); }
        void unlock() { release(); }

    private:
        friend class KeyedMutex;

        Section(KeyedMutex *owner, std::string key, std::shared_ptr<Slot> slot, bool blocking)
            : owner_(owner), key_(std::move(key)), slot_(std::move(slot)) {
            if (blocking) {
                lock_ = std::unique_lock<std::mutex>(slot_->mutex);
            } else {
                lock_ = std::unique_lock<std::mutex>(slot_->mutex, std::try_to_lock);
            }
        }

        void release() {
            if (!owner_) {
                return;
            }
            if (lock_.owns_lock()) {
                lock_.unlock();
            }
            lock_ = std::unique_lock<std::mutex>();
            slot_.reset();
            std::exchange(owner_, nullptr)->release(key_);
        }

        KeyedMutex *owner_ = nullptr;
        std::string key_;
        std::shared_ptr<Slot> slot_;
        std::unique_lock<std::mutex> lock_;
    };

    KeyedMutex() = default;

    KeyedMutex(const KeyedMutex &) = delete;
    KeyedMutex &operator=(const KeyedMutex &) = delete;

    // Blocks until the key's critical section is free
    Section lock(const std::string &key) { return Section(this, key, acquire(key), true); }

    // Non-blocking variant (health checks skip busy plugins)
    Section try_lock(const std::string &key) { return Section(this, key, acquire(key), false); }

    // Keys currently held or waited on
    size_t size() const {
        std::lock_guard<std::mutex> guard(map_mutex_);
        return locks_.size();
    }

private:
    std::shared_ptr<Slot> acquire(const std::string &key) {
        std::lock_guard<std::mutex> guard(map_mutex_);
        auto &entry = locks_[key];
        if (!entry) {
            entry = std::make_shared<Slot>();
        }
        entry->users++;
        return entry;
    }

    void release(const std::string &key) {
        std::lock_guard<std::mutex> guard(map_mutex_);
        auto it = locks_.find(key);
        if (it != locks_.end() && --it->second->users == 0) {
            locks_.erase(it);
        }
    }

    mutable std::mutex map_mutex_;  // Protects locks_ and every Slot::users
    std::map<std::string, std::shared_ptr<Slot>> locks_;
};

}  // namespace hearth
