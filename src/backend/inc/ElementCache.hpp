#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

// Reference-key issuer for backend element handles. Keys are "e1", "e2", ...
// and never reused; the least recently used entry is evicted at capacity.
template <typename Handle>
class ElementCache {
public:
    static constexpr size_t kDefaultCapacity = 500;

    explicit ElementCache(size_t capacity = kDefaultCapacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    std::string add(Handle handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string key = "e" + std::to_string(++next_id_);

        order_.push_front(key);
        entries_.emplace(key, Entry{std::move(handle), order_.begin()});

        while (entries_.size() > capacity_) {
            entries_.erase(order_.back());
            order_.pop_back();
        }
        return key;
    }

    std::optional<Handle> try_get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second.position);
        return it->second.handle;
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(key) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        order_.clear();
    }

private:
    struct Entry {
        Handle handle;
        std::list<std::string>::iterator position;
    };

    size_t capacity_;
    size_t next_id_ = 0;
    std::list<std::string> order_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::mutex mutex_;
};
