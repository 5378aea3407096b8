#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <unordered_map>

// Key/value cache whose entries expire a fixed interval after insertion.
// Expiry is checked on read against a caller-supplied time point, so tests
// can drive the clock explicitly.
template <typename Key, typename Value, typename Clock = std::chrono::steady_clock>
class TimedCache {
public:
    using TimePoint = typename Clock::time_point;
    using Duration = typename Clock::duration;

    explicit TimedCache(Duration expiry) : expiry_(expiry) {}

    std::optional<Value> get(Key const& key, TimePoint now) const {
        auto it = entries_.find(key);
        if (it == entries_.end() || now - it->second.stored_at >= expiry_) {
            return std::nullopt;
        }
        return it->second.value;
    }

    std::optional<Value> get(Key const& key) const { return get(key, Clock::now()); }

    void put(Key const& key, Value const& value, TimePoint now) {
        entries_[key] = Entry{value, now};
    }

    void put(Key const& key, Value const& value) { put(key, value, Clock::now()); }

    // Drops entries that have expired at `now`
    void prune(TimePoint now) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now - it->second.stored_at >= expiry_) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void clear() { entries_.clear(); }
    size_t size() const { return entries_.size(); }
    Duration expiry() const { return expiry_; }

private:
    struct Entry {
        Value value;
        TimePoint stored_at;
    };

    Duration expiry_;
    std::unordered_map<Key, Entry> entries_;
};
