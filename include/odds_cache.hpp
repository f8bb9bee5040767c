#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "markets.hpp"

namespace ee {

// Keyed store with per-entry expiry. Callers inject it so the core never
// reaches for a process-wide cache.
template <typename Key, typename Value>
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<Value> get(const Key& key) = 0;
    virtual void set(const Key& key, Value value, std::chrono::seconds ttl) = 0;
    virtual void expire(const Key& key) = 0;
    virtual void clear() = 0;
    virtual std::size_t size() const = 0;
};

template <typename Key, typename Value>
class TtlCache : public CacheStore<Key, Value> {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    TtlCache() : now_([] { return Clock::now(); }) {}
    explicit TtlCache(ClockFn now) : now_(std::move(now)) {}

    std::optional<Value> get(const Key& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (now_() >= it->second.expiresAt) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void set(const Key& key, Value value, std::chrono::seconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = now_();
        // Writes also evict every expired entry.
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now >= it->second.expiresAt) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
        Entry entry{std::move(value), now + ttl};
        entries_[key] = std::move(entry);
    }

    void expire(const Key& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(key);
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    // Counts entries not yet evicted. Expired entries stay until the next get of
    // that key or the next set.
    std::size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        Value value;
        Clock::time_point expiresAt;
    };

    ClockFn now_;
    mutable std::mutex mutex_;
    std::map<Key, Entry> entries_;
};

// Odds keyed by fixture id.
using OddsCache = CacheStore<std::int64_t, std::vector<OddsEntry>>;
using OddsCachePtr = std::shared_ptr<OddsCache>;
using InMemoryOddsCache = TtlCache<std::int64_t, std::vector<OddsEntry>>;

// Default odds freshness.
constexpr std::chrono::seconds kOddsTtl{300};

} // namespace ee
