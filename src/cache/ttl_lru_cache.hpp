#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <core/constants.hpp>

struct CacheStats {
    std::size_t size = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    double hit_rate = 0.0;    // hits / (hits + misses), 0 with no accesses
};

// Bounded key/value store with per-entry expiry and LRU eviction.
//
// Entries live in a slot arena linked into a recency list by index
// (head = most recently used, tail = next eviction candidate). Freed slots
// go on a free list and are reused. The index map and the list are only
// ever changed together, under one mutex.
template <typename V>
class TtlLruCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;
    using NowFn = std::function<TimePoint()>;

    explicit TtlLruCache(std::size_t capacity = DEFAULT_CACHE_MAX_SIZE,
                         Duration default_ttl = Duration(DEFAULT_CACHE_TTL_MS),
                         NowFn now = nullptr)
        : capacity_(capacity == 0 ? 1 : capacity),
          default_ttl_(default_ttl),
          now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

    TtlLruCache(const TtlLruCache&) = delete;
    TtlLruCache& operator=(const TtlLruCache&) = delete;

    // Returns the value if present and unexpired. Expired entries are removed.
    // A hit promotes the entry to most recently used.
    std::optional<V> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }

        std::uint32_t slot = it->second;
        if (now_() > nodes_[slot].expiry) {
            index_.erase(it);
            release(slot);
            ++misses_;
            return std::nullopt;
        }

        move_to_front(slot);
        ++hits_;
        return *nodes_[slot].value;
    }

    void set(const std::string& key, V value) {
        set(key, std::move(value), default_ttl_);
    }

    // Insert or replace. A new key that takes the cache over capacity
    // evicts exactly one entry, the least recently used.
    void set(const std::string& key, V value, Duration ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint expiry = now_() + ttl;

        auto it = index_.find(key);
        if (it != index_.end()) {
            Node& node = nodes_[it->second];
            node.value = std::move(value);
            node.expiry = expiry;
            move_to_front(it->second);
            return;
        }

        std::uint32_t slot = acquire();
        Node& node = nodes_[slot];
        node.key = key;
        node.value = std::move(value);
        node.expiry = expiry;
        link_front(slot);
        index_.emplace(key, slot);

        if (index_.size() > capacity_) {
            evict_lru();
        }
    }

    void invalidate(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        remove_locked(key);
    }

    // Removes every entry whose key matches. O(n) in the cache size.
    std::size_t invalidate_if(const std::function<bool(const std::string&)>& pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> doomed;
        for (const auto& [key, slot] : index_) {
            if (pred(key)) doomed.push_back(key);
        }
        for (const auto& key : doomed) {
            remove_locked(key);
        }
        return doomed.size();
    }

    std::size_t invalidate_prefix(const std::string& prefix) {
        return invalidate_if([&prefix](const std::string& key) {
            return key.compare(0, prefix.size(), prefix) == 0;
        });
    }

    // Drops all entries and resets hit/miss counters.
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        nodes_.clear();
        free_.clear();
        index_.clear();
        head_ = npos;
        tail_ = npos;
        hits_ = 0;
        misses_ = 0;
    }

    // Removes all expired entries. Returns how many were dropped.
    std::size_t cleanup() {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = now_();
        std::vector<std::string> doomed;
        for (const auto& [key, slot] : index_) {
            if (now > nodes_[slot].expiry) doomed.push_back(key);
        }
        for (const auto& key : doomed) {
            remove_locked(key);
        }
        return doomed.size();
    }

    // Absent keys count as expired. Does not touch counters or recency.
    bool is_expired(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return true;
        return now_() > nodes_[it->second].expiry;
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.count(key) > 0;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats s;
        s.size = index_.size();
        s.hits = hits_;
        s.misses = misses_;
        std::uint64_t total = hits_ + misses_;
        s.hit_rate = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
        return s;
    }

    std::size_t capacity() const { return capacity_; }
    Duration default_ttl() const { return default_ttl_; }

private:
    static constexpr std::uint32_t npos = std::numeric_limits<std::uint32_t>::max();

    struct Node {
        std::string key;
        std::optional<V> value;
        TimePoint expiry{};
        std::uint32_t prev = npos;
        std::uint32_t next = npos;
    };

    // All helpers below expect mutex_ to be held.

    std::uint32_t acquire() {
        if (!free_.empty()) {
            std::uint32_t slot = free_.back();
            free_.pop_back();
            return slot;
        }
        nodes_.emplace_back();
        return static_cast<std::uint32_t>(nodes_.size() - 1);
    }

    // Unlinks the slot and returns it to the free list. The index entry must
    // already be gone.
    void release(std::uint32_t slot) {
        unlink(slot);
        Node& node = nodes_[slot];
        node.key.clear();
        node.value.reset();
        free_.push_back(slot);
    }

    void link_front(std::uint32_t slot) {
        Node& node = nodes_[slot];
        node.prev = npos;
        node.next = head_;
        if (head_ != npos) nodes_[head_].prev = slot;
        head_ = slot;
        if (tail_ == npos) tail_ = slot;
    }

    void unlink(std::uint32_t slot) {
        Node& node = nodes_[slot];
        if (node.prev != npos) nodes_[node.prev].next = node.next;
        else head_ = node.next;
        if (node.next != npos) nodes_[node.next].prev = node.prev;
        else tail_ = node.prev;
        node.prev = npos;
        node.next = npos;
    }

    void move_to_front(std::uint32_t slot) {
        if (slot == head_) return;
        unlink(slot);
        link_front(slot);
    }

    void evict_lru() {
        if (tail_ == npos) return;
        std::uint32_t slot = tail_;
        index_.erase(nodes_[slot].key);
        release(slot);
    }

    void remove_locked(const std::string& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return;
        std::uint32_t slot = it->second;
        index_.erase(it);
        release(slot);
    }

    std::size_t capacity_;
    Duration default_ttl_;
    NowFn now_;

    std::vector<Node> nodes_;
    std::vector<std::uint32_t> free_;
    std::unordered_map<std::string, std::uint32_t> index_;
    std::uint32_t head_ = npos;
    std::uint32_t tail_ = npos;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
    mutable std::mutex mutex_;
};
