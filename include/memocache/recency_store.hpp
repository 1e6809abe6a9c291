#pragma once

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace memocache {

// Key -> value map with a circular doubly linked recency list.
//
// The list lives in an index arena: slot 0 is the root sentinel, root.next
// is the least recently used entry and root.prev the most recently used.
// The list is empty iff root links to itself. Slots are never released one
// by one; eviction reuses the LRU slot in place and clear() drops the arena.
//
// Not synchronized; CacheEngine guards it with its own mutex.
template<typename K, typename V, typename Hash = std::hash<K>>
class RecencyStore {
public:
    using key_type = K;
    using value_type = V;
    using index_type = uint32_t;

    // Entry displaced by an evicting insert, handed back to the caller
    struct Evicted {
        K key;
        V value;
    };

    RecencyStore() { reset(); }

    RecencyStore(const RecencyStore&) = delete;
    RecencyStore& operator=(const RecencyStore&) = delete;

    // Returns the value and moves the entry to the most recent end
    std::optional<V> lookup_and_promote(const K& key) {
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;

        index_type idx = it->second;
        unlink(idx);
        link_most_recent(idx);
        return *slots_[idx].value;
    }

    // Lookup without touching the recency order
    std::optional<V> peek(const K& key) const {
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        return *slots_[it->second].value;
    }

    // Replaces the value of a present key without touching the recency
    // order. Returns the previous value, or nullopt if the key is absent.
    std::optional<V> exchange_value(const K& key, V value) {
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;

        std::optional<V> old = std::move(slots_[it->second].value);
        slots_[it->second].value = std::move(value);
        return old;
    }

    bool contains(const K& key) const {
        return map_.find(key) != map_.end();
    }

    // Inserts an absent key at the most recent end.
    //
    // With evict set, the least recently used slot is reused for the new
    // entry and its previous key and value are returned. They are moved out
    // before the slot is overwritten and must only be destroyed once the
    // store is consistent again; the caller owns that timing, so destructors
    // of evicted values never run against a half-updated list or map.
    std::optional<Evicted> insert_or_reuse_slot(K key, V value, bool evict) {
        if (evict && !empty()) {
            index_type idx = slots_[ROOT].next;

            // Map first: if this throws nothing has changed yet
            map_.emplace(key, idx);

            Slot& slot = slots_[idx];
            std::optional<Evicted> old{Evicted{std::move(*slot.key), std::move(*slot.value)}};
            slot.key = std::move(key);
            slot.value = std::move(value);

            unlink(idx);
            link_most_recent(idx);
            map_.erase(old->key);
            return old;
        }

        if (slots_.size() > MAX_INDEX) {
            throw std::length_error("RecencyStore arena is full");
        }

        auto idx = static_cast<index_type>(slots_.size());
        slots_.push_back(Slot{std::nullopt, std::nullopt, ROOT, ROOT});
        try {
            map_.emplace(key, idx);
        } catch (...) {
            slots_.pop_back();
            throw;
        }

        Slot& slot = slots_[idx];
        slot.key = std::move(key);
        slot.value = std::move(value);
        link_most_recent(idx);
        return std::nullopt;
    }

    size_t size() const noexcept { return map_.size(); }
    bool empty() const noexcept { return slots_[ROOT].next == ROOT; }

    void clear() {
        map_.clear();
        reset();
    }

    void swap(RecencyStore& other) noexcept {
        slots_.swap(other.slots_);
        map_.swap(other.map_);
    }

    // Visits entries from least to most recently used
    template<typename F>
    void for_each_by_recency(F&& func) const {
        for (index_type idx = slots_[ROOT].next; idx != ROOT; idx = slots_[idx].next) {
            func(*slots_[idx].key, *slots_[idx].value);
        }
    }

    // Walks the list and checks it against the map (for diagnostics)
    bool check_invariants() const {
        const Slot& root = slots_[ROOT];
        if (root.key || root.value) return false;
        if ((root.next == ROOT) != (root.prev == ROOT)) return false;
        if ((root.next == ROOT) != map_.empty()) return false;

        size_t count = 0;
        index_type prev = ROOT;
        for (index_type idx = root.next; idx != ROOT; idx = slots_[idx].next) {
            if (idx >= slots_.size() || ++count > map_.size()) return false;
            const Slot& slot = slots_[idx];
            if (slot.prev != prev || !slot.key || !slot.value) return false;

            auto it = map_.find(*slot.key);
            if (it == map_.end() || it->second != idx) return false;
            prev = idx;
        }
        return root.prev == prev && count == map_.size();
    }

private:
    static constexpr index_type ROOT = 0;
    static constexpr size_t MAX_INDEX = MAX_CAPACITY;

    struct Slot {
        std::optional<K> key;
        std::optional<V> value;
        index_type prev;
        index_type next;
    };

    void reset() {
        slots_.clear();
        slots_.push_back(Slot{std::nullopt, std::nullopt, ROOT, ROOT});
    }

    void unlink(index_type idx) noexcept {
        Slot& slot = slots_[idx];
        slots_[slot.prev].next = slot.next;
        slots_[slot.next].prev = slot.prev;
    }

    void link_most_recent(index_type idx) noexcept {
        index_type last = slots_[ROOT].prev;
        slots_[last].next = idx;
        slots_[ROOT].prev = idx;
        slots_[idx].prev = last;
        slots_[idx].next = ROOT;
    }

    std::vector<Slot> slots_;
    std::unordered_map<K, index_type, Hash> map_;
};

}  // namespace memocache
