#pragma once

#include "types.hpp"

namespace memocache {

// Point-in-time cache statistics
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    std::optional<uint64_t> capacity;  // nullopt when not bounded by entry count
    uint64_t size = 0;

    double hit_ratio() const noexcept {
        uint64_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

// Hit/miss counters. Not synchronized: the owning engine mutates and reads
// them under its store lock so snapshots line up with the store size.
class StatsCounter {
public:
    void record_hit() noexcept { ++hits_; }
    void record_miss() noexcept { ++misses_; }

    uint64_t hits() const noexcept { return hits_; }
    uint64_t misses() const noexcept { return misses_; }

    CacheStats snapshot(std::optional<uint64_t> capacity, uint64_t size) const noexcept {
        CacheStats s;
        s.hits = hits_;
        s.misses = misses_;
        s.capacity = capacity;
        s.size = size;
        return s;
    }

    void reset() noexcept {
        hits_ = 0;
        misses_ = 0;
    }

private:
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

}  // namespace memocache
