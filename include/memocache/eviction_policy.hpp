#pragma once

#include "types.hpp"
#include <atomic>
#include <memory>

namespace memocache {

struct CacheConfig;

enum class PolicyKind {
    Disabled,
    Unbounded,
    FixedCapacity,
    MemoryPressure
};

const char* policy_kind_string(PolicyKind kind);

// Decides when the cache counts as full.
//
// is_full() is only consulted right after an insertion; the engine caches
// the verdict and acts on it at the next insertion, so a fixed-capacity
// cache holds exactly n entries before the first eviction.
class EvictionPolicy {
public:
    virtual ~EvictionPolicy() = default;

    virtual PolicyKind kind() const noexcept = 0;
    virtual bool is_full(size_t current_size) const = 0;

    // Reported capacity: 0 when disabled, none when not bounded by count
    virtual std::optional<uint64_t> capacity() const noexcept = 0;

    // True if a full verdict cannot change while the entry count stays put
    virtual bool stable_when_full() const noexcept { return true; }
};

class DisabledPolicy : public EvictionPolicy {
public:
    PolicyKind kind() const noexcept override { return PolicyKind::Disabled; }
    bool is_full(size_t) const override { return true; }
    std::optional<uint64_t> capacity() const noexcept override { return 0; }
};

class UnboundedPolicy : public EvictionPolicy {
public:
    PolicyKind kind() const noexcept override { return PolicyKind::Unbounded; }
    bool is_full(size_t) const override { return false; }
    std::optional<uint64_t> capacity() const noexcept override { return std::nullopt; }
};

class FixedCapacityPolicy : public EvictionPolicy {
public:
    explicit FixedCapacityPolicy(uint64_t max_entries) : max_entries_(max_entries) {}

    PolicyKind kind() const noexcept override { return PolicyKind::FixedCapacity; }
    bool is_full(size_t current_size) const override {
        return current_size >= max_entries_;
    }
    std::optional<uint64_t> capacity() const noexcept override { return max_entries_; }

private:
    uint64_t max_entries_;
};

// Full while the probe reports less available memory than the threshold.
// The entry count is ignored. A probe that fails (no reading, or throws a
// std::exception) is treated as "not full".
class MemoryPressurePolicy : public EvictionPolicy {
public:
    MemoryPressurePolicy(uint64_t threshold_bytes, MemoryProbe probe);

    PolicyKind kind() const noexcept override { return PolicyKind::MemoryPressure; }
    bool is_full(size_t current_size) const override;
    std::optional<uint64_t> capacity() const noexcept override { return std::nullopt; }
    bool stable_when_full() const noexcept override { return false; }

    uint64_t threshold_bytes() const noexcept { return threshold_bytes_; }

private:
    uint64_t threshold_bytes_;
    MemoryProbe probe_;
    // Only the first probe failure is logged
    mutable std::atomic<bool> probe_warned_{false};
};

// Reads MemAvailable from /proc/meminfo
std::optional<uint64_t> system_available_memory();

// Selects the policy for a configuration. A non-zero memory threshold wins
// over capacity; otherwise no capacity means unbounded and 0 means disabled.
// A null probe selects system_available_memory().
std::unique_ptr<EvictionPolicy> make_eviction_policy(
    const CacheConfig& config,
    MemoryProbe probe = nullptr);

}  // namespace memocache
