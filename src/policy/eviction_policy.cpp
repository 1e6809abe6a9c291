#include "memocache/eviction_policy.hpp"
#include "memocache/config.hpp"
#include <iostream>

namespace memocache {

const char* policy_kind_string(PolicyKind kind) {
    switch (kind) {
        case PolicyKind::Disabled: return "disabled";
        case PolicyKind::Unbounded: return "unbounded";
        case PolicyKind::FixedCapacity: return "fixed-capacity";
        case PolicyKind::MemoryPressure: return "memory-pressure";
        default: return "unknown";
    }
}

MemoryPressurePolicy::MemoryPressurePolicy(uint64_t threshold_bytes, MemoryProbe probe)
    : threshold_bytes_(threshold_bytes)
    , probe_(probe ? std::move(probe) : MemoryProbe(system_available_memory))
{}

bool MemoryPressurePolicy::is_full(size_t) const {
    std::optional<uint64_t> available;
    try {
        available = probe_();
    } catch (const std::exception& e) {
        if (!probe_warned_.exchange(true)) {
            std::cerr << "[MemoCache] memory probe failed, assuming not full: "
                      << e.what() << "\n";
        }
        return false;
    } catch (...) {
        if (!probe_warned_.exchange(true)) {
            std::cerr << "[MemoCache] memory probe failed with a non-standard exception, "
                      << "assuming not full\n";
        }
        return false;
    }

    if (!available) {
        if (!probe_warned_.exchange(true)) {
            std::cerr << "[MemoCache] memory probe returned no reading, assuming not full\n";
        }
        return false;
    }
    return *available < threshold_bytes_;
}

std::unique_ptr<EvictionPolicy> make_eviction_policy(
    const CacheConfig& config,
    MemoryProbe probe)
{
    if (config.uses_memory_pressure()) {
        return std::make_unique<MemoryPressurePolicy>(
            *config.memory_threshold_bytes, std::move(probe));
    }
    if (!config.capacity) {
        return std::make_unique<UnboundedPolicy>();
    }
    if (*config.capacity == 0) {
        return std::make_unique<DisabledPolicy>();
    }
    return std::make_unique<FixedCapacityPolicy>(*config.capacity);
}

}  // namespace memocache
