#pragma once

#include "cache_key.hpp"
#include "config.hpp"
#include "eviction_policy.hpp"
#include "recency_store.hpp"
#include "stats.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace memocache {

// Memoizing cache for one wrapped computation.
//
// A single mutex guards the store, the cached full verdict and the
// counters. The computation itself always runs with the mutex released, so
// a slow call never blocks hits for other keys. Two callers missing on the
// same key may both compute. With a size bound the first to insert wins and
// the other returns its own result without storing it; without one the
// later result overwrites the stored value.
//
// Exceptions from key construction (UnhashableArgument) or from the
// computation propagate unchanged and leave store and counters untouched.
template<typename R>
class CacheEngine {
public:
    using result_type = R;
    using ComputeFn = std::function<R(const ArgList&, const KwargMap&)>;

    explicit CacheEngine(const CacheConfig& config = {}, MemoryProbe probe = nullptr)
        : config_(config)
        , keys_(config.typed)
        , policy_(make_eviction_policy(config, std::move(probe)))
    {
        auto status = config_.validate();
        if (!status) {
            throw std::invalid_argument("Invalid cache configuration: " + status.message());
        }

        switch (policy_->kind()) {
            case PolicyKind::Disabled:
                lookup_ = &CacheEngine::get_uncached;
                break;
            case PolicyKind::Unbounded:
                lookup_ = &CacheEngine::get_unbounded;
                break;
            case PolicyKind::FixedCapacity:
            case PolicyKind::MemoryPressure:
                lookup_ = &CacheEngine::get_bounded;
                break;
        }
    }

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    R get_or_compute(const ArgList& args, const KwargMap& kwargs, const ComputeFn& compute) {
        return (this->*lookup_)(args, kwargs, compute);
    }

    R get_or_compute(const ArgList& args, const ComputeFn& compute) {
        return get_or_compute(args, KwargMap{}, compute);
    }

    CacheStats stats() const {
        std::lock_guard lock(mutex_);
        return stats_.snapshot(policy_->capacity(), store_.size());
    }

    void clear() {
        // Old entries are destroyed after the lock is released
        Store retired;
        {
            std::lock_guard lock(mutex_);
            store_.swap(retired);
            full_ = false;
            stats_.reset();
        }
    }

    const CacheConfig& config() const noexcept { return config_; }
    PolicyKind policy_kind() const noexcept { return policy_->kind(); }

    bool check_invariants() const {
        std::lock_guard lock(mutex_);
        return store_.check_invariants();
    }

private:
    using Store = RecencyStore<CacheKey, R>;
    using LookupFn = R (CacheEngine::*)(const ArgList&, const KwargMap&, const ComputeFn&);

    // Caching disabled: every call computes and counts as a miss
    R get_uncached(const ArgList& args, const KwargMap& kwargs, const ComputeFn& compute) {
        R result = compute(args, kwargs);
        std::lock_guard lock(mutex_);
        stats_.record_miss();
        return result;
    }

    // No size limit, so recency order is irrelevant and lookups don't promote
    R get_unbounded(const ArgList& args, const KwargMap& kwargs, const ComputeFn& compute) {
        CacheKey key = keys_.build(args, kwargs);
        {
            std::lock_guard lock(mutex_);
            if (auto hit = store_.peek(key)) {
                stats_.record_hit();
                return std::move(*hit);
            }
        }

        R result = compute(args, kwargs);

        // A racing caller's value is overwritten; it dies after unlock
        std::optional<R> replaced;
        {
            std::lock_guard lock(mutex_);
            replaced = store_.exchange_value(key, result);
            if (!replaced) {
                store_.insert_or_reuse_slot(std::move(key), result, false);
            }
            stats_.record_miss();
        }
        return result;
    }

    R get_bounded(const ArgList& args, const KwargMap& kwargs, const ComputeFn& compute) {
        CacheKey key = keys_.build(args, kwargs);
        {
            std::lock_guard lock(mutex_);
            if (auto hit = store_.lookup_and_promote(key)) {
                stats_.record_hit();
                return std::move(*hit);
            }
        }

        R result = compute(args, kwargs);

        // Declared before the lock so the evicted entry dies after unlock
        std::optional<typename Store::Evicted> evicted;
        {
            std::lock_guard lock(mutex_);
            if (store_.contains(key)) {
                // Inserted by another caller while we were computing; keep theirs
            } else if (full_) {
                evicted = store_.insert_or_reuse_slot(std::move(key), result, true);
                if (!policy_->stable_when_full()) {
                    full_ = policy_->is_full(store_.size());
                }
            } else {
                store_.insert_or_reuse_slot(std::move(key), result, false);
                full_ = policy_->is_full(store_.size());
            }
            stats_.record_miss();
        }
        return result;
    }

    CacheConfig config_;
    KeyBuilder keys_;
    std::unique_ptr<EvictionPolicy> policy_;
    LookupFn lookup_ = nullptr;

    mutable std::mutex mutex_;
    Store store_;
    StatsCounter stats_;
    bool full_ = false;
};

}  // namespace memocache
