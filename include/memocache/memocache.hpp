#pragma once

// Main MemoCache header - includes everything needed

#include "types.hpp"
#include "value.hpp"
#include "cache_key.hpp"
#include "config.hpp"
#include "eviction_policy.hpp"
#include "recency_store.hpp"
#include "stats.hpp"
#include "cache_engine.hpp"

namespace memocache {

// Version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static const char* string() { return "0.1.0"; }
};

}  // namespace memocache
