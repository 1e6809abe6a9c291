#pragma once

#include "types.hpp"
#include <string>
#include <optional>
#include <filesystem>

namespace memocache {

// Engine configuration
struct CacheConfig {
    // nullopt = unbounded, 0 = caching disabled, n = at most n entries
    std::optional<uint64_t> capacity = DEFAULT_CAPACITY;

    // Cache calls whose arguments differ only in kind separately (3 vs 3.0)
    bool typed = false;

    // If set (and non-zero) the cache is full while less than this many
    // bytes of system memory are available; capacity is then ignored
    std::optional<uint64_t> memory_threshold_bytes;

    // Load from file
    static CacheConfig load(const std::filesystem::path& path);
    static CacheConfig load_json(const std::string& json);

    // Save to file
    void save(const std::filesystem::path& path) const;
    std::string to_json() const;

    // Validation
    Status validate() const;

    bool uses_memory_pressure() const noexcept {
        return memory_threshold_bytes.has_value() && *memory_threshold_bytes > 0;
    }
};

}  // namespace memocache
