#include "memocache/types.hpp"
#include <xxhash.h>

namespace memocache {

uint64_t hash_bytes(const void* data, size_t len, uint64_t seed) noexcept {
    return XXH3_64bits_withSeed(data, len, seed);
}

uint64_t hash_combine(uint64_t seed, uint64_t value) noexcept {
    uint64_t buf[2] = {seed, value};
    return XXH3_64bits(buf, sizeof(buf));
}

// Status helpers
const char* error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        default: return "Unknown error";
    }
}

}  // namespace memocache
