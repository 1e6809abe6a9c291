#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <stdexcept>
#include <functional>
#include <optional>

namespace memocache {

// Constants
constexpr uint64_t DEFAULT_CAPACITY = 128;
// Arena slots are addressed with 32-bit indices; slot 0 is the sentinel
constexpr uint64_t MAX_CAPACITY = 0xFFFFFFFEULL;

// Error codes
enum class ErrorCode {
    Ok = 0,
    InvalidArgument
};

const char* error_code_string(ErrorCode code);

// Status wrapper
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    explicit Status(ErrorCode code, std::string msg = {})
        : code_(code), message_(std::move(msg)) {}

    static Status make_ok() { return Status(); }
    static Status error(ErrorCode code, std::string msg = {}) {
        return Status(code, std::move(msg));
    }

    bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_error() const noexcept { return code_ != ErrorCode::Ok; }
    explicit operator bool() const noexcept { return ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// Thrown when an argument cannot take part in a cache key
class UnhashableArgument : public std::invalid_argument {
public:
    explicit UnhashableArgument(std::string_view type_name)
        : std::invalid_argument("unhashable argument type: " + std::string(type_name))
        , type_name_(type_name)
    {}

    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

// Available system memory in bytes, or nullopt if it cannot be read
using MemoryProbe = std::function<std::optional<uint64_t>()>;

// Hash helpers (xxHash XXH3)
uint64_t hash_bytes(const void* data, size_t len, uint64_t seed = 0) noexcept;
uint64_t hash_combine(uint64_t seed, uint64_t value) noexcept;

}  // namespace memocache
