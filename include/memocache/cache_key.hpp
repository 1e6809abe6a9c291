#pragma once

#include "value.hpp"
#include <vector>

namespace memocache {

// Cache key built from a call's arguments.
//
// A key is logically a flat sequence of values. Single-argument keys for
// kinds that hash cheaply store the argument directly (scalar form); all
// other keys own a composite item vector. The hash of either form is
// computed once, on construction, and equality compares the logical
// sequence, so a scalar key equals a one-item composite with an equal item.
class CacheKey {
public:
    CacheKey() : hash_(sequence_hash(items_)) {}

    static CacheKey scalar(Value value);
    static CacheKey composite(std::vector<Value> items);

    bool is_scalar() const noexcept { return scalar_form_; }
    size_t size() const noexcept { return scalar_form_ ? 1 : items_.size(); }
    const Value& operator[](size_t i) const noexcept {
        return scalar_form_ ? scalar_ : items_[i];
    }

    uint64_t hash() const noexcept { return hash_; }

    bool operator==(const CacheKey& other) const;

    std::string to_string() const;

private:
    CacheKey(Value value, uint64_t hash)
        : scalar_(std::move(value)), hash_(hash), scalar_form_(true) {}
    CacheKey(std::vector<Value> items, uint64_t hash)
        : items_(std::move(items)), hash_(hash) {}

    static uint64_t sequence_hash(const std::vector<Value>& items);

    Value scalar_;
    std::vector<Value> items_;
    uint64_t hash_ = 0;
    bool scalar_form_ = false;
};

// Turns (args, kwargs) into a CacheKey.
//
// Keyword arguments are appended after a KwargMark separator as name/value
// pairs in name order. In typed mode the kind of each argument is appended
// after all values, so 3 and 3.0 produce different keys.
class KeyBuilder {
public:
    explicit KeyBuilder(bool typed = false) : typed_(typed) {}

    // Throws UnhashableArgument if any argument cannot be hashed
    CacheKey build(const ArgList& args, const KwargMap& kwargs = {}) const;

    bool typed() const noexcept { return typed_; }

    // Kinds that are stored unwrapped when they are the only argument
    static bool is_fast_kind(Value::Kind kind) noexcept;

private:
    bool typed_;
};

}  // namespace memocache

namespace std {

template<>
struct hash<memocache::CacheKey> {
    size_t operator()(const memocache::CacheKey& k) const noexcept {
        return static_cast<size_t>(k.hash());
    }
};

}  // namespace std
