#pragma once

#include "types.hpp"
#include <concepts>
#include <initializer_list>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace memocache {

// Dynamically typed call argument.
//
// Numeric kinds (Bool, Int, Float) compare by numeric value across kinds and
// hash consistently with that equality. List compares like Tuple but cannot
// be hashed, so it can never be part of a cache key.
class Value {
public:
    enum class Kind : uint8_t {
        None,
        Bool,
        Int,
        Float,
        String,
        Tuple,
        FrozenSet,
        List,
        KwargMark,  // Separates positional from keyword arguments in a key
        TypeTag     // Argument kind recorded by typed keys
    };

    using Items = std::vector<Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : kind_(Kind::Bool), data_(b) {}

    template<std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T v) : kind_(Kind::Int), data_(static_cast<int64_t>(v)) {}

    template<std::floating_point T>
    Value(T v) : kind_(Kind::Float), data_(static_cast<double>(v)) {}

    Value(std::string s) : kind_(Kind::String), data_(std::move(s)) {}
    Value(std::string_view s) : kind_(Kind::String), data_(std::string(s)) {}
    Value(const char* s) : kind_(Kind::String), data_(std::string(s)) {}

    static Value tuple(Items items);
    static Value tuple(std::initializer_list<Value> items) { return tuple(Items(items)); }

    // Duplicates (by equality) are dropped; every element must be hashable
    static Value frozenset(Items items);
    static Value frozenset(std::initializer_list<Value> items) { return frozenset(Items(items)); }

    static Value list(Items items);
    static Value list(std::initializer_list<Value> items) { return list(Items(items)); }

    static Value kwarg_mark();
    static Value type_tag(Kind kind);

    Kind kind() const noexcept { return kind_; }
    bool is_none() const noexcept { return kind_ == Kind::None; }
    bool is_numeric() const noexcept {
        return kind_ == Kind::Bool || kind_ == Kind::Int || kind_ == Kind::Float;
    }
    bool is_sequence() const noexcept {
        return kind_ == Kind::Tuple || kind_ == Kind::FrozenSet || kind_ == Kind::List;
    }

    bool as_bool() const;
    int64_t as_int() const;
    double as_float() const;
    const std::string& as_string() const;
    const Items& items() const;

    // Throws UnhashableArgument for List (or a container holding one)
    uint64_t hash() const;

    bool operator==(const Value& other) const;

    const char* type_name() const noexcept { return kind_name(kind_); }
    static const char* kind_name(Kind kind) noexcept;

    std::string to_string() const;

private:
    using ItemsPtr = std::shared_ptr<const Items>;

    Value(Kind kind, ItemsPtr items) : kind_(kind), data_(std::move(items)) {}

    Kind kind_ = Kind::None;
    std::variant<std::monostate, bool, int64_t, double, std::string, ItemsPtr, Kind> data_;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

// Positional arguments in call order
using ArgList = std::vector<Value>;

// Keyword arguments, ordered by name
using KwargMap = std::map<std::string, Value>;

}  // namespace memocache
