#include "memocache/value.hpp"
#include <cmath>
#include <limits>
#include <sstream>

namespace memocache {

namespace {

// Per-kind seeds keep e.g. the string "1" and the integer 1 apart
constexpr uint64_t SEED_NUMBER = 0x6E756D6265720001ULL;
constexpr uint64_t SEED_STRING = 0x737472696E670002ULL;
constexpr uint64_t SEED_TUPLE = 0x7475706C65000003ULL;
constexpr uint64_t SEED_SET = 0x7365740000000004ULL;
constexpr uint64_t SEED_TAG = 0x7461670000000005ULL;
constexpr uint64_t HASH_NONE = 0x9E3779B97F4A7C15ULL;
constexpr uint64_t HASH_KWARG_MARK = 0xC2B2AE3D27D4EB4FULL;
constexpr uint64_t HASH_NAN = 0x6E616E0000000006ULL;

// True if d holds an integer representable as int64
bool integral_double(double d, int64_t& out) {
    if (!std::isfinite(d) || std::trunc(d) != d) return false;
    // 2^63 is exactly representable; anything at or above it overflows
    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) return false;
    out = static_cast<int64_t>(d);
    return true;
}

uint64_t hash_integer(int64_t v) noexcept {
    return hash_bytes(&v, sizeof(v), SEED_NUMBER);
}

bool items_equal(const Value::Items& a, const Value::Items& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!(a[i] == b[i])) return false;
    }
    return true;
}

bool set_contains(const Value::Items& set, const Value& v) {
    for (const auto& e : set) {
        if (e == v) return true;
    }
    return false;
}

}  // namespace

Value Value::tuple(Items items) {
    return Value(Kind::Tuple, std::make_shared<const Items>(std::move(items)));
}

Value Value::frozenset(Items items) {
    Items unique;
    unique.reserve(items.size());
    for (auto& item : items) {
        item.hash();  // rejects unhashable members up front
        if (!set_contains(unique, item)) {
            unique.push_back(std::move(item));
        }
    }
    return Value(Kind::FrozenSet, std::make_shared<const Items>(std::move(unique)));
}

Value Value::list(Items items) {
    return Value(Kind::List, std::make_shared<const Items>(std::move(items)));
}

Value Value::kwarg_mark() {
    Value v;
    v.kind_ = Kind::KwargMark;
    return v;
}

Value Value::type_tag(Kind kind) {
    Value v;
    v.kind_ = Kind::TypeTag;
    v.data_ = kind;
    return v;
}

bool Value::as_bool() const {
    if (kind_ != Kind::Bool) {
        throw std::logic_error(std::string("value is not a bool: ") + type_name());
    }
    return std::get<bool>(data_);
}

int64_t Value::as_int() const {
    if (kind_ == Kind::Bool) return std::get<bool>(data_) ? 1 : 0;
    if (kind_ != Kind::Int) {
        throw std::logic_error(std::string("value is not an int: ") + type_name());
    }
    return std::get<int64_t>(data_);
}

double Value::as_float() const {
    switch (kind_) {
        case Kind::Float: return std::get<double>(data_);
        case Kind::Int: return static_cast<double>(std::get<int64_t>(data_));
        case Kind::Bool: return std::get<bool>(data_) ? 1.0 : 0.0;
        default:
            throw std::logic_error(std::string("value is not numeric: ") + type_name());
    }
}

const std::string& Value::as_string() const {
    if (kind_ != Kind::String) {
        throw std::logic_error(std::string("value is not a string: ") + type_name());
    }
    return std::get<std::string>(data_);
}

const Value::Items& Value::items() const {
    if (!is_sequence()) {
        throw std::logic_error(std::string("value has no items: ") + type_name());
    }
    return *std::get<ItemsPtr>(data_);
}

uint64_t Value::hash() const {
    switch (kind_) {
        case Kind::None:
            return HASH_NONE;
        case Kind::Bool:
        case Kind::Int:
            return hash_integer(as_int());
        case Kind::Float: {
            double d = std::get<double>(data_);
            int64_t i;
            if (integral_double(d, i)) return hash_integer(i);
            // Every NaN payload is the same key
            if (std::isnan(d)) return HASH_NAN;
            return hash_bytes(&d, sizeof(d), SEED_NUMBER);
        }
        case Kind::String: {
            const auto& s = std::get<std::string>(data_);
            return hash_bytes(s.data(), s.size(), SEED_STRING);
        }
        case Kind::Tuple: {
            uint64_t h = SEED_TUPLE;
            for (const auto& item : items()) {
                h = hash_combine(h, item.hash());
            }
            return hash_combine(h, items().size());
        }
        case Kind::FrozenSet: {
            // Order-independent: sum of individually mixed member hashes
            uint64_t sum = 0;
            for (const auto& item : items()) {
                sum += hash_combine(SEED_SET, item.hash());
            }
            return hash_combine(sum, items().size());
        }
        case Kind::List:
            throw UnhashableArgument(type_name());
        case Kind::KwargMark:
            return HASH_KWARG_MARK;
        case Kind::TypeTag:
            return hash_combine(SEED_TAG, static_cast<uint64_t>(std::get<Kind>(data_)));
    }
    throw std::logic_error("unknown value kind");
}

bool Value::operator==(const Value& other) const {
    if (is_numeric() && other.is_numeric()) {
        if (kind_ != Kind::Float && other.kind_ != Kind::Float) {
            return as_int() == other.as_int();
        }
        if (kind_ == Kind::Float && other.kind_ == Kind::Float) {
            double a = std::get<double>(data_);
            double b = std::get<double>(other.data_);
            // Key equality must be reflexive, so NaN matches NaN
            return a == b || (std::isnan(a) && std::isnan(b));
        }
        const Value& f = kind_ == Kind::Float ? *this : other;
        const Value& n = kind_ == Kind::Float ? other : *this;
        int64_t i;
        return integral_double(std::get<double>(f.data_), i) && i == n.as_int();
    }

    if (kind_ != other.kind_) return false;

    switch (kind_) {
        case Kind::None:
        case Kind::KwargMark:
            return true;
        case Kind::String:
            return std::get<std::string>(data_) == std::get<std::string>(other.data_);
        case Kind::Tuple:
        case Kind::List:
            return items_equal(items(), other.items());
        case Kind::FrozenSet: {
            const auto& a = items();
            const auto& b = other.items();
            if (a.size() != b.size()) return false;
            for (const auto& e : a) {
                if (!set_contains(b, e)) return false;
            }
            return true;
        }
        case Kind::TypeTag:
            return std::get<Kind>(data_) == std::get<Kind>(other.data_);
        default:
            return false;
    }
}

const char* Value::kind_name(Kind kind) noexcept {
    switch (kind) {
        case Kind::None: return "none";
        case Kind::Bool: return "bool";
        case Kind::Int: return "int";
        case Kind::Float: return "float";
        case Kind::String: return "string";
        case Kind::Tuple: return "tuple";
        case Kind::FrozenSet: return "frozenset";
        case Kind::List: return "list";
        case Kind::KwargMark: return "kwarg-mark";
        case Kind::TypeTag: return "type-tag";
    }
    return "unknown";
}

std::string Value::to_string() const {
    std::ostringstream oss;
    switch (kind_) {
        case Kind::None:
            oss << "none";
            break;
        case Kind::Bool:
            oss << (std::get<bool>(data_) ? "true" : "false");
            break;
        case Kind::Int:
            oss << std::get<int64_t>(data_);
            break;
        case Kind::Float:
            oss << std::get<double>(data_);
            break;
        case Kind::String:
            oss << '"' << std::get<std::string>(data_) << '"';
            break;
        case Kind::Tuple:
        case Kind::FrozenSet:
        case Kind::List: {
            const char* open = kind_ == Kind::Tuple ? "(" : kind_ == Kind::List ? "[" : "{";
            const char* close = kind_ == Kind::Tuple ? ")" : kind_ == Kind::List ? "]" : "}";
            oss << open;
            const auto& xs = items();
            for (size_t i = 0; i < xs.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << xs[i].to_string();
            }
            oss << close;
            break;
        }
        case Kind::KwargMark:
            oss << "<kwargs>";
            break;
        case Kind::TypeTag:
            oss << "<" << kind_name(std::get<Kind>(data_)) << ">";
            break;
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.to_string();
}

}  // namespace memocache
