#include "memocache/cache_key.hpp"
#include <sstream>

namespace memocache {

namespace {
constexpr uint64_t SEED_KEY = 0x6B65790000000006ULL;
}

uint64_t CacheKey::sequence_hash(const std::vector<Value>& items) {
    uint64_t h = SEED_KEY;
    for (const auto& item : items) {
        h = hash_combine(h, item.hash());
    }
    return hash_combine(h, items.size());
}

// Same result as sequence_hash() over a single item
CacheKey CacheKey::scalar(Value value) {
    uint64_t h = hash_combine(hash_combine(SEED_KEY, value.hash()), 1);
    return CacheKey(std::move(value), h);
}

CacheKey CacheKey::composite(std::vector<Value> items) {
    uint64_t h = sequence_hash(items);
    return CacheKey(std::move(items), h);
}

bool CacheKey::operator==(const CacheKey& other) const {
    if (hash_ != other.hash_) return false;
    size_t n = size();
    if (n != other.size()) return false;
    for (size_t i = 0; i < n; ++i) {
        if (!((*this)[i] == other[i])) return false;
    }
    return true;
}

std::string CacheKey::to_string() const {
    std::ostringstream oss;
    oss << "key(";
    for (size_t i = 0; i < size(); ++i) {
        if (i > 0) oss << ", ";
        oss << (*this)[i];
    }
    oss << ")";
    return oss.str();
}

bool KeyBuilder::is_fast_kind(Value::Kind kind) noexcept {
    switch (kind) {
        case Value::Kind::Int:
        case Value::Kind::String:
        case Value::Kind::FrozenSet:
        case Value::Kind::None:
            return true;
        default:
            return false;
    }
}

CacheKey KeyBuilder::build(const ArgList& args, const KwargMap& kwargs) const {
    if (!typed_ && kwargs.empty() && args.size() == 1 && is_fast_kind(args[0].kind())) {
        return CacheKey::scalar(args[0]);
    }

    std::vector<Value> items;
    size_t reserve = args.size();
    if (!kwargs.empty()) reserve += 1 + 2 * kwargs.size();
    if (typed_) reserve += args.size() + kwargs.size();
    items.reserve(reserve);

    items.insert(items.end(), args.begin(), args.end());

    if (!kwargs.empty()) {
        items.push_back(Value::kwarg_mark());
        for (const auto& [name, value] : kwargs) {
            items.emplace_back(name);
            items.push_back(value);
        }
    }

    if (typed_) {
        for (const auto& arg : args) {
            items.push_back(Value::type_tag(arg.kind()));
        }
        for (const auto& [name, value] : kwargs) {
            items.push_back(Value::type_tag(value.kind()));
        }
    }

    return CacheKey::composite(std::move(items));
}

}  // namespace memocache
