#include "memocache/config.hpp"
#include <cctype>
#include <fstream>
#include <sstream>

namespace memocache {

// Minimal JSON field extraction for the flat config object

namespace {

class SimpleJson {
public:
    explicit SimpleJson(const std::string& json) : json_(json) {}

    // Position just past the ':' following "key", or npos
    size_t value_pos(const std::string& key) const {
        auto pos = json_.find("\"" + key + "\"");
        if (pos == std::string::npos) return pos;

        pos = json_.find(':', pos);
        if (pos == std::string::npos) return pos;

        ++pos;
        while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos]))) ++pos;
        return pos;
    }

    bool has(const std::string& key) const {
        return value_pos(key) != std::string::npos;
    }

    bool is_null(const std::string& key) const {
        auto pos = value_pos(key);
        return pos != std::string::npos && json_.compare(pos, 4, "null") == 0;
    }

    // Throws std::invalid_argument on a malformed number
    int64_t get_int(const std::string& key, int64_t def = 0) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos) return def;

        auto end = pos;
        while (end < json_.size() && (std::isdigit(static_cast<unsigned char>(json_[end])) || json_[end] == '-')) ++end;

        if (end == pos) return def;
        return std::stoll(json_.substr(pos, end - pos));
    }

    bool get_bool(const std::string& key, bool def = false) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos) return def;

        if (json_.compare(pos, 4, "true") == 0) return true;
        if (json_.compare(pos, 5, "false") == 0) return false;
        return def;
    }

private:
    std::string json_;
};

// Absent or null fields keep their default; negative values are rejected
std::optional<uint64_t> get_optional_size(
    const SimpleJson& j,
    const std::string& key,
    std::optional<uint64_t> def)
{
    if (!j.has(key)) return def;
    if (j.is_null(key)) return std::nullopt;

    int64_t v = j.get_int(key, -1);
    if (v < 0) {
        throw std::invalid_argument("Config field '" + key + "' must be a non-negative integer or null");
    }
    return static_cast<uint64_t>(v);
}

}  // namespace

CacheConfig CacheConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

CacheConfig CacheConfig::load_json(const std::string& json) {
    CacheConfig config;
    SimpleJson j(json);

    config.capacity = get_optional_size(j, "capacity", config.capacity);
    config.typed = j.get_bool("typed", config.typed);
    config.memory_threshold_bytes =
        get_optional_size(j, "memory_threshold_bytes", config.memory_threshold_bytes);

    return config;
}

void CacheConfig::save(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
    file << to_json();
}

std::string CacheConfig::to_json() const {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"capacity\": ";
    if (capacity) oss << *capacity; else oss << "null";
    oss << ",\n";
    oss << "  \"typed\": " << (typed ? "true" : "false") << ",\n";
    oss << "  \"memory_threshold_bytes\": ";
    if (memory_threshold_bytes) oss << *memory_threshold_bytes; else oss << "null";
    oss << "\n";
    oss << "}\n";
    return oss.str();
}

Status CacheConfig::validate() const {
    if (!uses_memory_pressure() && capacity && *capacity > MAX_CAPACITY) {
        return Status::error(ErrorCode::InvalidArgument,
                             "Capacity exceeds the maximum of " + std::to_string(MAX_CAPACITY) + " entries");
    }

    return Status::make_ok();
}

}  // namespace memocache
