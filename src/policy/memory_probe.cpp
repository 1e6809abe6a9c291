#include "memocache/eviction_policy.hpp"
#include <fstream>
#include <sstream>
#include <string>

namespace memocache {

std::optional<uint64_t> system_available_memory() {
    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo) {
        return std::nullopt;
    }

    // Line format: "MemAvailable:   12345678 kB"
    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.rfind("MemAvailable:", 0) != 0) continue;

        std::istringstream iss(line.substr(13));
        uint64_t value = 0;
        std::string unit;
        if (!(iss >> value)) {
            return std::nullopt;
        }
        iss >> unit;
        if (unit == "kB") {
            value *= 1024;
        }
        return value;
    }
    return std::nullopt;
}

}  // namespace memocache
