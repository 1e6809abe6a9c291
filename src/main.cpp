#include "memocache/memocache.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>            Configuration file path\n"
              << "  -n, --capacity <n|none>        Maximum entries (default: 128, 0 disables caching)\n"
              << "  -m, --memory-threshold <MB>    Evict while less than this much memory is available\n"
              << "      --typed                    Cache arguments of different kinds separately\n"
              << "  -t, --threads <n>              Worker threads (default: 4)\n"
              << "  -k, --keys <n>                 Distinct keys in the workload (default: 1000)\n"
              << "  -i, --iterations <n>           Calls per thread (default: 100000)\n"
              << "  -w, --work-us <us>             Simulated compute time per miss (default: 0)\n"
              << "  -h, --help                     Show this help\n"
              << "  -v, --version                  Show version\n";
}

void print_version() {
    std::cout << "memocache_bench version " << memocache::Version::string() << "\n"
              << "Memoizing LRU cache workload driver\n";
}

struct Workload {
    size_t threads = 4;
    uint64_t keys = 1000;
    uint64_t iterations = 100000;
    std::chrono::microseconds work{0};
};

// Deterministic stand-in for an expensive computation
int64_t simulated_compute(int64_t n, std::chrono::microseconds work) {
    if (work.count() > 0) {
        std::this_thread::sleep_for(work);
    }
    int64_t acc = 0;
    for (int64_t i = 1; i <= 64; ++i) {
        acc += (n * i) % 1000003;
    }
    return acc;
}

}  // namespace

int main(int argc, char* argv[]) {
    memocache::CacheConfig config;
    Workload workload;
    std::string config_file;

    // Command line options override the config file
    bool capacity_set = false;
    std::optional<uint64_t> capacity_override;
    std::optional<uint64_t> threshold_override;
    bool typed_override = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }

            if (arg == "-v" || arg == "--version") {
                print_version();
                return 0;
            }

            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_file = argv[++i];
            }
            else if ((arg == "-n" || arg == "--capacity") && i + 1 < argc) {
                std::string value = argv[++i];
                capacity_set = true;
                if (value != "none") {
                    capacity_override = std::stoull(value);
                }
            }
            else if ((arg == "-m" || arg == "--memory-threshold") && i + 1 < argc) {
                threshold_override = std::stoull(argv[++i]) * 1024 * 1024;
            }
            else if (arg == "--typed") {
                typed_override = true;
            }
            else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
                workload.threads = std::stoul(argv[++i]);
            }
            else if ((arg == "-k" || arg == "--keys") && i + 1 < argc) {
                workload.keys = std::stoull(argv[++i]);
            }
            else if ((arg == "-i" || arg == "--iterations") && i + 1 < argc) {
                workload.iterations = std::stoull(argv[++i]);
            }
            else if ((arg == "-w" || arg == "--work-us") && i + 1 < argc) {
                workload.work = std::chrono::microseconds(std::stoll(argv[++i]));
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
        return 1;
    }

    // Load config file if specified
    if (!config_file.empty()) {
        try {
            config = memocache::CacheConfig::load(config_file);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << "\n";
            return 1;
        }
    }

    if (capacity_set) config.capacity = capacity_override;
    if (threshold_override) config.memory_threshold_bytes = *threshold_override;
    if (typed_override) config.typed = true;

    // Validate config
    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid configuration (" << memocache::error_code_string(status.code())
                  << "): " << status.message() << "\n";
        return 1;
    }

    if (workload.threads == 0 || workload.keys == 0) {
        std::cerr << "Invalid workload: threads and keys must be positive\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        memocache::CacheEngine<int64_t> cache(config);

        // Print startup info
        std::cout << "Starting memocache_bench " << memocache::Version::string() << "\n";
        std::cout << "  Policy: " << memocache::policy_kind_string(cache.policy_kind()) << "\n";
        if (config.uses_memory_pressure()) {
            std::cout << "  Memory threshold: "
                      << (*config.memory_threshold_bytes / (1024 * 1024)) << " MB\n";
        } else if (config.capacity) {
            std::cout << "  Capacity: " << *config.capacity << " entries\n";
        }
        std::cout << "  Typed keys: " << (config.typed ? "yes" : "no") << "\n";
        std::cout << "  Threads: " << workload.threads
                  << ", keys: " << workload.keys
                  << ", iterations/thread: " << workload.iterations << "\n";

        auto compute = [&workload](const memocache::ArgList& args, const memocache::KwargMap&) {
            return simulated_compute(args.at(0).as_int(), workload.work);
        };

        auto start = std::chrono::steady_clock::now();

        std::vector<std::thread> threads;
        threads.reserve(workload.threads);
        for (size_t t = 0; t < workload.threads; ++t) {
            threads.emplace_back([&cache, &compute, &workload, t]() {
                std::mt19937_64 gen(t + 1);
                std::uniform_int_distribution<uint64_t> dis(0, workload.keys - 1);
                for (uint64_t i = 0; i < workload.iterations && g_running; ++i) {
                    auto k = static_cast<int64_t>(dis(gen));
                    cache.get_or_compute({k}, compute);
                }
            });
        }

        for (auto& t : threads) {
            t.join();
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        auto stats = cache.stats();
        std::cout << "Results:\n";
        std::cout << "  Hits: " << stats.hits << "\n";
        std::cout << "  Misses: " << stats.misses << "\n";
        std::cout << "  Size: " << stats.size;
        if (stats.capacity) {
            std::cout << " / " << *stats.capacity;
        }
        std::cout << "\n";
        std::cout << "  Hit ratio: " << std::fixed << std::setprecision(2)
                  << (stats.hit_ratio() * 100) << "%\n";
        std::cout << "  Elapsed: " << elapsed.count() << " ms\n";

        if (!cache.check_invariants()) {
            std::cerr << "Recency list is inconsistent with the key map\n";
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
