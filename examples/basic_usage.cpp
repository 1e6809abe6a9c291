/*
 * MemoCache Basic Usage Example
 *
 * This example demonstrates:
 * - Memoizing a recursive function
 * - Keyword arguments and typed keys
 * - Reading and clearing cache statistics
 */

#include "memocache/memocache.hpp"
#include <iostream>
#include <string>

int main() {
    using namespace memocache;

    std::cout << "MemoCache Basic Usage Example\n";
    std::cout << "=============================\n\n";

    // Create configuration
    CacheConfig config;
    config.capacity = 64;

    // Validate configuration
    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid config: " << status.message() << "\n";
        return 1;
    }

    // The computation may call back into the same cache: the lock is never
    // held while it runs
    CacheEngine<uint64_t> fib_cache(config);
    std::function<uint64_t(int64_t)> fib = [&](int64_t n) -> uint64_t {
        return fib_cache.get_or_compute({n}, [&](const ArgList& args, const KwargMap&) -> uint64_t {
            int64_t k = args[0].as_int();
            return k < 2 ? static_cast<uint64_t>(k) : fib(k - 1) + fib(k - 2);
        });
    };

    std::cout << "fib(80) = " << fib(80) << "\n";
    auto stats = fib_cache.stats();
    std::cout << "  hits=" << stats.hits << " misses=" << stats.misses
              << " size=" << stats.size << "/" << *stats.capacity << "\n\n";

    // Keyword arguments are part of the key, separated from positionals
    CacheEngine<std::string> greet_cache(CacheConfig{});
    auto greet = [](const ArgList& args, const KwargMap& kwargs) {
        std::string text = "Hello, " + args.at(0).as_string();
        auto it = kwargs.find("punctuation");
        text += it != kwargs.end() ? it->second.as_string() : ".";
        return text;
    };

    std::cout << greet_cache.get_or_compute({"world"}, greet) << "\n";
    std::cout << greet_cache.get_or_compute({"world"}, {{"punctuation", "!"}}, greet) << "\n";
    std::cout << greet_cache.get_or_compute({"world"}, {{"punctuation", "!"}}, greet) << "\n";
    stats = greet_cache.stats();
    std::cout << "  hits=" << stats.hits << " misses=" << stats.misses << "\n\n";

    // Typed keys keep 3 and 3.0 apart
    CacheConfig typed_config;
    typed_config.typed = true;
    CacheEngine<std::string> typed_cache(typed_config);
    auto describe = [](const ArgList& args, const KwargMap&) {
        return std::string(args[0].type_name()) + " " + args[0].to_string();
    };

    std::cout << typed_cache.get_or_compute({3}, describe) << "\n";
    std::cout << typed_cache.get_or_compute({3.0}, describe) << "\n";
    std::cout << "  entries=" << typed_cache.stats().size << "\n\n";

    // Clearing drops entries and counters
    fib_cache.clear();
    stats = fib_cache.stats();
    std::cout << "After clear: hits=" << stats.hits << " misses=" << stats.misses
              << " size=" << stats.size << "\n";

    std::cout << "\nExample complete!\n";
    return 0;
}
