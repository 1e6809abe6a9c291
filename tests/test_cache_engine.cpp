#include <catch2/catch_test_macros.hpp>
#include "memocache/cache_engine.hpp"
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace memocache;

namespace {

// Computation that records every call it receives
struct CountingFn {
    std::shared_ptr<std::vector<int64_t>> calls = std::make_shared<std::vector<int64_t>>();

    int64_t operator()(const ArgList& args, const KwargMap&) const {
        int64_t n = static_cast<int64_t>(args.at(0).as_float());
        calls->push_back(n);
        return n * n;
    }

    size_t count() const { return calls->size(); }
};

CacheConfig with_capacity(std::optional<uint64_t> capacity) {
    CacheConfig config;
    config.capacity = capacity;
    return config;
}

}  // namespace

TEST_CASE("CacheEngine hits and misses", "[engine]") {
    CacheEngine<int64_t> cache(with_capacity(8));
    CountingFn fn;

    SECTION("Only the first call per key computes") {
        REQUIRE(cache.get_or_compute({4}, fn) == 16);
        REQUIRE(cache.get_or_compute({4}, fn) == 16);
        REQUIRE(cache.get_or_compute({4}, fn) == 16);

        auto stats = cache.stats();
        REQUIRE(stats.misses == 1);
        REQUIRE(stats.hits == 2);
        REQUIRE(stats.size == 1);
        REQUIRE(stats.capacity == 8u);
        REQUIRE(fn.count() == 1);
    }

    SECTION("Hits return the stored result") {
        int64_t calls = 0;
        auto nondeterministic = [&calls](const ArgList&, const KwargMap&) { return ++calls; };

        REQUIRE(cache.get_or_compute({"k"}, nondeterministic) == 1);
        REQUIRE(cache.get_or_compute({"k"}, nondeterministic) == 1);
        REQUIRE(calls == 1);
    }

    SECTION("Keyword arguments are part of the key") {
        auto fn_kw = [](const ArgList&, const KwargMap& kwargs) {
            return kwargs.empty() ? int64_t{0} : kwargs.begin()->second.as_int();
        };
        REQUIRE(cache.get_or_compute({1}, fn_kw) == 0);
        REQUIRE(cache.get_or_compute({1}, {{"x", 5}}, fn_kw) == 5);
        REQUIRE(cache.get_or_compute({1}, {{"x", 5}}, fn_kw) == 5);
        REQUIRE(cache.stats().size == 2);
        REQUIRE(cache.stats().hits == 1);
    }
}

TEST_CASE("CacheEngine LRU scenario", "[engine]") {
    CacheEngine<int64_t> cache(with_capacity(2));
    CountingFn fn;

    cache.get_or_compute({1}, fn);
    REQUIRE(cache.stats().misses == 1);
    REQUIRE(cache.stats().size == 1);

    cache.get_or_compute({2}, fn);
    REQUIRE(cache.stats().misses == 2);
    REQUIRE(cache.stats().size == 2);

    // Hit promotes 1; order is now [2, 1]
    cache.get_or_compute({1}, fn);
    REQUIRE(cache.stats().hits == 1);

    // Evicts 2, the least recently used
    cache.get_or_compute({3}, fn);
    REQUIRE(cache.stats().misses == 3);
    REQUIRE(cache.stats().size == 2);

    // 1 and 3 are still cached
    cache.get_or_compute({1}, fn);
    cache.get_or_compute({3}, fn);
    REQUIRE(cache.stats().hits == 3);

    // 2 was evicted
    cache.get_or_compute({2}, fn);
    auto stats = cache.stats();
    REQUIRE(stats.misses == 4);
    REQUIRE(stats.size == 2);
    REQUIRE(fn.calls->back() == 2);
    REQUIRE(cache.check_invariants());
}

TEST_CASE("CacheEngine fixed capacity", "[engine]") {
    const uint64_t n = 5;
    CacheEngine<int64_t> cache(with_capacity(n));
    CountingFn fn;

    SECTION("Fills to exactly n before evicting") {
        for (int64_t i = 0; i < static_cast<int64_t>(n); ++i) {
            cache.get_or_compute({i}, fn);
        }
        REQUIRE(cache.stats().size == n);

        cache.get_or_compute({100}, fn);
        REQUIRE(cache.stats().size == n);

        // Key 0 was the oldest and is gone; key 1 is still there
        cache.get_or_compute({1}, fn);
        REQUIRE(cache.stats().hits == 1);
        cache.get_or_compute({0}, fn);
        REQUIRE(cache.stats().hits == 1);
        REQUIRE(cache.stats().misses == n + 2);
    }

    SECTION("Recently used keys outlive older ones") {
        for (int64_t i = 0; i < static_cast<int64_t>(n); ++i) {
            cache.get_or_compute({i}, fn);
        }
        // Touch the oldest keys so 2, 3, 4 become the eviction candidates
        cache.get_or_compute({0}, fn);
        cache.get_or_compute({1}, fn);

        for (int64_t i = 10; i < 13; ++i) {
            cache.get_or_compute({i}, fn);
        }

        size_t before = fn.count();
        cache.get_or_compute({0}, fn);
        cache.get_or_compute({1}, fn);
        REQUIRE(fn.count() == before);

        cache.get_or_compute({2}, fn);
        REQUIRE(fn.count() == before + 1);
        REQUIRE(cache.check_invariants());
    }

    SECTION("Capacity one") {
        CacheEngine<int64_t> single(with_capacity(1));
        single.get_or_compute({1}, fn);
        single.get_or_compute({2}, fn);
        single.get_or_compute({2}, fn);
        single.get_or_compute({1}, fn);

        auto stats = single.stats();
        REQUIRE(stats.size == 1);
        REQUIRE(stats.hits == 1);
        REQUIRE(stats.misses == 3);
    }
}

TEST_CASE("CacheEngine typed keys", "[engine]") {
    CountingFn fn;

    SECTION("Untyped: 3 and 3.0 share an entry") {
        CacheEngine<int64_t> cache(with_capacity(8));
        cache.get_or_compute({3}, fn);
        cache.get_or_compute({3.0}, fn);

        auto stats = cache.stats();
        REQUIRE(stats.hits == 1);
        REQUIRE(stats.size == 1);
    }

    SECTION("Typed: 3 and 3.0 are distinct") {
        CacheConfig config = with_capacity(8);
        config.typed = true;
        CacheEngine<int64_t> cache(config);
        cache.get_or_compute({3}, fn);
        cache.get_or_compute({3.0}, fn);

        auto stats = cache.stats();
        REQUIRE(stats.hits == 0);
        REQUIRE(stats.misses == 2);
        REQUIRE(stats.size == 2);
    }
}

TEST_CASE("CacheEngine disabled", "[engine]") {
    CacheEngine<int64_t> cache(with_capacity(0));
    CountingFn fn;

    REQUIRE(cache.policy_kind() == PolicyKind::Disabled);

    cache.get_or_compute({1}, fn);
    cache.get_or_compute({1}, fn);
    cache.get_or_compute({1}, fn);

    auto stats = cache.stats();
    REQUIRE(stats.hits == 0);
    REQUIRE(stats.misses == 3);
    REQUIRE(stats.size == 0);
    REQUIRE(stats.capacity == 0u);
    REQUIRE(fn.count() == 3);
}

TEST_CASE("CacheEngine unbounded", "[engine]") {
    CacheEngine<int64_t> cache(with_capacity(std::nullopt));
    CountingFn fn;

    REQUIRE(cache.policy_kind() == PolicyKind::Unbounded);

    for (int64_t i = 0; i < 1000; ++i) {
        cache.get_or_compute({i}, fn);
    }
    for (int64_t i = 0; i < 1000; ++i) {
        cache.get_or_compute({i}, fn);
    }

    auto stats = cache.stats();
    REQUIRE(stats.misses == 1000);
    REQUIRE(stats.hits == 1000);
    REQUIRE(stats.size == 1000);
    REQUIRE(!stats.capacity);
}

TEST_CASE("CacheEngine NaN arguments", "[engine]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    int calls = 0;
    auto fn = [&calls](const ArgList&, const KwargMap&) { return ++calls; };

    SECTION("Evicting a NaN key keeps map and list in step") {
        CacheEngine<int> cache(with_capacity(1));
        cache.get_or_compute({nan}, fn);
        cache.get_or_compute({1}, fn);
        cache.get_or_compute({2}, fn);

        REQUIRE(cache.stats().size == 1);
        REQUIRE(cache.check_invariants());
    }

    SECTION("Repeated NaN calls hit") {
        CacheEngine<int> cache(with_capacity(std::nullopt));
        REQUIRE(cache.get_or_compute({nan}, fn) == 1);
        REQUIRE(cache.get_or_compute({nan}, fn) == 1);
        REQUIRE(cache.get_or_compute({Value::tuple({nan})}, fn) == 2);
        REQUIRE(cache.get_or_compute({Value::tuple({nan})}, fn) == 2);

        auto stats = cache.stats();
        REQUIRE(stats.hits == 2);
        REQUIRE(stats.size == 2);
        REQUIRE(cache.check_invariants());
    }
}

TEST_CASE("CacheEngine memory pressure", "[engine]") {
    uint64_t available = 1 << 30;
    CacheConfig config;
    config.capacity = 2;  // ignored under memory pressure
    config.memory_threshold_bytes = 1 << 20;
    CacheEngine<int64_t> cache(config, [&available] { return std::optional<uint64_t>(available); });
    CountingFn fn;

    REQUIRE(cache.policy_kind() == PolicyKind::MemoryPressure);

    SECTION("Plenty of memory never evicts, whatever the count") {
        for (int64_t i = 0; i < 50; ++i) {
            cache.get_or_compute({i}, fn);
        }
        auto stats = cache.stats();
        REQUIRE(stats.size == 50);
        REQUIRE(!stats.capacity);
    }

    SECTION("Low memory after an insert makes the next miss evict") {
        cache.get_or_compute({1}, fn);
        cache.get_or_compute({2}, fn);

        // Reading taken right after inserting 3
        available = 1024;
        cache.get_or_compute({3}, fn);
        REQUIRE(cache.stats().size == 3);

        // Next miss reuses the LRU slot (key 1)
        cache.get_or_compute({4}, fn);
        REQUIRE(cache.stats().size == 3);
        cache.get_or_compute({2}, fn);
        REQUIRE(cache.stats().hits == 1);

        size_t before = fn.count();
        cache.get_or_compute({1}, fn);
        REQUIRE(fn.count() == before + 1);
    }

    SECTION("Verdict is re-read after evicting inserts") {
        cache.get_or_compute({1}, fn);
        available = 1024;
        cache.get_or_compute({2}, fn);

        // Evicts 1; memory has recovered by the time the probe runs again
        available = 1 << 30;
        cache.get_or_compute({3}, fn);
        REQUIRE(cache.stats().size == 2);

        // No longer full: the cache grows again
        cache.get_or_compute({4}, fn);
        REQUIRE(cache.stats().size == 3);
        REQUIRE(cache.check_invariants());
    }
}

TEST_CASE("CacheEngine memory probe failure", "[engine]") {
    CacheConfig config;
    config.memory_threshold_bytes = 1 << 20;
    CacheEngine<int64_t> cache(config, []() -> std::optional<uint64_t> {
        throw std::runtime_error("no meminfo");
    });
    CountingFn fn;

    for (int64_t i = 0; i < 10; ++i) {
        cache.get_or_compute({i}, fn);
    }
    REQUIRE(cache.stats().size == 10);

    SECTION("Non-standard exceptions also fail open") {
        CacheEngine<int64_t> odd(config, []() -> std::optional<uint64_t> { throw 1; });
        for (int64_t i = 0; i < 5; ++i) {
            odd.get_or_compute({i}, fn);
        }

        auto stats = odd.stats();
        REQUIRE(stats.size == 5);
        REQUIRE(stats.misses == 5);
        REQUIRE(odd.check_invariants());
    }
}

TEST_CASE("CacheEngine clear", "[engine]") {
    CacheEngine<int64_t> cache(with_capacity(2));
    CountingFn fn;

    cache.get_or_compute({1}, fn);
    cache.get_or_compute({2}, fn);
    cache.get_or_compute({1}, fn);
    cache.get_or_compute({3}, fn);

    cache.clear();

    auto stats = cache.stats();
    REQUIRE(stats.hits == 0);
    REQUIRE(stats.misses == 0);
    REQUIRE(stats.size == 0);
    REQUIRE(cache.check_invariants());

    // Previously cached key misses again
    cache.get_or_compute({1}, fn);
    REQUIRE(cache.stats().misses == 1);

    // Full flag was reset: capacity is available again
    cache.get_or_compute({2}, fn);
    REQUIRE(cache.stats().size == 2);
}

TEST_CASE("CacheEngine error propagation", "[engine]") {
    CacheEngine<int64_t> cache(with_capacity(4));

    SECTION("Failing computation stores nothing and counts nothing") {
        auto failing = [](const ArgList&, const KwargMap&) -> int64_t {
            throw std::runtime_error("compute failed");
        };
        REQUIRE_THROWS_AS(cache.get_or_compute({1}, failing), std::runtime_error);

        auto stats = cache.stats();
        REQUIRE(stats.hits == 0);
        REQUIRE(stats.misses == 0);
        REQUIRE(stats.size == 0);

        // A later successful attempt is a normal miss
        CountingFn fn;
        REQUIRE(cache.get_or_compute({1}, fn) == 1);
        REQUIRE(cache.stats().misses == 1);
    }

    SECTION("Unhashable argument is rejected before computing") {
        CountingFn fn;
        REQUIRE_THROWS_AS(cache.get_or_compute({Value::list({1})}, fn), UnhashableArgument);
        REQUIRE(fn.count() == 0);

        auto stats = cache.stats();
        REQUIRE(stats.misses == 0);
        REQUIRE(stats.size == 0);
    }
}

TEST_CASE("CacheEngine re-entrant computation", "[engine]") {
    CacheEngine<uint64_t> cache(with_capacity(16));
    std::function<uint64_t(int64_t)> fib = [&](int64_t n) {
        return cache.get_or_compute({n}, [&](const ArgList& args, const KwargMap&) -> uint64_t {
            int64_t k = args[0].as_int();
            return k < 2 ? static_cast<uint64_t>(k) : fib(k - 1) + fib(k - 2);
        });
    };

    REQUIRE(fib(30) == 832040);
    REQUIRE(cache.stats().misses == 31);
    REQUIRE(cache.stats().size == 16);
    REQUIRE(cache.check_invariants());
}

TEST_CASE("CacheEngine releases evicted results", "[engine]") {
    CacheEngine<std::shared_ptr<int>> cache(with_capacity(1));
    std::weak_ptr<int> first;

    cache.get_or_compute({1}, [&first](const ArgList&, const KwargMap&) {
        auto p = std::make_shared<int>(1);
        first = p;
        return p;
    });
    REQUIRE(!first.expired());

    cache.get_or_compute({2}, [](const ArgList&, const KwargMap&) {
        return std::make_shared<int>(2);
    });
    REQUIRE(first.expired());
}

TEST_CASE("CacheEngine rejects invalid configuration", "[engine]") {
    REQUIRE_THROWS_AS(CacheEngine<int>(with_capacity(MAX_CAPACITY + 1)), std::invalid_argument);
}

TEST_CASE("CacheStats hit ratio", "[engine][stats]") {
    CacheEngine<int> cache(with_capacity(4));
    REQUIRE(cache.stats().hit_ratio() == 0.0);

    auto fn = [](const ArgList& args, const KwargMap&) { return static_cast<int>(args[0].as_int()); };
    cache.get_or_compute({1}, fn);
    cache.get_or_compute({1}, fn);
    cache.get_or_compute({1}, fn);
    cache.get_or_compute({2}, fn);

    auto stats = cache.stats();
    REQUIRE(stats.hits == 2);
    REQUIRE(stats.misses == 2);
    REQUIRE(stats.hit_ratio() == 0.5);
}
