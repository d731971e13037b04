#include <catch2/catch_test_macros.hpp>
#include "../src/data_cache.hpp"
#include <vector>

namespace {

class CountingProvider : public MarketDataProvider {
public:
    int price_calls = 0;
    int statement_calls = 0;
    int snapshot_calls = 0;
    bool fail = false;

    FetchResult<PriceSeries> get_price_history(const std::string&, const std::string&) override {
        price_calls++;
        if (fail) return FetchResult<PriceSeries>::failure("connection reset");
        return FetchResult<PriceSeries>::success({101.0, 100.0});
    }

    FetchResult<Statements> get_statements(const std::string&) override {
        statement_calls++;
        return FetchResult<Statements>::no_data("No financial data available");
    }

    FetchResult<Snapshot> get_snapshot(const std::string& symbol) override {
        snapshot_calls++;
        if (fail) return FetchResult<Snapshot>::failure("connection reset");
        Snapshot s;
        s.symbol = symbol;
        s.current_price = 101.0;
        return FetchResult<Snapshot>::success(s);
    }
};

// Manual clock; sleeping advances it
struct FakeTime {
    std::chrono::steady_clock::time_point now{};
    std::vector<std::chrono::milliseconds> sleeps;

    CachingProvider::Clock clock() {
        return [this] { return now; };
    }
    CachingProvider::Sleeper sleeper() {
        return [this](std::chrono::milliseconds d) {
            sleeps.push_back(d);
            now += d;
        };
    }
};

} // namespace

TEST_CASE("Provider cache", "[cache]") {
    auto upstream = std::make_shared<CountingProvider>();
    FakeTime time;

    SECTION("Repeated fetches within the TTL hit the cache") {
        CachingProvider cache(upstream, 300, 0, time.clock(), time.sleeper());

        REQUIRE(cache.get_snapshot("ACME").ok());
        REQUIRE(cache.get_snapshot("ACME").ok());
        REQUIRE(cache.get_price_history("ACME", "1y").data.size() == 2);
        REQUIRE(cache.get_price_history("ACME", "1y").data.size() == 2);

        REQUIRE(upstream->snapshot_calls == 1);
        REQUIRE(upstream->price_calls == 1);
        REQUIRE(cache.upstream_calls() == 2);
    }

    SECTION("Keys include the symbol and the data kind") {
        CachingProvider cache(upstream, 300, 0, time.clock(), time.sleeper());

        cache.get_snapshot("ACME");
        cache.get_snapshot("OTHER");
        cache.get_price_history("ACME", "1y");
        cache.get_price_history("ACME", "5d");

        REQUIRE(upstream->snapshot_calls == 2);
        REQUIRE(upstream->price_calls == 2);
    }

    SECTION("Entries expire after the TTL") {
        CachingProvider cache(upstream, 300, 0, time.clock(), time.sleeper());

        cache.get_snapshot("ACME");
        time.now += std::chrono::seconds(299);
        cache.get_snapshot("ACME");
        REQUIRE(upstream->snapshot_calls == 1);

        time.now += std::chrono::seconds(1);
        cache.get_snapshot("ACME");
        REQUIRE(upstream->snapshot_calls == 2);
    }

    SECTION("Expired entries are swept when another entry is stored") {
        CachingProvider cache(upstream, 300, 0, time.clock(), time.sleeper());

        cache.get_snapshot("ACME");
        cache.get_price_history("ACME", "1y");
        REQUIRE(cache.cached_entries() == 2);

        time.now += std::chrono::seconds(301);
        cache.get_snapshot("OTHER");
        REQUIRE(cache.cached_entries() == 1);
    }

    SECTION("Failures and empty answers are not cached") {
        CachingProvider cache(upstream, 300, 0, time.clock(), time.sleeper());

        upstream->fail = true;
        REQUIRE(cache.get_snapshot("ACME").status == FetchStatus::ProviderFailure);
        upstream->fail = false;
        REQUIRE(cache.get_snapshot("ACME").ok());
        REQUIRE(upstream->snapshot_calls == 2);

        cache.get_statements("ACME");
        cache.get_statements("ACME");
        REQUIRE(upstream->statement_calls == 2);
        REQUIRE(cache.cached_entries() == 1);
    }

    SECTION("Zero TTL disables caching") {
        CachingProvider cache(upstream, 0, 0, time.clock(), time.sleeper());

        cache.get_snapshot("ACME");
        cache.get_snapshot("ACME");
        REQUIRE(upstream->snapshot_calls == 2);
    }

    SECTION("clear() drops every entry") {
        CachingProvider cache(upstream, 300, 0, time.clock(), time.sleeper());

        cache.get_snapshot("ACME");
        cache.clear();
        cache.get_snapshot("ACME");
        REQUIRE(upstream->snapshot_calls == 2);
    }
}

TEST_CASE("Provider rate limiting", "[cache]") {
    auto upstream = std::make_shared<CountingProvider>();
    FakeTime time;
    CachingProvider cache(upstream, 300, 200, time.clock(), time.sleeper());

    SECTION("Back-to-back calls are spaced by the minimum interval") {
        cache.get_snapshot("ACME");
        REQUIRE(time.sleeps.empty());

        cache.get_snapshot("OTHER");
        REQUIRE(time.sleeps.size() == 1);
        REQUIRE(time.sleeps[0] == std::chrono::milliseconds(200));

        time.now += std::chrono::milliseconds(150);
        cache.get_snapshot("THIRD");
        REQUIRE(time.sleeps.size() == 2);
        REQUIRE(time.sleeps[1] == std::chrono::milliseconds(50));
    }

    SECTION("Cache hits do not wait") {
        cache.get_snapshot("ACME");
        cache.get_snapshot("ACME");
        cache.get_snapshot("ACME");
        REQUIRE(time.sleeps.empty());
    }

    SECTION("Calls far enough apart do not wait") {
        cache.get_snapshot("ACME");
        time.now += std::chrono::seconds(1);
        cache.get_snapshot("OTHER");
        REQUIRE(time.sleeps.empty());
    }
}
