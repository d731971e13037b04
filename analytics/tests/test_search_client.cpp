#include <catch2/catch_test_macros.hpp>
#include "../src/search_client.hpp"
#include <deque>
#include <optional>
#include <stdexcept>

namespace {

// Replays scripted outcomes; an empty error string means success
class ScriptedSearchClient : public SearchClient {
public:
    std::deque<std::string> errors;
    std::vector<SearchHit> hits;
    std::optional<std::string> unavailable;
    int calls = 0;

    std::optional<std::string> unavailable_reason() const override { return unavailable; }

    std::vector<SearchHit> search(const std::string&, int) override {
        calls++;
        if (!errors.empty()) {
            std::string error = errors.front();
            errors.pop_front();
            if (!error.empty()) throw std::runtime_error(error);
        }
        return hits;
    }
};

std::vector<SearchHit> sample_hits() {
    return {
        {"Acme beats estimates", "https://news.example/acme-q3", "Quarterly revenue rose 12%."},
        {"Acme guidance", "https://news.example/acme-guidance", "Full-year outlook raised."},
        {"Acme dividend", "https://news.example/acme-dividend", "Board declares interim dividend."},
        {"Acme analyst day", "https://news.example/acme-day", "Fourth hit is not shown."}
    };
}

} // namespace

TEST_CASE("Backoff search", "[search]") {
    auto client = std::make_shared<ScriptedSearchClient>();
    std::vector<std::chrono::milliseconds> sleeps;
    BackoffSearch search(client, 3, [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });

    SECTION("First attempt succeeds after the first delay") {
        client->hits = sample_hits();
        auto text = search.run("acme news");

        REQUIRE(client->calls == 1);
        REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(800)});
        REQUIRE(text.find("Acme beats estimates - https://news.example/acme-q3\nQuarterly revenue rose 12%.") == 0);
        REQUIRE(text.find("Acme dividend") != std::string::npos);
        REQUIRE(text.find("Fourth hit") == std::string::npos);
    }

    SECTION("Retries once after a failure") {
        client->errors = {"rate limited", ""};
        client->hits = sample_hits();
        auto text = search.run("acme news");

        REQUIRE(client->calls == 2);
        REQUIRE(sleeps.size() == 2);
        REQUIRE(sleeps[1] == std::chrono::milliseconds(1600));
        REQUIRE(text.find("Acme beats estimates") == 0);
    }

    SECTION("Gives up after two failures") {
        client->errors = {"rate limited", "HTTP status 429"};
        auto text = search.run("acme news");

        REQUIRE(client->calls == 2);
        REQUIRE(text == "Search temporarily unavailable: HTTP status 429");
    }

    SECTION("Unavailable client fails without waiting") {
        client->unavailable = "SEARCH_API_KEY is not set";
        auto text = search.run("acme news");

        REQUIRE(text == "Search temporarily unavailable: SEARCH_API_KEY is not set");
        REQUIRE(client->calls == 0);
        REQUIRE(sleeps.empty());
    }

    SECTION("Empty result set") {
        REQUIRE(search.run("nothing matches") == "No results found.");
        REQUIRE(client->calls == 1);
    }
}

TEST_CASE("Search result formatting", "[search]") {
    SECTION("Blocks are separated by a blank line") {
        std::vector<SearchHit> hits = {{"A", "u1", "s1"}, {"B", "u2", "s2"}};
        REQUIRE(BackoffSearch::format_results(hits) == "A - u1\ns1\n\nB - u2\ns2");
    }

    SECTION("Limit applies") {
        REQUIRE(BackoffSearch::format_results(sample_hits(), 1) ==
                "Acme beats estimates - https://news.example/acme-q3\nQuarterly revenue rose 12%.");
    }

    SECTION("Nothing to format") {
        REQUIRE(BackoffSearch::format_results({}) == "No results found.");
    }
}

TEST_CASE("Search API response parsing", "[search]") {
    nlohmann::json body = {
        {"query", "acme"},
        {"results", {
            {{"title", "Acme"}, {"url", "https://acme.example"}, {"content", "Widgets."}, {"score", 0.9}},
            {{"title", "Legacy"}, {"href", "https://legacy.example"}, {"snippet", "Old shape."}}
        }}
    };

    auto hits = HttpSearchClient::parse_results(body);
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].url == "https://acme.example");
    REQUIRE(hits[0].snippet == "Widgets.");
    REQUIRE(hits[1].url == "https://legacy.example");
    REQUIRE(hits[1].snippet == "Old shape.");

    REQUIRE(HttpSearchClient::parse_results(nlohmann::json::object()).empty());
}

TEST_CASE("Search client without an API key", "[search]") {
    auto client = std::make_shared<HttpSearchClient>("https://api.search.example", "");
    REQUIRE(client->unavailable_reason() == std::optional<std::string>("SEARCH_API_KEY is not set"));
    REQUIRE_THROWS_AS(client->search("acme", 3), std::runtime_error);

    std::vector<std::chrono::milliseconds> sleeps;
    BackoffSearch search(client, 3, [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });
    REQUIRE(search.run("acme") == "Search temporarily unavailable: SEARCH_API_KEY is not set");
    REQUIRE(sleeps.empty());
}
