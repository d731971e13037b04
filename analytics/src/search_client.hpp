#pragma once

#include "http_client.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct SearchHit {
    std::string title;
    std::string url;
    std::string snippet;
};

class SearchClient {
public:
    virtual ~SearchClient() = default;

    // Throws std::runtime_error on transport or API failure
    virtual std::vector<SearchHit> search(const std::string& query, int max_results) = 0;

    // Set when no attempt can succeed, e.g. missing credentials
    virtual std::optional<std::string> unavailable_reason() const { return std::nullopt; }
};

// Tavily-style POST {base_url}/search
class HttpSearchClient : public SearchClient {
public:
    HttpSearchClient(const std::string& base_url, const std::string& api_key, int timeout_ms = 8000);

    std::vector<SearchHit> search(const std::string& query, int max_results) override;
    std::optional<std::string> unavailable_reason() const override;

    static std::vector<SearchHit> parse_results(const nlohmann::json& body);

private:
    std::string base_url_;
    std::string api_key_;
    HttpClient http_;
};

// Sleeps before each attempt (0.8s, then 1.6s) and never throws.
// An unavailable client fails at once, without sleeping.
class BackoffSearch {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit BackoffSearch(std::shared_ptr<SearchClient> client,
                           int max_results = 3,
                           Sleeper sleeper = nullptr,
                           std::vector<std::chrono::milliseconds> delays = {
                               std::chrono::milliseconds(800), std::chrono::milliseconds(1600)});

    // Formatted top hits, "No results found." or "Search temporarily unavailable: <error>"
    std::string run(const std::string& query);

    // "title - url\nsnippet" blocks separated by blank lines
    static std::string format_results(const std::vector<SearchHit>& hits, size_t limit = 3);

private:
    std::shared_ptr<SearchClient> client_;
    int max_results_;
    Sleeper sleeper_;
    std::vector<std::chrono::milliseconds> delays_;
};
