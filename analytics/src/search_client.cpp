#include "search_client.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

HttpSearchClient::HttpSearchClient(const std::string& base_url, const std::string& api_key, int timeout_ms)
    : base_url_(base_url)
    , api_key_(api_key)
    , http_(timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::vector<SearchHit> HttpSearchClient::parse_results(const nlohmann::json& body) {
    std::vector<SearchHit> hits;
    if (!body.contains("results") || !body["results"].is_array()) {
        return hits;
    }

    for (const auto& item : body["results"]) {
        if (!item.is_object()) continue;

        SearchHit hit;
        hit.title = item.value("title", "");
        hit.url = item.value("url", item.value("href", ""));
        hit.snippet = item.value("content", item.value("snippet", ""));
        hits.push_back(std::move(hit));
    }

    return hits;
}

std::optional<std::string> HttpSearchClient::unavailable_reason() const {
    if (api_key_.empty()) return std::string("SEARCH_API_KEY is not set");
    return std::nullopt;
}

std::vector<SearchHit> HttpSearchClient::search(const std::string& query, int max_results) {
    if (auto reason = unavailable_reason()) {
        throw std::runtime_error(*reason);
    }

    nlohmann::json request = {
        {"api_key", api_key_},
        {"query", query},
        {"max_results", max_results}
    };

    auto body = http_.post_json(base_url_ + "/search", request);
    if (!body) {
        throw std::runtime_error(http_.last_error());
    }

    return parse_results(*body);
}

BackoffSearch::BackoffSearch(std::shared_ptr<SearchClient> client,
                             int max_results,
                             Sleeper sleeper,
                             std::vector<std::chrono::milliseconds> delays)
    : client_(std::move(client))
    , max_results_(max_results)
    , sleeper_(std::move(sleeper))
    , delays_(std::move(delays))
{
    if (!client_) {
        throw std::invalid_argument("BackoffSearch requires a search client");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::string BackoffSearch::format_results(const std::vector<SearchHit>& hits, size_t limit) {
    std::string out;
    for (size_t i = 0; i < hits.size() && i < limit; i++) {
        if (!out.empty()) out += "\n\n";
        out += hits[i].title + " - " + hits[i].url + "\n" + hits[i].snippet;
    }
    return out.empty() ? "No results found." : out;
}

std::string BackoffSearch::run(const std::string& query) {
    if (auto reason = client_->unavailable_reason()) {
        spdlog::warn("Search for '{}' skipped: {}", query, *reason);
        return "Search temporarily unavailable: " + *reason;
    }

    std::string last_error = "no attempts made";

    for (const auto& delay : delays_) {
        sleeper_(delay);
        try {
            auto hits = client_->search(query, max_results_);
            return format_results(hits);
        } catch (const std::exception& e) {
            last_error = e.what();
            spdlog::warn("Search attempt for '{}' failed: {}", query, last_error);
        }
    }

    return "Search temporarily unavailable: " + last_error;
}
