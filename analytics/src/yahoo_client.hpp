#pragma once

#include "market_data.hpp"
#include "http_client.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

// Yahoo Finance chart + quoteSummary endpoints
class YahooClient : public MarketDataProvider {
public:
    YahooClient(const std::string& base_url, int timeout_ms = 8000,
                const std::string& user_agent = "");

    FetchResult<PriceSeries> get_price_history(const std::string& symbol,
                                               const std::string& lookback) override;
    FetchResult<Statements> get_statements(const std::string& symbol) override;
    FetchResult<Snapshot> get_snapshot(const std::string& symbol) override;

private:
    std::string base_url_;
    HttpClient http_;

    // 404 means the symbol is unknown, anything else is a provider failure
    template <typename T>
    FetchResult<T> request_failed(const std::string& what, const std::string& symbol);

    std::optional<nlohmann::json> quote_summary(const std::string& symbol, const std::string& modules);
};
