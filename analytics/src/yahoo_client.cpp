#include "yahoo_client.hpp"
#include "normalize.hpp"
#include <spdlog/spdlog.h>

namespace {

const char* SNAPSHOT_MODULES = "price,summaryDetail,financialData,defaultKeyStatistics,assetProfile";
const char* STATEMENT_MODULES = "incomeStatementHistory,balanceSheetHistory,cashflowStatementHistory";

} // namespace

YahooClient::YahooClient(const std::string& base_url, int timeout_ms, const std::string& user_agent)
    : base_url_(base_url)
    , http_(timeout_ms, user_agent)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

template <typename T>
FetchResult<T> YahooClient::request_failed(const std::string& what, const std::string& symbol) {
    if (http_.last_status() == 404) {
        spdlog::debug("{} for {}: symbol not found", what, symbol);
        return FetchResult<T>::no_data("symbol not found: " + symbol);
    }
    spdlog::warn("{} for {} failed: {}", what, symbol, http_.last_error());
    return FetchResult<T>::failure(what + " failed: " + http_.last_error());
}

FetchResult<PriceSeries> YahooClient::get_price_history(const std::string& symbol,
                                                        const std::string& lookback) {
    std::string url = base_url_ + "/v8/finance/chart/" + http_.escape(symbol)
                    + "?range=" + http_.escape(lookback) + "&interval=1d";

    auto body = http_.get_json(url);
    if (!body) {
        return request_failed<PriceSeries>("price history", symbol);
    }

    auto result = Normalizer::normalize_chart(*body);
    spdlog::debug("Price history {} ({}): {} closes, status {}",
                  symbol, lookback, result.data.size(), fetch_status_string(result.status));
    return result;
}

std::optional<nlohmann::json> YahooClient::quote_summary(const std::string& symbol,
                                                         const std::string& modules) {
    std::string url = base_url_ + "/v10/finance/quoteSummary/" + http_.escape(symbol)
                    + "?modules=" + http_.escape(modules);
    return http_.get_json(url);
}

FetchResult<Statements> YahooClient::get_statements(const std::string& symbol) {
    auto body = quote_summary(symbol, STATEMENT_MODULES);
    if (!body) {
        return request_failed<Statements>("financial statements", symbol);
    }
    return Normalizer::normalize_statements(*body);
}

FetchResult<Snapshot> YahooClient::get_snapshot(const std::string& symbol) {
    auto body = quote_summary(symbol, SNAPSHOT_MODULES);
    if (!body) {
        return request_failed<Snapshot>("snapshot", symbol);
    }
    return Normalizer::normalize_snapshot(*body);
}
