#pragma once

#include "market_data.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

// Converts Yahoo-style chart / quoteSummary payloads into market data types
class Normalizer {
public:
    // chart.result[0].indicators.quote[0].close, null closes dropped, newest first
    static FetchResult<PriceSeries> normalize_chart(const nlohmann::json& raw);

    // quoteSummary modules: price, summaryDetail, financialData,
    // assetProfile, defaultKeyStatistics
    static FetchResult<Snapshot> normalize_snapshot(const nlohmann::json& raw);

    // quoteSummary modules: incomeStatementHistory, balanceSheetHistory,
    // cashflowStatementHistory
    static FetchResult<Statements> normalize_statements(const nlohmann::json& raw);

    // "totalCashFromOperatingActivities" -> "Total Cash From Operating Activities"
    static std::string display_name(const std::string& camel);

    // Accepts bare numbers and {"raw": x} wrappers
    static std::optional<double> number(const nlohmann::json& node, const char* key);
    static std::optional<std::string> text(const nlohmann::json& node, const char* key);

private:
    static const nlohmann::json* summary_result(const nlohmann::json& raw, std::string& error);
    static Statement normalize_statement(const nlohmann::json& periods);
};
