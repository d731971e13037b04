#include "normalize.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>

namespace {

const nlohmann::json EMPTY_OBJECT = nlohmann::json::object();

const nlohmann::json& module_of(const nlohmann::json& result, const char* name) {
    if (result.contains(name) && result[name].is_object()) {
        return result[name];
    }
    return EMPTY_OBJECT;
}

std::string error_description(const nlohmann::json& error) {
    if (error.is_object()) {
        return error.value("description", error.value("code", std::string("unknown error")));
    }
    return error.dump();
}

} // namespace

std::optional<double> Normalizer::number(const nlohmann::json& node, const char* key) {
    if (!node.is_object() || !node.contains(key)) return std::nullopt;

    const auto& v = node[key];
    if (v.is_number()) {
        double d = v.get<double>();
        if (std::isfinite(d)) return d;
        return std::nullopt;
    }
    if (v.is_object() && v.contains("raw") && v["raw"].is_number()) {
        double d = v["raw"].get<double>();
        if (std::isfinite(d)) return d;
    }
    return std::nullopt;
}

std::optional<std::string> Normalizer::text(const nlohmann::json& node, const char* key) {
    if (!node.is_object() || !node.contains(key)) return std::nullopt;

    const auto& v = node[key];
    if (v.is_string() && !v.get<std::string>().empty()) {
        return v.get<std::string>();
    }
    return std::nullopt;
}

std::string Normalizer::display_name(const std::string& camel) {
    std::string out;
    for (size_t i = 0; i < camel.size(); i++) {
        char c = camel[i];
        if (i == 0) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            continue;
        }
        if (std::isupper(static_cast<unsigned char>(c))) {
            out += ' ';
        }
        out += c;
    }
    return out;
}

FetchResult<PriceSeries> Normalizer::normalize_chart(const nlohmann::json& raw) {
    try {
        if (!raw.contains("chart")) {
            return FetchResult<PriceSeries>::failure("unexpected chart payload");
        }

        const auto& chart = raw["chart"];
        if (chart.contains("error") && !chart["error"].is_null()) {
            return FetchResult<PriceSeries>::no_data(error_description(chart["error"]));
        }
        if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
            return FetchResult<PriceSeries>::no_data("No historical data available");
        }

        const auto& result = chart["result"][0];
        if (!result.contains("indicators") || !result["indicators"].contains("quote")
            || result["indicators"]["quote"].empty()) {
            return FetchResult<PriceSeries>::no_data("No historical data available");
        }

        const auto& quote = result["indicators"]["quote"][0];
        if (!quote.contains("close") || !quote["close"].is_array()) {
            return FetchResult<PriceSeries>::no_data("No historical data available");
        }

        // Provider order is oldest first
        PriceSeries prices;
        const auto& closes = quote["close"];
        for (auto it = closes.rbegin(); it != closes.rend(); ++it) {
            if (it->is_number()) {
                prices.push_back(it->get<double>());
            }
        }

        if (prices.empty()) {
            return FetchResult<PriceSeries>::no_data("No historical data available");
        }

        return FetchResult<PriceSeries>::success(std::move(prices));

    } catch (const std::exception& e) {
        spdlog::warn("Failed to normalize chart: {}", e.what());
        return FetchResult<PriceSeries>::failure(std::string("malformed chart payload: ") + e.what());
    }
}

const nlohmann::json* Normalizer::summary_result(const nlohmann::json& raw, std::string& error) {
    if (!raw.contains("quoteSummary")) {
        error = "unexpected quoteSummary payload";
        return nullptr;
    }

    const auto& summary = raw["quoteSummary"];
    if (summary.contains("error") && !summary["error"].is_null()) {
        error = error_description(summary["error"]);
        return nullptr;
    }
    if (!summary.contains("result") || !summary["result"].is_array() || summary["result"].empty()) {
        error = "empty quoteSummary result";
        return nullptr;
    }

    return &summary["result"][0];
}

FetchResult<Snapshot> Normalizer::normalize_snapshot(const nlohmann::json& raw) {
    try {
        std::string error;
        const auto* result = summary_result(raw, error);
        if (!result) {
            if (!raw.contains("quoteSummary")) return FetchResult<Snapshot>::failure(error);
            return FetchResult<Snapshot>::no_data(error);
        }

        const auto& price = module_of(*result, "price");
        const auto& detail = module_of(*result, "summaryDetail");
        const auto& fin = module_of(*result, "financialData");
        const auto& profile = module_of(*result, "assetProfile");
        const auto& stats = module_of(*result, "defaultKeyStatistics");

        Snapshot s;
        s.symbol = text(price, "symbol");
        s.name = text(price, "shortName");
        if (!s.name) s.name = text(price, "longName");
        s.currency = text(price, "currency");
        s.sector = text(profile, "sector");
        s.industry = text(profile, "industry");

        s.current_price = number(price, "regularMarketPrice");
        if (!s.current_price) s.current_price = number(fin, "currentPrice");

        s.market_cap = number(price, "marketCap");
        if (!s.market_cap) s.market_cap = number(detail, "marketCap");
        s.enterprise_value = number(stats, "enterpriseValue");
        s.trailing_pe = number(detail, "trailingPE");
        s.trailing_eps = number(stats, "trailingEps");
        s.fifty_two_week_low = number(detail, "fiftyTwoWeekLow");
        s.fifty_two_week_high = number(detail, "fiftyTwoWeekHigh");

        s.beta = number(detail, "beta");
        if (!s.beta) s.beta = number(stats, "beta");
        s.debt_to_equity = number(fin, "debtToEquity");
        s.current_ratio = number(fin, "currentRatio");
        s.quick_ratio = number(fin, "quickRatio");
        s.employees = number(profile, "fullTimeEmployees");

        s.operating_cashflow = number(fin, "operatingCashflow");
        s.free_cashflow = number(fin, "freeCashflow");
        s.ebitda = number(fin, "ebitda");

        s.recommendation_mean = number(fin, "recommendationMean");
        s.recommendation_key = text(fin, "recommendationKey");
        s.analyst_count = number(fin, "numberOfAnalystOpinions");
        s.target_high_price = number(fin, "targetHighPrice");
        s.target_low_price = number(fin, "targetLowPrice");
        s.target_median_price = number(fin, "targetMedianPrice");

        s.volume = number(detail, "volume");
        if (!s.volume) s.volume = number(price, "regularMarketVolume");
        s.average_volume = number(detail, "averageVolume");

        s.audit_risk = number(profile, "auditRisk");
        s.board_risk = number(profile, "boardRisk");
        s.compensation_risk = number(profile, "compensationRisk");
        s.shareholder_rights_risk = number(profile, "shareHolderRightsRisk");
        s.overall_risk = number(profile, "overallRisk");

        if (!s.has_data()) {
            return FetchResult<Snapshot>::no_data("no quote data");
        }

        return FetchResult<Snapshot>::success(std::move(s));

    } catch (const std::exception& e) {
        spdlog::warn("Failed to normalize snapshot: {}", e.what());
        return FetchResult<Snapshot>::failure(std::string("malformed quoteSummary payload: ") + e.what());
    }
}

Statement Normalizer::normalize_statement(const nlohmann::json& periods) {
    Statement st;
    if (!periods.is_array()) return st;

    const size_t n = periods.size();
    for (size_t i = 0; i < n; i++) {
        const auto& period = periods[i];
        if (!period.is_object()) continue;

        for (auto it = period.begin(); it != period.end(); ++it) {
            if (it.key() == "endDate" || it.key() == "maxAge") continue;

            auto& row = st.rows[display_name(it.key())];
            if (row.size() < n) row.resize(n);
            row[i] = number(period, it.key().c_str());
        }
    }

    return st;
}

FetchResult<Statements> Normalizer::normalize_statements(const nlohmann::json& raw) {
    try {
        std::string error;
        const auto* result = summary_result(raw, error);
        if (!result) {
            if (!raw.contains("quoteSummary")) return FetchResult<Statements>::failure(error);
            return FetchResult<Statements>::no_data(error);
        }

        Statements st;

        const auto& income = module_of(*result, "incomeStatementHistory");
        if (income.contains("incomeStatementHistory")) {
            st.income = normalize_statement(income["incomeStatementHistory"]);
        }

        const auto& balance = module_of(*result, "balanceSheetHistory");
        if (balance.contains("balanceSheetStatements")) {
            st.balance = normalize_statement(balance["balanceSheetStatements"]);
        }

        const auto& cashflow = module_of(*result, "cashflowStatementHistory");
        if (cashflow.contains("cashflowStatements")) {
            st.cashflow = normalize_statement(cashflow["cashflowStatements"]);
        }

        if (st.empty()) {
            return FetchResult<Statements>::no_data("No financial data available");
        }

        return FetchResult<Statements>::success(std::move(st));

    } catch (const std::exception& e) {
        spdlog::warn("Failed to normalize statements: {}", e.what());
        return FetchResult<Statements>::failure(std::string("malformed statement payload: ") + e.what());
    }
}
