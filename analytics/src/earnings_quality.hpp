#pragma once

#include "market_data.hpp"
#include <optional>
#include <string>
#include <vector>

struct EarningsQualityResult {
    std::string symbol;

    std::optional<double> accruals_quality;        // mean OCF / mean NI over 3 periods
    std::optional<double> earnings_persistence;    // lag-1 correlation of NI
    std::optional<double> earnings_predictability; // 1 / (1 + CV of NI)
    std::optional<double> cash_flow_quality;       // latest OCF / latest NI

    // First five periods of each input series, latest first
    std::vector<double> net_income_series;
    std::vector<double> ocf_series;
    std::vector<double> revenue_series;

    std::optional<std::string> error;
};

// Banded contribution of one metric to the composite earnings score
struct EarningsBand {
    int points = 0;
    std::optional<std::string> reason;
};

class EarningsQualityAnalyzer {
public:
    static EarningsQualityResult analyze(const std::string& symbol, const Statements& statements);

    // Pure series form used by analyze()
    static EarningsQualityResult analyze_series(const std::string& symbol,
                                                const std::vector<double>& net_income,
                                                const std::vector<double>& ocf,
                                                const std::vector<double>& revenue);

    static EarningsBand accruals_band(const std::optional<double>& accruals_quality);
    static EarningsBand persistence_band(const std::optional<double>& persistence);
};
