#pragma once

#include "market_data.hpp"
#include <optional>
#include <string>
#include <vector>

struct FundamentalRatios {
    std::optional<double> debt_to_equity;
    std::optional<double> net_margin;
    std::optional<double> ebitda_margin;
    std::optional<double> roe;
    std::optional<double> revenue_cagr;
    std::optional<double> free_cash_flow;
};

struct FundamentalResult {
    std::string symbol;

    FundamentalRatios ratios;

    std::optional<double> operating_cash_flow;
    std::optional<double> total_assets;
    std::optional<double> total_liabilities;

    std::optional<double> current_price;
    std::optional<double> market_cap;
    std::optional<double> pe;

    int score = 0;  // 0-100 before composite rescaling
    std::vector<std::string> reasons;

    std::optional<std::string> error;
};

struct FundamentalScore {
    int score;
    std::vector<std::string> reasons;
};

class FundamentalCalculator {
public:
    static FundamentalResult analyze(const std::string& symbol,
                                     const Statements& statements,
                                     const Snapshot& snapshot);

    // Banded heuristic over already-extracted ratios; never below 0
    static FundamentalScore score(const FundamentalRatios& ratios);

    // (latest/oldest)^(1/n) - 1 over n = min(3, len-1) periods; needs 3 periods
    static std::optional<double> revenue_cagr(const std::vector<double>& revenue);

private:
    static std::optional<double> safe_ratio(const std::optional<double>& num,
                                            const std::optional<double>& den);
};
