#include "earnings_quality.hpp"
#include "line_items.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {

std::vector<double> head(const std::vector<double>& values, size_t n) {
    return std::vector<double>(values.begin(), values.begin() + std::min(n, values.size()));
}

} // namespace

EarningsQualityResult EarningsQualityAnalyzer::analyze(const std::string& symbol,
                                                       const Statements& statements) {
    if (statements.income.empty()) {
        EarningsQualityResult result;
        result.symbol = symbol;
        result.error = "No financial data available";
        return result;
    }

    return analyze_series(symbol,
                          statements.income.series(line_items::NET_INCOME),
                          statements.cashflow.series(line_items::OPERATING_CASH_FLOW),
                          statements.income.series(line_items::TOTAL_REVENUE));
}

EarningsQualityResult EarningsQualityAnalyzer::analyze_series(const std::string& symbol,
                                                              const std::vector<double>& ni,
                                                              const std::vector<double>& ocf,
                                                              const std::vector<double>& revenue) {
    EarningsQualityResult result;
    result.symbol = symbol;

    if (ni.size() >= 3 && ocf.size() >= 3) {
        double avg_ocf = util::mean(head(ocf, 3));
        double avg_ni = util::mean(head(ni, 3));
        if (avg_ni != 0.0) {
            result.accruals_quality = avg_ocf / avg_ni;
        }
    }

    if (ni.size() >= 4) {
        std::vector<double> newer(ni.begin(), ni.end() - 1);
        std::vector<double> older(ni.begin() + 1, ni.end());
        result.earnings_persistence = util::pearson(newer, older);

        double m = util::mean(ni);
        if (m != 0.0) {
            result.earnings_predictability = 1.0 / (1.0 + util::population_stdev(ni) / std::abs(m));
        } else {
            result.earnings_predictability = 0.0;
        }
    }

    if (!ocf.empty() && !ni.empty() && ni[0] != 0.0) {
        result.cash_flow_quality = ocf[0] / ni[0];
    }

    result.net_income_series = head(ni, 5);
    result.ocf_series = head(ocf, 5);
    result.revenue_series = head(revenue, 5);

    spdlog::debug("Earnings quality {}: accruals={} persistence={} ({} NI periods)",
                  symbol,
                  result.accruals_quality.value_or(-1.0),
                  result.earnings_persistence.value_or(-1.0),
                  ni.size());

    return result;
}

EarningsBand EarningsQualityAnalyzer::accruals_band(const std::optional<double>& aq) {
    EarningsBand band;
    if (!aq) return band;

    if (*aq > 1.2) {
        band.points = 15;
        band.reason = "Excellent accruals quality (OCF > 120% of NI)";
    } else if (*aq > 0.8) {
        band.points = 10;
        band.reason = "Good accruals quality (OCF > 80% of NI)";
    } else if (*aq > 0.5) {
        band.points = 5;
        band.reason = "Moderate accruals quality";
    }
    return band;
}

EarningsBand EarningsQualityAnalyzer::persistence_band(const std::optional<double>& p) {
    EarningsBand band;
    if (!p) return band;

    if (*p > 0.7) {
        band.points = 10;
        band.reason = "High earnings persistence";
    } else if (*p > 0.5) {
        band.points = 7;
        band.reason = "Moderate earnings persistence";
    } else if (*p > 0.3) {
        band.points = 3;
        band.reason = "Low earnings persistence";
    }
    return band;
}
