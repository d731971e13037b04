#include "fundamentals.hpp"
#include "line_items.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

std::optional<double> FundamentalCalculator::safe_ratio(const std::optional<double>& num,
                                                        const std::optional<double>& den) {
    if (!num || !den || *den == 0.0) return std::nullopt;
    return *num / *den;
}

std::optional<double> FundamentalCalculator::revenue_cagr(const std::vector<double>& revenue) {
    if (revenue.size() < 3) return std::nullopt;

    size_t periods = std::min<size_t>(3, revenue.size() - 1);
    double latest = revenue[0];
    double oldest = revenue[periods];

    if (oldest <= 0.0 || latest == 0.0) return std::nullopt;

    double cagr = std::pow(latest / oldest, 1.0 / periods) - 1.0;
    if (!std::isfinite(cagr)) return std::nullopt;

    return cagr;
}

FundamentalResult FundamentalCalculator::analyze(const std::string& symbol,
                                                 const Statements& statements,
                                                 const Snapshot& snapshot) {
    FundamentalResult result;
    result.symbol = symbol;

    const auto& bal = statements.balance;
    const auto& fin = statements.income;
    const auto& cfs = statements.cashflow;

    auto total_debt = bal.latest(line_items::TOTAL_DEBT);
    auto total_equity = bal.latest(line_items::TOTAL_EQUITY);
    result.total_assets = bal.latest(line_items::TOTAL_ASSETS);
    result.total_liabilities = bal.latest(line_items::TOTAL_LIABILITIES);

    auto revenue = fin.series(line_items::TOTAL_REVENUE);
    auto net_income = fin.series(line_items::NET_INCOME);
    auto ebitda = fin.series(line_items::EBITDA);

    std::optional<double> revenue_latest;
    std::optional<double> net_income_latest;
    std::optional<double> ebitda_latest;
    if (!revenue.empty()) revenue_latest = revenue[0];
    if (!net_income.empty()) net_income_latest = net_income[0];
    if (!ebitda.empty()) ebitda_latest = ebitda[0];

    result.operating_cash_flow = cfs.latest(line_items::OPERATING_CASH_FLOW);
    if (!result.operating_cash_flow) {
        result.operating_cash_flow = snapshot.operating_cashflow;
    }

    // Capex is reported negative, so FCF = OCF + capex
    auto capex = cfs.latest(line_items::CAPITAL_EXPENDITURE);
    auto fcf = cfs.latest(line_items::FREE_CASH_FLOW);
    if (!fcf && result.operating_cash_flow && capex) {
        fcf = *result.operating_cash_flow + *capex;
    }

    auto& ratios = result.ratios;
    ratios.debt_to_equity = safe_ratio(total_debt, total_equity);
    ratios.net_margin = safe_ratio(net_income_latest, revenue_latest);
    ratios.ebitda_margin = safe_ratio(ebitda_latest, revenue_latest);
    ratios.roe = safe_ratio(net_income_latest, total_equity);
    ratios.revenue_cagr = revenue_cagr(revenue);
    ratios.free_cash_flow = fcf;

    result.pe = snapshot.trailing_pe;
    result.market_cap = snapshot.market_cap ? snapshot.market_cap : snapshot.enterprise_value;
    result.current_price = snapshot.current_price;

    auto s = score(ratios);
    result.score = s.score;
    result.reasons = std::move(s.reasons);

    spdlog::debug("Fundamentals {}: score={} d/e={} margin={}",
                  symbol, result.score,
                  ratios.debt_to_equity.value_or(-1.0),
                  ratios.net_margin.value_or(-1.0));

    return result;
}

FundamentalScore FundamentalCalculator::score(const FundamentalRatios& r) {
    FundamentalScore out{0, {}};

    auto add_points = [&out](bool condition, int points, const char* reason) {
        if (condition) {
            out.score += points;
            out.reasons.push_back(reason);
        }
    };

    add_points(r.revenue_cagr && *r.revenue_cagr > 0.0, 15, "Positive revenue CAGR");
    add_points(r.net_margin && *r.net_margin > 0.10, 15, "Healthy net margin > 10%");
    add_points(r.ebitda_margin && *r.ebitda_margin > 0.15, 10, "EBITDA margin > 15%");
    add_points(r.roe && *r.roe > 0.15, 15, "ROE > 15%");
    add_points(r.free_cash_flow && *r.free_cash_flow > 0, 15, "Positive free cash flow");
    add_points(r.debt_to_equity && *r.debt_to_equity < 1.0, 15, "Debt/Equity < 1");

    // Penalties, each floored at 0
    if (r.revenue_cagr && *r.revenue_cagr < 0) {
        out.reasons.push_back("Negative revenue CAGR");
        out.score = std::max(0, out.score - 10);
    }
    if (r.net_margin && *r.net_margin < 0.05) {
        out.reasons.push_back("Thin net margin < 5%");
        out.score = std::max(0, out.score - 10);
    }
    if (r.debt_to_equity && *r.debt_to_equity > 2.0) {
        out.reasons.push_back("High leverage: D/E > 2");
        out.score = std::max(0, out.score - 10);
    }

    return out;
}
