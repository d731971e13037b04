#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/fundamentals.hpp"
#include <algorithm>
#include <cmath>

using Catch::Approx;

namespace {

bool has_reason(const std::vector<std::string>& reasons, const std::string& reason) {
    return std::find(reasons.begin(), reasons.end(), reason) != reasons.end();
}

std::vector<std::optional<double>> row(std::initializer_list<double> values) {
    return std::vector<std::optional<double>>(values.begin(), values.end());
}

} // namespace

TEST_CASE("Fundamental scoring bands", "[fundamentals]") {
    FundamentalRatios ratios;
    ratios.debt_to_equity = 0.5;
    ratios.net_margin = 0.12;
    ratios.ebitda_margin = 0.10;
    ratios.roe = 0.10;
    ratios.revenue_cagr = 0.05;

    SECTION("Margin, leverage and growth pass; EBITDA margin and ROE miss") {
        auto s = FundamentalCalculator::score(ratios);
        REQUIRE(s.score == 45);
        REQUIRE(has_reason(s.reasons, "Positive revenue CAGR"));
        REQUIRE(has_reason(s.reasons, "Healthy net margin > 10%"));
        REQUIRE(has_reason(s.reasons, "Debt/Equity < 1"));
        REQUIRE_FALSE(has_reason(s.reasons, "EBITDA margin > 15%"));
        REQUIRE_FALSE(has_reason(s.reasons, "ROE > 15%"));
    }

    SECTION("Positive free cash flow adds 15") {
        ratios.free_cash_flow = 500000.0;
        auto s = FundamentalCalculator::score(ratios);
        REQUIRE(s.score == 60);
        REQUIRE(has_reason(s.reasons, "Positive free cash flow"));
        REQUIRE(s.reasons.size() == 4);
    }

    SECTION("Every condition met gives 85") {
        ratios.ebitda_margin = 0.20;
        ratios.roe = 0.20;
        ratios.free_cash_flow = 1.0;
        REQUIRE(FundamentalCalculator::score(ratios).score == 85);
    }

    SECTION("Nothing defined gives 0 and no reasons") {
        auto s = FundamentalCalculator::score(FundamentalRatios{});
        REQUIRE(s.score == 0);
        REQUIRE(s.reasons.empty());
    }
}

TEST_CASE("Fundamental penalties never drive the score below zero", "[fundamentals]") {
    FundamentalRatios ratios;
    ratios.revenue_cagr = -0.10;
    ratios.net_margin = -0.20;
    ratios.debt_to_equity = 3.0;

    auto s = FundamentalCalculator::score(ratios);
    REQUIRE(s.score == 0);
    REQUIRE(has_reason(s.reasons, "Negative revenue CAGR"));
    REQUIRE(has_reason(s.reasons, "Thin net margin < 5%"));
    REQUIRE(has_reason(s.reasons, "High leverage: D/E > 2"));

    SECTION("Penalties subtract from earned points") {
        ratios.roe = 0.30;          // +15
        ratios.free_cash_flow = 10; // +15
        REQUIRE(FundamentalCalculator::score(ratios).score == 0);

        ratios.ebitda_margin = 0.5; // +10 -> 40 - 30
        REQUIRE(FundamentalCalculator::score(ratios).score == 10);
    }

    SECTION("Floor holds across a grid of bad inputs") {
        for (double cagr : {-0.5, -0.01, 0.0}) {
            for (double margin : {-1.0, 0.0, 0.04}) {
                for (double de : {2.5, 10.0}) {
                    FundamentalRatios r;
                    r.revenue_cagr = cagr;
                    r.net_margin = margin;
                    r.debt_to_equity = de;
                    REQUIRE(FundamentalCalculator::score(r).score >= 0);
                }
            }
        }
    }
}

TEST_CASE("Revenue CAGR", "[fundamentals]") {
    SECTION("Three periods of 10% growth") {
        auto cagr = FundamentalCalculator::revenue_cagr({133.1, 121.0, 110.0, 100.0});
        REQUIRE(cagr.value() == Approx(0.10));
    }

    SECTION("Uses at most three periods") {
        auto cagr = FundamentalCalculator::revenue_cagr({133.1, 121.0, 110.0, 100.0, 1.0});
        REQUIRE(cagr.value() == Approx(0.10));
    }

    SECTION("Two periods of history over three values") {
        auto cagr = FundamentalCalculator::revenue_cagr({121.0, 110.0, 100.0});
        REQUIRE(cagr.value() == Approx(0.10));
    }

    SECTION("Undefined for short or non-positive history") {
        REQUIRE_FALSE(FundamentalCalculator::revenue_cagr({110.0, 100.0}).has_value());
        REQUIRE_FALSE(FundamentalCalculator::revenue_cagr({110.0, 100.0, 0.0}).has_value());
        REQUIRE_FALSE(FundamentalCalculator::revenue_cagr({110.0, 100.0, -5.0}).has_value());
        REQUIRE_FALSE(FundamentalCalculator::revenue_cagr({0.0, 100.0, 90.0}).has_value());
    }
}

TEST_CASE("Fundamental analysis from statements", "[fundamentals]") {
    Statements st;
    st.income.rows["Total Revenue"] = row({1000.0, 900.0, 800.0, 700.0});
    st.income.rows["Net Income"] = row({120.0, 100.0, 90.0, 80.0});
    st.income.rows["Ebitda"] = row({200.0, 180.0, 160.0, 150.0});
    st.balance.rows["Total Debt"] = row({300.0, 320.0});
    st.balance.rows["Total Stockholder Equity"] = row({600.0, 550.0});
    st.balance.rows["Total Assets"] = row({1500.0});
    st.balance.rows["Total Liab"] = row({900.0});
    st.cashflow.rows["Total Cash From Operating Activities"] = row({150.0, 95.0});
    st.cashflow.rows["Capital Expenditures"] = row({-50.0, -40.0});

    Snapshot snap;
    snap.current_price = 250.0;
    snap.trailing_pe = 18.5;
    snap.market_cap = 2.5e9;

    SECTION("Ratios from the latest period") {
        auto r = FundamentalCalculator::analyze("ACME", st, snap);

        REQUIRE_FALSE(r.error.has_value());
        REQUIRE(r.ratios.debt_to_equity.value() == Approx(0.5));
        REQUIRE(r.ratios.net_margin.value() == Approx(0.12));
        REQUIRE(r.ratios.ebitda_margin.value() == Approx(0.20));
        REQUIRE(r.ratios.roe.value() == Approx(0.20));
        REQUIRE(r.ratios.revenue_cagr.value() == Approx(std::pow(1000.0 / 700.0, 1.0 / 3.0) - 1.0));
        REQUIRE(r.ratios.free_cash_flow.value() == Approx(100.0));

        REQUIRE(r.operating_cash_flow.value() == Approx(150.0));
        REQUIRE(r.total_assets.value() == Approx(1500.0));
        REQUIRE(r.total_liabilities.value() == Approx(900.0));
        REQUIRE(r.pe.value() == Approx(18.5));
        REQUIRE(r.current_price.value() == Approx(250.0));
        REQUIRE(r.score == 85);
    }

    SECTION("Null cells are skipped to the latest reported value") {
        st.balance.rows["Total Debt"] = {std::nullopt, 300.0};
        auto r = FundamentalCalculator::analyze("ACME", st, snap);
        REQUIRE(r.ratios.debt_to_equity.value() == Approx(0.5));
    }

    SECTION("Zero equity leaves D/E and ROE undefined") {
        st.balance.rows["Total Stockholder Equity"] = row({0.0});
        auto r = FundamentalCalculator::analyze("ACME", st, snap);
        REQUIRE_FALSE(r.ratios.debt_to_equity.has_value());
        REQUIRE_FALSE(r.ratios.roe.has_value());
    }

    SECTION("Operating cash flow falls back to the snapshot") {
        st.cashflow.rows.clear();
        snap.operating_cashflow = 80.0;
        auto r = FundamentalCalculator::analyze("ACME", st, snap);
        REQUIRE(r.operating_cash_flow.value() == Approx(80.0));
        REQUIRE_FALSE(r.ratios.free_cash_flow.has_value());
    }

    SECTION("Reported free cash flow wins over OCF + capex") {
        st.cashflow.rows["Free Cash Flow"] = row({42.0});
        auto r = FundamentalCalculator::analyze("ACME", st, snap);
        REQUIRE(r.ratios.free_cash_flow.value() == Approx(42.0));
    }

    SECTION("Empty statements give an all-undefined, zero result") {
        auto r = FundamentalCalculator::analyze("ACME", Statements{}, Snapshot{});
        REQUIRE_FALSE(r.ratios.net_margin.has_value());
        REQUIRE_FALSE(r.ratios.revenue_cagr.has_value());
        REQUIRE(r.score == 0);
    }
}
