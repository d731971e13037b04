#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/indicators.hpp"

using Catch::Approx;

namespace {

// Builds a newest-first series from oldest-first values
PriceSeries newest_first(std::vector<double> chronological) {
    return PriceSeries(chronological.rbegin(), chronological.rend());
}

PriceSeries linear(size_t n, double start, double step) {
    std::vector<double> values;
    for (size_t i = 0; i < n; i++) {
        values.push_back(start + step * static_cast<double>(i));
    }
    return newest_first(values);
}

} // namespace

TEST_CASE("RSI", "[indicators]") {
    SECTION("Strictly rising series gives 100") {
        REQUIRE(Indicators::rsi(linear(15, 100.0, 1.0)).value() == Approx(100.0));
        REQUIRE(Indicators::rsi(linear(60, 10.0, 0.5)).value() == Approx(100.0));
    }

    SECTION("Strictly falling series gives 0") {
        REQUIRE(Indicators::rsi(linear(15, 100.0, -1.0)).value() == Approx(0.0));
        REQUIRE(Indicators::rsi(linear(80, 500.0, -2.0)).value() == Approx(0.0));
    }

    SECTION("Undefined below period + 1 prices") {
        REQUIRE_FALSE(Indicators::rsi(linear(14, 100.0, 1.0)).has_value());
        REQUIRE_FALSE(Indicators::rsi(PriceSeries{}).has_value());
        REQUIRE(Indicators::rsi(linear(15, 100.0, 1.0)).has_value());
    }

    SECTION("Equal gains and losses give 50") {
        std::vector<double> zigzag;
        for (int i = 0; i < 15; i++) {
            zigzag.push_back(i % 2 == 0 ? 100.0 : 101.0);
        }
        REQUIRE(Indicators::rsi(newest_first(zigzag)).value() == Approx(50.0));
    }

    SECTION("Stays within 0-100") {
        PriceSeries mixed = newest_first({44.3, 44.1, 44.2, 43.6, 44.3, 44.8, 45.1, 45.4,
                                          45.8, 46.1, 45.9, 46.2, 45.6, 46.3, 46.3, 46.0});
        auto rsi = Indicators::rsi(mixed);
        REQUIRE(rsi.has_value());
        REQUIRE(*rsi > 0.0);
        REQUIRE(*rsi < 100.0);
    }
}

TEST_CASE("EMA and MACD", "[indicators]") {
    SECTION("EMA weights the newest value most") {
        REQUIRE(Indicators::ema({5.0}, 3).value() == Approx(5.0));
        // alpha = 0.5: (2 * 1 + 1 * 0.5) / 1.5
        REQUIRE(Indicators::ema({1.0, 2.0}, 3).value() == Approx(2.5 / 1.5));
        REQUIRE_FALSE(Indicators::ema({}, 3).has_value());
    }

    SECTION("MACD line undefined below the slow window") {
        auto macd = Indicators::macd(linear(25, 100.0, 1.0));
        REQUIRE_FALSE(macd.line.has_value());
        REQUIRE_FALSE(macd.signal.has_value());
    }

    SECTION("Signal needs enough sliding windows") {
        auto short_macd = Indicators::macd(linear(26, 100.0, 1.0));
        REQUIRE(short_macd.line.has_value());
        REQUIRE_FALSE(short_macd.signal.has_value());

        auto full_macd = Indicators::macd(linear(34, 100.0, 1.0));
        REQUIRE(full_macd.line.has_value());
        REQUIRE(full_macd.signal.has_value());
    }

    SECTION("Flat prices give a zero MACD") {
        PriceSeries flat(40, 250.0);
        auto macd = Indicators::macd(flat);
        REQUIRE(macd.line.value() == Approx(0.0).margin(1e-9));
        REQUIRE(macd.signal.value() == Approx(0.0).margin(1e-9));
    }

    SECTION("Rising prices give a positive MACD line") {
        auto macd = Indicators::macd(linear(60, 100.0, 1.0));
        REQUIRE(*macd.line > 0.0);
    }
}

TEST_CASE("Momentum", "[indicators]") {
    SECTION("Undefined without enough history") {
        REQUIRE_FALSE(Indicators::momentum(linear(62, 100.0, 1.0), Indicators::MOMENTUM_3M_INDEX).has_value());
        REQUIRE(Indicators::momentum(linear(63, 100.0, 1.0), Indicators::MOMENTUM_3M_INDEX).has_value());
        REQUIRE_FALSE(Indicators::momentum(linear(251, 100.0, 1.0), Indicators::MOMENTUM_12M_INDEX).has_value());
    }

    SECTION("Return relative to the lookback price") {
        PriceSeries prices(63, 100.0);
        prices[0] = 110.0;
        REQUIRE(Indicators::momentum(prices, Indicators::MOMENTUM_3M_INDEX).value() == Approx(0.10));
    }

    SECTION("Zero base price gives 0") {
        PriceSeries prices(63, 5.0);
        prices[62] = 0.0;
        REQUIRE(Indicators::momentum(prices, Indicators::MOMENTUM_3M_INDEX).value() == 0.0);
    }
}

TEST_CASE("Technical analysis", "[indicators][technical]") {
    SECTION("Seven point series leaves every indicator undefined") {
        PriceSeries prices = {100, 102, 101, 105, 107, 106, 110};
        auto result = TechnicalAnalyzer::analyze("TEST", prices);

        REQUIRE_FALSE(result.error.has_value());
        REQUIRE_FALSE(result.rsi.has_value());
        REQUIRE_FALSE(result.macd_line.has_value());
        REQUIRE_FALSE(result.macd_signal.has_value());
        REQUIRE_FALSE(result.price_3m_momentum.has_value());
        REQUIRE_FALSE(result.price_12m_momentum.has_value());
        REQUIRE_FALSE(result.relative_strength.has_value());
        REQUIRE(result.technical_score == 0);
        REQUIRE(result.reasons.empty());

        REQUIRE(result.current_price.value() == 100.0);
        REQUIRE(result.price_change_1d.value() == Approx((100.0 - 102.0) / 102.0));
    }

    SECTION("Empty series is an error") {
        auto result = TechnicalAnalyzer::analyze("TEST", PriceSeries{});
        REQUIRE(result.error.has_value());
        REQUIRE(*result.error == "No historical data available");
        REQUIRE(result.technical_score == 0);
    }

    SECTION("A year of steady gains scores momentum and overbought RSI") {
        auto result = TechnicalAnalyzer::analyze("TEST", linear(260, 100.0, 1.0), 0.10);

        REQUIRE(result.rsi.value() == Approx(100.0));
        REQUIRE(result.price_3m_momentum.value() > 0.0);
        REQUIRE(result.price_12m_momentum.value() > 0.0);
        REQUIRE(result.relative_strength.value() == Approx(*result.price_12m_momentum - 0.10));

        // 5 (overbought) + 10 (3m) + 10 (12m), plus 5 when MACD leads its signal
        REQUIRE(result.technical_score >= 25);
        REQUIRE(result.technical_score <= 30);
    }

    SECTION("Oversold RSI scores 15") {
        auto result = TechnicalAnalyzer::analyze("TEST", linear(20, 200.0, -1.0));
        REQUIRE(result.rsi.value() == Approx(0.0));
        REQUIRE(result.technical_score == 15);
        REQUIRE(result.reasons.front() == "RSI indicates oversold conditions");
    }
}
