#pragma once

#include "market_data.hpp"
#include <optional>
#include <string>
#include <vector>

struct MacdValues {
    std::optional<double> line;
    std::optional<double> signal;
};

// Single trailing values over a newest-first PriceSeries.
// Every function returns nullopt below its minimum window.
class Indicators {
public:
    static constexpr size_t MOMENTUM_3M_INDEX = 62;   // 63 trading days
    static constexpr size_t MOMENTUM_12M_INDEX = 251; // 252 trading days

    // Wilder-smoothed RSI; needs period+1 prices
    static std::optional<double> rsi(const PriceSeries& prices, int period = 14);

    // MACD line and signal line; the line needs `slow` prices,
    // the signal needs `signal` sliding windows of width `slow`
    static MacdValues macd(const PriceSeries& prices, int fast = 12, int slow = 26, int signal = 9);

    // Bias-adjusted EMA (alpha = 2/(span+1)) at the last point of a chronological series
    static std::optional<double> ema(const std::vector<double>& chronological, int span);

    // (p[0] - p[lookback]) / p[lookback]; 0 when p[lookback] is 0
    static std::optional<double> momentum(const PriceSeries& prices, size_t lookback_index);

private:
    static std::vector<double> chronological(const PriceSeries& prices);
};

struct TechnicalResult {
    std::string symbol;

    std::optional<double> rsi;
    std::optional<double> macd_line;
    std::optional<double> macd_signal;
    std::optional<double> price_3m_momentum;
    std::optional<double> price_12m_momentum;
    std::optional<double> relative_strength;
    std::optional<double> current_price;
    std::optional<double> price_change_1d;

    int technical_score = 0;
    std::vector<std::string> reasons;

    std::optional<std::string> error;
};

class TechnicalAnalyzer {
public:
    static TechnicalResult analyze(const std::string& symbol,
                                   const PriceSeries& prices,
                                   double benchmark_return = 0.10);

private:
    static void score(TechnicalResult& result);
};
