#include "indicators.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <algorithm>

std::vector<double> Indicators::chronological(const PriceSeries& prices) {
    return std::vector<double>(prices.rbegin(), prices.rend());
}

std::optional<double> Indicators::rsi(const PriceSeries& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period) + 1) {
        return std::nullopt;
    }

    auto closes = chronological(prices);

    std::vector<double> gains;
    std::vector<double> losses;
    gains.reserve(closes.size() - 1);
    losses.reserve(closes.size() - 1);

    for (size_t i = 1; i < closes.size(); ++i) {
        double change = closes[i] - closes[i - 1];
        gains.push_back(change > 0 ? change : 0.0);
        losses.push_back(change < 0 ? -change : 0.0);
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 0; i < period; ++i) {
        avg_gain += gains[i];
        avg_loss += losses[i];
    }
    avg_gain /= period;
    avg_loss /= period;

    for (size_t i = period; i < gains.size(); ++i) {
        avg_gain = (avg_gain * (period - 1) + gains[i]) / period;
        avg_loss = (avg_loss * (period - 1) + losses[i]) / period;
    }

    if (avg_loss == 0.0) return 100.0;

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::optional<double> Indicators::ema(const std::vector<double>& values, int span) {
    if (values.empty() || span < 1) return std::nullopt;

    // Weighted mean with weights (1-alpha)^k, k = 0 for the newest value
    double alpha = 2.0 / (span + 1.0);
    double decay = 1.0 - alpha;

    double num = 0.0;
    double den = 0.0;
    double w = 1.0;
    for (auto it = values.rbegin(); it != values.rend(); ++it) {
        num += w * (*it);
        den += w;
        w *= decay;
    }

    return num / den;
}

MacdValues Indicators::macd(const PriceSeries& prices, int fast, int slow, int signal) {
    MacdValues result;

    if (slow <= 0 || prices.size() < static_cast<size_t>(slow)) {
        return result;
    }

    auto closes = chronological(prices);

    auto fast_ema = ema(closes, fast);
    auto slow_ema = ema(closes, slow);
    if (fast_ema && slow_ema) {
        result.line = *fast_ema - *slow_ema;
    }

    // MACD of every sliding window of width `slow`, oldest window first
    std::vector<double> macd_values;
    for (size_t i = 0; i + slow <= closes.size(); ++i) {
        std::vector<double> window(closes.begin() + i, closes.begin() + i + slow);
        auto f = ema(window, fast);
        auto s = ema(window, slow);
        if (f && s) {
            macd_values.push_back(*f - *s);
        }
    }

    if (signal > 0 && macd_values.size() >= static_cast<size_t>(signal)) {
        result.signal = ema(macd_values, signal);
    }

    return result;
}

std::optional<double> Indicators::momentum(const PriceSeries& prices, size_t lookback_index) {
    if (prices.size() <= lookback_index) return std::nullopt;

    double base = prices[lookback_index];
    if (base == 0.0) return 0.0;

    return (prices[0] - base) / base;
}

TechnicalResult TechnicalAnalyzer::analyze(const std::string& symbol,
                                           const PriceSeries& prices,
                                           double benchmark_return) {
    TechnicalResult result;
    result.symbol = symbol;

    if (prices.empty()) {
        result.error = "No historical data available";
        return result;
    }

    result.rsi = Indicators::rsi(prices);

    auto macd = Indicators::macd(prices);
    result.macd_line = macd.line;
    result.macd_signal = macd.signal;

    result.price_3m_momentum = Indicators::momentum(prices, Indicators::MOMENTUM_3M_INDEX);
    result.price_12m_momentum = Indicators::momentum(prices, Indicators::MOMENTUM_12M_INDEX);

    // Relative to an assumed flat benchmark return, not a real index
    if (result.price_12m_momentum) {
        result.relative_strength = *result.price_12m_momentum - benchmark_return;
    }

    result.current_price = prices[0];
    if (prices.size() > 1 && prices[1] != 0.0) {
        result.price_change_1d = (prices[0] - prices[1]) / prices[1];
    }

    score(result);

    spdlog::debug("Technical {}: rsi={} score={} ({} prices)",
                  symbol, result.rsi ? *result.rsi : -1.0,
                  result.technical_score, prices.size());

    return result;
}

void TechnicalAnalyzer::score(TechnicalResult& result) {
    int score = 0;

    if (result.rsi) {
        double rsi = *result.rsi;
        if (rsi >= 30.0 && rsi <= 70.0) {
            score += 10;
            result.reasons.push_back("RSI in neutral zone (30-70)");
        } else if (rsi < 30.0) {
            score += 15;
            result.reasons.push_back("RSI indicates oversold conditions");
        } else {
            score += 5;
            result.reasons.push_back("RSI indicates overbought conditions");
        }
    }

    if (result.price_3m_momentum && *result.price_3m_momentum > 0) {
        score += 10;
        result.reasons.push_back("Positive 3-month momentum");
    }
    if (result.price_12m_momentum && *result.price_12m_momentum > 0) {
        score += 10;
        result.reasons.push_back("Positive 12-month momentum");
    }

    if (result.macd_line && result.macd_signal && *result.macd_line > *result.macd_signal) {
        score += 5;
        result.reasons.push_back("MACD above signal line (bullish)");
    }

    result.technical_score = score;
}
