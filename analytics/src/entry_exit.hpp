#pragma once

#include "indicators.hpp"
#include "sentiment.hpp"
#include <optional>
#include <string>
#include <vector>

struct IntradaySettings {
    double momentum_threshold = 0.05;  // |3m momentum| that triggers an override
    double sentiment_high = 0.6;
    double sentiment_low = 0.4;
    // Raw sentiment score is divided by this before the threshold checks.
    // 1.0 compares the thresholds against the unbounded integer score as-is.
    double sentiment_divisor = 1.0;
};

enum class RsiRegime {
    Oversold,
    Overbought,
    Neutral  // includes undefined RSI
};

struct IntradayInputs {
    double current_price = 0.0;
    std::optional<double> rsi;
    std::optional<double> momentum_3m;
    std::optional<double> sentiment_score;  // raw scorer output
};

struct TradingStrategy {
    std::string entry;
    std::string exit;
    std::string stop_loss;
    std::string position_size;
};

struct IntradayLevels {
    double current_price = 0.0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double stop_loss = 0.0;

    double risk_amount = 0.0;
    double reward_amount = 0.0;
    double risk_reward_ratio = 0.0;

    std::string recommendation;  // "STRONG BUY", "BUY", "HOLD", "AVOID"
    std::string recommendation_detail;

    RsiRegime regime = RsiRegime::Neutral;
    std::vector<std::string> adjustments;

    TradingStrategy strategy;
};

enum class IntradayErrorKind {
    None,
    MissingPrice,    // the one fatal precondition
    ProviderFailure
};

struct IntradayResult {
    std::string symbol;
    std::string analysis_timestamp;  // UTC ISO-8601
    std::optional<IntradayLevels> levels;

    IntradayErrorKind error_kind = IntradayErrorKind::None;
    std::string error;

    // Inputs the levels were derived from, for reporting
    std::optional<TechnicalResult> technical;
    std::optional<SentimentResult> sentiment;

    bool ok() const { return error_kind == IntradayErrorKind::None && levels.has_value(); }
};

class IntradayLevelDeriver {
public:
    explicit IntradayLevelDeriver(const IntradaySettings& settings = IntradaySettings());

    // Fails with MissingPrice when the price is absent or not positive
    IntradayResult derive(const std::string& symbol,
                          const std::optional<double>& current_price,
                          const std::optional<TechnicalResult>& technical,
                          const std::optional<SentimentResult>& sentiment) const;

    IntradayLevels compute_levels(const IntradayInputs& inputs) const;

    static RsiRegime regime_for(const std::optional<double>& rsi);
    static std::string regime_string(RsiRegime regime);
    static std::string recommendation_for(double risk_reward_ratio);
    static std::string recommendation_detail_for(double risk_reward_ratio);
    static TradingStrategy strategy_for(const IntradayLevels& levels);

private:
    IntradaySettings settings_;
};

std::string intraday_error_string(IntradayErrorKind kind);
