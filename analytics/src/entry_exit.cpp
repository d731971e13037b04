#include "entry_exit.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

IntradayLevelDeriver::IntradayLevelDeriver(const IntradaySettings& settings)
    : settings_(settings) {}

RsiRegime IntradayLevelDeriver::regime_for(const std::optional<double>& rsi) {
    if (!rsi) return RsiRegime::Neutral;
    if (*rsi < 30.0) return RsiRegime::Oversold;
    if (*rsi > 70.0) return RsiRegime::Overbought;
    return RsiRegime::Neutral;
}

std::string IntradayLevelDeriver::regime_string(RsiRegime regime) {
    switch (regime) {
        case RsiRegime::Oversold: return "oversold";
        case RsiRegime::Overbought: return "overbought";
        case RsiRegime::Neutral: return "neutral";
        default: return "unknown";
    }
}

std::string IntradayLevelDeriver::recommendation_for(double ratio) {
    if (ratio >= 2.0) return "STRONG BUY";
    if (ratio >= 1.5) return "BUY";
    if (ratio >= 1.0) return "HOLD";
    return "AVOID";
}

std::string IntradayLevelDeriver::recommendation_detail_for(double ratio) {
    if (ratio >= 2.0) return "STRONG BUY - Excellent risk-reward ratio";
    if (ratio >= 1.5) return "BUY - Good risk-reward ratio";
    if (ratio >= 1.0) return "HOLD - Moderate risk-reward ratio";
    return "AVOID - Poor risk-reward ratio";
}

TradingStrategy IntradayLevelDeriver::strategy_for(const IntradayLevels& lv) {
    TradingStrategy s;
    s.entry = fmt::format("Enter at {:.2f} (slightly {} current price)", lv.entry_price,
                          lv.entry_price < lv.current_price ? "below" : "above");
    s.exit = fmt::format("Target exit at {:.2f} for {}", lv.exit_price,
                         lv.exit_price > lv.entry_price ? "profit" : "loss");
    s.stop_loss = fmt::format("Set stop loss at {:.2f} to limit downside risk", lv.stop_loss);
    s.position_size = "Consider position sizing based on your risk tolerance (1-2% of portfolio per trade)";
    return s;
}

IntradayLevels IntradayLevelDeriver::compute_levels(const IntradayInputs& in) const {
    IntradayLevels lv;
    const double p = in.current_price;
    lv.current_price = util::round_to(p, 2);

    double entry, exit, stop;

    lv.regime = regime_for(in.rsi);
    switch (lv.regime) {
        case RsiRegime::Oversold:
            entry = p * 0.995;
            exit = p * 1.02;
            stop = p * 0.985;
            break;
        case RsiRegime::Overbought:
            entry = p * 1.005;
            exit = p * 0.98;
            stop = p * 1.015;
            break;
        default:
            // Range trading
            entry = p * 0.998;
            exit = p * 1.015;
            stop = p * 0.99;
            break;
    }

    if (in.momentum_3m) {
        if (*in.momentum_3m > settings_.momentum_threshold) {
            entry = std::min(entry, p * 0.997);
            exit = std::max(exit, p * 1.025);
            lv.adjustments.push_back("Strong upward 3-month momentum");
        } else if (*in.momentum_3m < -settings_.momentum_threshold) {
            entry = std::max(entry, p * 1.003);
            exit = std::min(exit, p * 0.975);
            lv.adjustments.push_back("Strong downward 3-month momentum");
        }
    }

    if (in.sentiment_score) {
        double sentiment = *in.sentiment_score / settings_.sentiment_divisor;
        if (sentiment > settings_.sentiment_high) {
            exit = std::max(exit, p * 1.02);
            lv.adjustments.push_back("Positive sentiment raises the exit target");
        } else if (sentiment < settings_.sentiment_low) {
            stop = std::min(stop, p * 0.99);
            lv.adjustments.push_back("Negative sentiment tightens the stop");
        }
    }

    lv.entry_price = util::round_to(entry, 2);
    lv.exit_price = util::round_to(exit, 2);
    lv.stop_loss = util::round_to(stop, 2);

    double risk = std::abs(lv.entry_price - lv.stop_loss);
    double reward = std::abs(lv.exit_price - lv.entry_price);

    lv.risk_amount = util::round_to(risk, 2);
    lv.reward_amount = util::round_to(reward, 2);
    lv.risk_reward_ratio = risk > 0 ? util::round_to(reward / risk, 2) : 0.0;

    lv.recommendation = recommendation_for(lv.risk_reward_ratio);
    lv.recommendation_detail = recommendation_detail_for(lv.risk_reward_ratio);
    lv.strategy = strategy_for(lv);

    return lv;
}

IntradayResult IntradayLevelDeriver::derive(const std::string& symbol,
                                            const std::optional<double>& current_price,
                                            const std::optional<TechnicalResult>& technical,
                                            const std::optional<SentimentResult>& sentiment) const {
    IntradayResult result;
    result.symbol = symbol;
    result.analysis_timestamp = util::current_iso8601();
    result.technical = technical;
    result.sentiment = sentiment;

    if (!current_price || !std::isfinite(*current_price) || *current_price <= 0.0) {
        result.error_kind = IntradayErrorKind::MissingPrice;
        result.error = "Could not determine current stock price for " + symbol;
        spdlog::warn("{}", result.error);
        return result;
    }

    IntradayInputs inputs;
    inputs.current_price = *current_price;

    if (technical && !technical->error) {
        inputs.rsi = technical->rsi;
        inputs.momentum_3m = technical->price_3m_momentum;
    }
    if (sentiment && !sentiment->error) {
        inputs.sentiment_score = static_cast<double>(sentiment->sentiment_score);
    }

    result.levels = compute_levels(inputs);

    spdlog::info("Intraday {}: entry={:.2f} exit={:.2f} stop={:.2f} rr={:.2f} ({})",
                 symbol, result.levels->entry_price, result.levels->exit_price,
                 result.levels->stop_loss, result.levels->risk_reward_ratio,
                 result.levels->recommendation);

    return result;
}

std::string intraday_error_string(IntradayErrorKind kind) {
    switch (kind) {
        case IntradayErrorKind::None: return "none";
        case IntradayErrorKind::MissingPrice: return "missing_current_price";
        case IntradayErrorKind::ProviderFailure: return "provider_failure";
        default: return "unknown";
    }
}
