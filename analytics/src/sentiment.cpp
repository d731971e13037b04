#include "sentiment.hpp"
#include <spdlog/spdlog.h>

SentimentResult SentimentScorer::analyze(const std::string& symbol, const Snapshot& snapshot) {
    SentimentResult result;
    result.symbol = symbol;

    result.analyst_recommendation = snapshot.recommendation_mean;
    result.analyst_rating = snapshot.recommendation_key;
    result.number_of_analysts = snapshot.analyst_count;
    result.target_high_price = snapshot.target_high_price;
    result.target_low_price = snapshot.target_low_price;
    result.target_median_price = snapshot.target_median_price;
    result.current_price = snapshot.current_price;

    int score = 0;

    if (result.analyst_recommendation) {
        double rec = *result.analyst_recommendation;
        if (rec <= 2.0) {
            score += 15;
            result.reasons.push_back("Strong buy recommendation from analysts");
        } else if (rec <= 2.5) {
            score += 10;
            result.reasons.push_back("Buy recommendation from analysts");
        } else if (rec <= 3.0) {
            score += 5;
            result.reasons.push_back("Hold recommendation from analysts");
        } else if (rec > 3.5) {
            score -= 5;
            result.reasons.push_back("Sell recommendation from analysts");
        }
    }

    if (result.target_median_price && result.current_price && *result.current_price != 0.0) {
        double upside = (*result.target_median_price - *result.current_price) / *result.current_price;
        result.upside_potential = upside;

        if (upside > 0.20) {
            score += 10;
            result.reasons.push_back("High upside potential (>20%)");
        } else if (upside > 0.10) {
            score += 5;
            result.reasons.push_back("Moderate upside potential (10-20%)");
        } else if (upside < -0.10) {
            score -= 5;
            result.reasons.push_back("Downside risk (>10%)");
        }
    }

    if (snapshot.volume && snapshot.average_volume && *snapshot.average_volume != 0.0) {
        result.volume_ratio = *snapshot.volume / *snapshot.average_volume;
        if (*result.volume_ratio > 1.5) {
            score += 5;
            result.reasons.push_back("Above-average trading volume");
        }
    }

    result.sentiment_score = score;

    spdlog::debug("Sentiment {}: score={} upside={}", symbol, score,
                  result.upside_potential.value_or(0.0));

    return result;
}
