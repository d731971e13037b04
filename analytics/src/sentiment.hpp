#pragma once

#include "market_data.hpp"
#include <optional>
#include <string>
#include <vector>

struct SentimentResult {
    std::string symbol;

    std::optional<double> analyst_recommendation; // 1 = strong buy .. 5 = sell
    std::optional<std::string> analyst_rating;
    std::optional<double> number_of_analysts;
    std::optional<double> target_high_price;
    std::optional<double> target_low_price;
    std::optional<double> target_median_price;
    std::optional<double> current_price;

    std::optional<double> upside_potential;
    std::optional<double> volume_ratio;

    int sentiment_score = 0; // unbounded, may be negative
    std::vector<std::string> reasons;

    std::optional<std::string> error;
};

class SentimentScorer {
public:
    static SentimentResult analyze(const std::string& symbol, const Snapshot& snapshot);
};
