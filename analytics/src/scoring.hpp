#pragma once

#include "indicators.hpp"
#include "fundamentals.hpp"
#include "earnings_quality.hpp"
#include "sentiment.hpp"
#include "esg_risk.hpp"
#include <optional>
#include <string>
#include <vector>

// Rescaling of each sub-analysis into its 25-point category
struct CompositeWeights {
    double fundamental_scale = 0.25;  // raw 0-100 -> 25
    double fundamental_cap = 25.0;

    double technical_scale = 0.75;
    double technical_cap = 15.0;
    double sentiment_scale = 0.67;
    double sentiment_cap = 10.0;

    double esg_offset = 10.0;   // shifts the signed ESG score positive
    double esg_scale = 0.75;
    double esg_cap = 15.0;
    double risk_offset = 10.0;  // (offset - risk) rewards low risk
    double risk_scale = 0.5;
    double risk_cap = 10.0;
};

struct SubScore {
    std::string name;   // score_breakdown key
    std::string label;  // summary text
    double value = 0.0;
    double budget = 25.0;
    std::vector<std::string> reasons;
};

// The five sub-analyses; absent or error-marked entries score 0
struct AnalysisBundle {
    std::optional<FundamentalResult> fundamentals;
    std::optional<EarningsQualityResult> earnings_quality;
    std::optional<TechnicalResult> technical;
    std::optional<SentimentResult> sentiment;
    std::optional<EsgRiskResult> esg_risk;
};

struct CompositeScore {
    std::string symbol;

    double total_score = 0.0;  // always within [0, 100]
    std::string band;          // "EXCELLENT" .. "VERY POOR"
    std::string overall_assessment;

    SubScore fundamentals;
    SubScore earnings_quality;
    SubScore market_factors;
    SubScore risk_context;

    std::vector<std::string> analysis_summary;

    AnalysisBundle detailed_analysis;
};

class CompositeScorer {
public:
    static constexpr const char* FUNDAMENTALS = "fundamentals";
    static constexpr const char* EARNINGS_QUALITY = "earnings_quality";
    static constexpr const char* MARKET_FACTORS = "market_factors";
    static constexpr const char* RISK_CONTEXT = "risk_context";

    explicit CompositeScorer(const CompositeWeights& weights = CompositeWeights());

    CompositeScore compute(const std::string& symbol, const AnalysisBundle& bundle) const;

    static std::string band_for(double total_score);
    static std::string assessment_for(const std::string& band);

private:
    CompositeWeights weights_;

    SubScore score_fundamentals(const std::optional<FundamentalResult>& f) const;
    SubScore score_earnings(const std::optional<EarningsQualityResult>& e) const;
    SubScore score_market(const std::optional<TechnicalResult>& t,
                          const std::optional<SentimentResult>& s) const;
    SubScore score_risk(const std::optional<EsgRiskResult>& r) const;
};
