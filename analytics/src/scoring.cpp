#include "scoring.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

namespace {

template <typename T>
bool usable(const std::optional<T>& analysis) {
    return analysis.has_value() && !analysis->error.has_value();
}

} // namespace

CompositeScorer::CompositeScorer(const CompositeWeights& weights)
    : weights_(weights) {}

CompositeScore CompositeScorer::compute(const std::string& symbol,
                                        const AnalysisBundle& bundle) const {
    CompositeScore result;
    result.symbol = symbol;
    result.detailed_analysis = bundle;

    result.fundamentals = score_fundamentals(bundle.fundamentals);
    result.earnings_quality = score_earnings(bundle.earnings_quality);
    result.market_factors = score_market(bundle.technical, bundle.sentiment);
    result.risk_context = score_risk(bundle.esg_risk);

    double total = result.fundamentals.value +
                   result.earnings_quality.value +
                   result.market_factors.value +
                   result.risk_context.value;

    // Each category is capped at 25, so this only guards rounding drift
    result.total_score = util::clamp(total, 0.0, 100.0);

    result.band = band_for(result.total_score);
    result.overall_assessment = assessment_for(result.band);

    for (const SubScore* sub : {&result.fundamentals, &result.earnings_quality,
                                &result.market_factors, &result.risk_context}) {
        for (const auto& reason : sub->reasons) {
            result.analysis_summary.push_back(reason);
        }
        result.analysis_summary.push_back(
            fmt::format("{}: {:.1f}/{:.0f}", sub->label, sub->value, sub->budget));
    }

    spdlog::info("Composite {}: {:.1f} ({}) F={:.1f} E={:.1f} M={:.1f} R={:.1f}",
                 symbol, result.total_score, result.band,
                 result.fundamentals.value, result.earnings_quality.value,
                 result.market_factors.value, result.risk_context.value);

    return result;
}

SubScore CompositeScorer::score_fundamentals(const std::optional<FundamentalResult>& f) const {
    SubScore sub;
    sub.name = FUNDAMENTALS;
    sub.label = "Fundamentals";

    if (!usable(f)) return sub;

    // Raw score is already floored at 0
    sub.value = std::min(weights_.fundamental_cap,
                         std::max(0, f->score) * weights_.fundamental_scale);
    return sub;
}

SubScore CompositeScorer::score_earnings(const std::optional<EarningsQualityResult>& e) const {
    SubScore sub;
    sub.name = EARNINGS_QUALITY;
    sub.label = "Earnings Quality";

    if (!usable(e)) return sub;

    auto accruals = EarningsQualityAnalyzer::accruals_band(e->accruals_quality);
    auto persistence = EarningsQualityAnalyzer::persistence_band(e->earnings_persistence);

    sub.value = accruals.points + persistence.points;
    if (accruals.reason) sub.reasons.push_back(*accruals.reason);
    if (persistence.reason) sub.reasons.push_back(*persistence.reason);

    return sub;
}

SubScore CompositeScorer::score_market(const std::optional<TechnicalResult>& t,
                                       const std::optional<SentimentResult>& s) const {
    SubScore sub;
    sub.name = MARKET_FACTORS;
    sub.label = "Market Factors";

    if (usable(t)) {
        sub.value += std::min(weights_.technical_cap,
                              std::max(0, t->technical_score) * weights_.technical_scale);
    }

    if (usable(s)) {
        sub.value += util::clamp(s->sentiment_score * weights_.sentiment_scale,
                                 0.0, weights_.sentiment_cap);
    }

    return sub;
}

SubScore CompositeScorer::score_risk(const std::optional<EsgRiskResult>& r) const {
    SubScore sub;
    sub.name = RISK_CONTEXT;
    sub.label = "Risk & Context";

    if (!usable(r)) return sub;

    sub.value += util::clamp((r->esg_score + weights_.esg_offset) * weights_.esg_scale,
                             0.0, weights_.esg_cap);
    sub.value += util::clamp((weights_.risk_offset - r->risk_score) * weights_.risk_scale,
                             0.0, weights_.risk_cap);

    return sub;
}

std::string CompositeScorer::band_for(double total_score) {
    if (total_score >= 80.0) return "EXCELLENT";
    if (total_score >= 65.0) return "GOOD";
    if (total_score >= 50.0) return "FAIR";
    if (total_score >= 35.0) return "POOR";
    return "VERY POOR";
}

std::string CompositeScorer::assessment_for(const std::string& band) {
    if (band == "EXCELLENT") return "EXCELLENT - Strong buy candidate";
    if (band == "GOOD") return "GOOD - Buy recommendation";
    if (band == "FAIR") return "FAIR - Hold with monitoring";
    if (band == "POOR") return "POOR - Consider selling";
    return "VERY POOR - Strong sell";
}
