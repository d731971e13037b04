#include "report.hpp"
#include "util.hpp"
#include <cstdint>

namespace {

template <typename T>
nlohmann::json opt(const std::optional<T>& value) {
    if (value) return *value;
    return nullptr;
}

template <typename R>
void add_error(nlohmann::json& j, const R& r) {
    if (r.error) {
        j["error"] = *r.error;
    }
}

template <typename T>
nlohmann::json opt_result(const std::optional<T>& result) {
    if (result) return to_json(*result);
    return nullptr;
}

} // namespace

nlohmann::json to_json(const TechnicalResult& r) {
    nlohmann::json j = {
        {"symbol", r.symbol},
        {"rsi", opt(r.rsi)},
        {"macd_line", opt(r.macd_line)},
        {"macd_signal", opt(r.macd_signal)},
        {"price_3m_momentum", opt(r.price_3m_momentum)},
        {"price_12m_momentum", opt(r.price_12m_momentum)},
        {"relative_strength", opt(r.relative_strength)},
        {"technical_score", r.technical_score},
        {"technical_reasons", r.reasons},
        {"current_price", opt(r.current_price)},
        {"price_change_1d", opt(r.price_change_1d)}
    };
    add_error(j, r);
    return j;
}

nlohmann::json to_json(const FundamentalResult& r) {
    nlohmann::json j = {
        {"symbol", r.symbol},
        {"current_price", opt(r.current_price)},
        {"market_cap", opt(r.market_cap)},
        {"pe", opt(r.pe)},
        {"debt_to_equity", opt(r.ratios.debt_to_equity)},
        {"net_margin", opt(r.ratios.net_margin)},
        {"ebitda_margin", opt(r.ratios.ebitda_margin)},
        {"roe", opt(r.ratios.roe)},
        {"revenue_cagr", opt(r.ratios.revenue_cagr)},
        {"operating_cash_flow", opt(r.operating_cash_flow)},
        {"free_cash_flow", opt(r.ratios.free_cash_flow)},
        {"total_assets", opt(r.total_assets)},
        {"total_liabilities", opt(r.total_liabilities)},
        {"score", r.score},
        {"score_reasons", r.reasons}
    };
    add_error(j, r);
    return j;
}

nlohmann::json to_json(const EarningsQualityResult& r) {
    nlohmann::json j = {
        {"symbol", r.symbol},
        {"accruals_quality", opt(r.accruals_quality)},
        {"earnings_persistence", opt(r.earnings_persistence)},
        {"earnings_predictability", opt(r.earnings_predictability)},
        {"cash_flow_quality", opt(r.cash_flow_quality)},
        {"net_income_series", r.net_income_series},
        {"ocf_series", r.ocf_series},
        {"revenue_series", r.revenue_series}
    };
    add_error(j, r);
    return j;
}

nlohmann::json to_json(const SentimentResult& r) {
    nlohmann::json j = {
        {"symbol", r.symbol},
        {"analyst_recommendation", opt(r.analyst_recommendation)},
        {"analyst_rating", opt(r.analyst_rating)},
        {"number_of_analysts", opt(r.number_of_analysts)},
        {"target_high_price", opt(r.target_high_price)},
        {"target_low_price", opt(r.target_low_price)},
        {"target_median_price", opt(r.target_median_price)},
        {"current_price", opt(r.current_price)},
        {"upside_potential", opt(r.upside_potential)},
        {"sentiment_score", r.sentiment_score},
        {"sentiment_reasons", r.reasons},
        {"volume_ratio", opt(r.volume_ratio)}
    };
    add_error(j, r);
    return j;
}

nlohmann::json to_json(const EsgRiskResult& r) {
    nlohmann::json j = {
        {"symbol", r.symbol},
        {"esg_score", r.esg_score},
        {"esg_reasons", r.esg_reasons},
        {"risk_score", r.risk_score},
        {"risk_reasons", r.risk_reasons},
        {"beta", opt(r.beta)},
        {"debt_to_equity", opt(r.debt_to_equity)},
        {"current_ratio", opt(r.current_ratio)},
        {"quick_ratio", opt(r.quick_ratio)},
        {"sector", opt(r.sector)},
        {"industry", opt(r.industry)},
        {"audit_risk", opt(r.audit_risk)},
        {"board_risk", opt(r.board_risk)},
        {"compensation_risk", opt(r.compensation_risk)},
        {"shareholder_rights_risk", opt(r.shareholder_rights_risk)},
        {"overall_risk", opt(r.overall_risk)}
    };
    add_error(j, r);
    return j;
}

nlohmann::json to_json(const SubScore& s) {
    return {
        {"score", util::round_to(s.value, 1)},
        {"budget", s.budget},
        {"reasons", s.reasons}
    };
}

nlohmann::json to_json(const CompositeScore& c) {
    return {
        {"symbol", c.symbol},
        {"total_score", util::round_to(c.total_score, 1)},
        {"band", c.band},
        {"overall_assessment", c.overall_assessment},
        {"score_breakdown", {
            {c.fundamentals.name, to_json(c.fundamentals)},
            {c.earnings_quality.name, to_json(c.earnings_quality)},
            {c.market_factors.name, to_json(c.market_factors)},
            {c.risk_context.name, to_json(c.risk_context)}
        }},
        {"analysis_summary", c.analysis_summary},
        {"fundamental_score", c.fundamentals.value},
        {"earnings_quality_score", c.earnings_quality.value},
        {"market_factors_score", c.market_factors.value},
        {"risk_context_score", c.risk_context.value},
        {"detailed_analysis", {
            {"fundamentals", opt_result(c.detailed_analysis.fundamentals)},
            {"earnings_quality", opt_result(c.detailed_analysis.earnings_quality)},
            {"technical_indicators", opt_result(c.detailed_analysis.technical)},
            {"market_sentiment", opt_result(c.detailed_analysis.sentiment)},
            {"esg_risk_factors", opt_result(c.detailed_analysis.esg_risk)}
        }}
    };
}

nlohmann::json to_json(const IntradayResult& r) {
    if (!r.ok()) {
        nlohmann::json j = error_json(r.symbol, r.error);
        j["error_kind"] = intraday_error_string(r.error_kind);
        return j;
    }

    const auto& lv = *r.levels;
    nlohmann::json j = {
        {"symbol", r.symbol},
        {"analysis_timestamp", r.analysis_timestamp},
        {"current_price", lv.current_price},
        {"entry_price", lv.entry_price},
        {"exit_price", lv.exit_price},
        {"stop_loss", lv.stop_loss},
        {"risk_amount", lv.risk_amount},
        {"reward_amount", lv.reward_amount},
        {"risk_reward_ratio", lv.risk_reward_ratio},
        {"recommendation", lv.recommendation},
        {"recommendation_detail", lv.recommendation_detail},
        {"rsi_regime", IntradayLevelDeriver::regime_string(lv.regime)},
        {"adjustments", lv.adjustments},
        {"trading_strategy", {
            {"entry_strategy", lv.strategy.entry},
            {"exit_strategy", lv.strategy.exit},
            {"stop_loss_strategy", lv.strategy.stop_loss},
            {"position_size", lv.strategy.position_size}
        }},
        {"technical_indicators", opt_result(r.technical)},
        {"market_sentiment", opt_result(r.sentiment)}
    };
    return j;
}

nlohmann::json to_json(const ComprehensiveResult& r) {
    if (!r.ok()) {
        return error_json(r.resolved.requested, r.error);
    }

    nlohmann::json j = to_json(*r.score);
    if (r.resolved.used_fallback) {
        j["requested_symbol"] = r.resolved.requested;
    }
    return j;
}

nlohmann::json to_json(const Snapshot& s) {
    nlohmann::json employees = nullptr;
    if (s.employees) employees = static_cast<int64_t>(*s.employees);

    return {
        {"name", opt(s.name)},
        {"symbol", opt(s.symbol)},
        {"current_price", opt(s.current_price)},
        {"currency", opt(s.currency)},
        {"market_cap", s.market_cap ? opt(s.market_cap) : opt(s.enterprise_value)},
        {"sector", opt(s.sector)},
        {"industry", opt(s.industry)},
        {"eps", opt(s.trailing_eps)},
        {"pe_ratio", opt(s.trailing_pe)},
        {"fifty_two_week_low", opt(s.fifty_two_week_low)},
        {"fifty_two_week_high", opt(s.fifty_two_week_high)},
        {"employees", employees},
        {"free_cashflow", opt(s.free_cashflow)},
        {"operating_cashflow", opt(s.operating_cashflow)},
        {"ebitda", opt(s.ebitda)}
    };
}

nlohmann::json to_json(const CompanyInfoResult& r) {
    if (!r.ok()) {
        return error_json(r.resolved.requested, r.error);
    }

    nlohmann::json j = to_json(*r.profile);
    if (r.resolved.used_fallback) {
        j["requested_symbol"] = r.resolved.requested;
    }
    return j;
}

nlohmann::json error_json(const std::string& symbol, const std::string& error) {
    return {
        {"symbol", symbol},
        {"error", error}
    };
}
