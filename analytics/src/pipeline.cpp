#include "pipeline.hpp"
#include <spdlog/spdlog.h>

namespace {

IntradaySettings intraday_settings(const Config& config) {
    IntradaySettings s;
    s.sentiment_high = config.intraday_sentiment_high;
    s.sentiment_low = config.intraday_sentiment_low;
    s.sentiment_divisor = config.intraday_sentiment_divisor;
    return s;
}

std::string provider_error(const std::string& what, const std::string& detail) {
    return "Failed to fetch " + what + ": " + detail;
}

} // namespace

AnalysisPipeline::AnalysisPipeline(MarketDataProvider& provider, const Config& config)
    : provider_(provider)
    , resolver_(provider, config.symbol_fallback_suffix)
    , price_lookback_(config.price_lookback)
    , benchmark_return_(config.benchmark_return)
    , deriver_(intraday_settings(config)) {}

ResolvedSymbol AnalysisPipeline::resolve(const std::string& symbol) {
    return resolver_.resolve(symbol);
}

std::string AnalysisPipeline::unresolved_error(const ResolvedSymbol& resolved) {
    if (resolved.status == FetchStatus::ProviderFailure) {
        return "Market data provider failure for " + resolved.requested + ": " + resolved.error;
    }
    return resolved.error;
}

TechnicalResult AnalysisPipeline::technical_from(const std::string& symbol,
                                                 const FetchResult<PriceSeries>& prices) const {
    if (prices.status == FetchStatus::ProviderFailure) {
        TechnicalResult result;
        result.symbol = symbol;
        result.error = provider_error("price history", prices.error);
        return result;
    }
    // An empty series carries its own error marker
    return TechnicalAnalyzer::analyze(symbol, prices.data, benchmark_return_);
}

FundamentalResult AnalysisPipeline::fundamentals_from(const std::string& symbol,
                                                      const FetchResult<Statements>& statements,
                                                      const FetchResult<Snapshot>& snapshot) const {
    if (statements.status == FetchStatus::ProviderFailure) {
        FundamentalResult result;
        result.symbol = symbol;
        result.error = provider_error("financial statements", statements.error);
        return result;
    }
    if (!statements.ok() && !snapshot.ok()) {
        FundamentalResult result;
        result.symbol = symbol;
        result.error = "No financial data available";
        return result;
    }
    return FundamentalCalculator::analyze(symbol, statements.data, snapshot.data);
}

EarningsQualityResult AnalysisPipeline::earnings_from(const std::string& symbol,
                                                      const FetchResult<Statements>& statements) const {
    if (statements.status == FetchStatus::ProviderFailure) {
        EarningsQualityResult result;
        result.symbol = symbol;
        result.error = provider_error("financial statements", statements.error);
        return result;
    }
    return EarningsQualityAnalyzer::analyze(symbol, statements.data);
}

SentimentResult AnalysisPipeline::sentiment_from(const std::string& symbol,
                                                 const FetchResult<Snapshot>& snapshot) const {
    if (snapshot.status == FetchStatus::ProviderFailure) {
        SentimentResult result;
        result.symbol = symbol;
        result.error = provider_error("company snapshot", snapshot.error);
        return result;
    }
    return SentimentScorer::analyze(symbol, snapshot.data);
}

EsgRiskResult AnalysisPipeline::esg_risk_from(const std::string& symbol,
                                              const FetchResult<Snapshot>& snapshot) const {
    if (snapshot.status == FetchStatus::ProviderFailure) {
        EsgRiskResult result;
        result.symbol = symbol;
        result.error = provider_error("company snapshot", snapshot.error);
        return result;
    }
    return EsgRiskScorer::analyze(symbol, snapshot.data);
}

std::optional<double> AnalysisPipeline::price_from(const FetchResult<Snapshot>& snapshot,
                                                   const FetchResult<PriceSeries>& prices) {
    if (snapshot.ok() && snapshot.data.current_price && *snapshot.data.current_price > 0.0) {
        return snapshot.data.current_price;
    }
    if (prices.ok() && !prices.data.empty()) {
        return prices.data.front();
    }
    return std::nullopt;
}

TechnicalResult AnalysisPipeline::technical(const std::string& symbol) {
    auto resolved = resolve(symbol);
    if (!resolved.ok()) {
        TechnicalResult result;
        result.symbol = resolved.requested;
        result.error = unresolved_error(resolved);
        return result;
    }
    return technical_from(resolved.symbol, provider_.get_price_history(resolved.symbol, price_lookback_));
}

FundamentalResult AnalysisPipeline::fundamentals(const std::string& symbol) {
    auto resolved = resolve(symbol);
    if (!resolved.ok()) {
        FundamentalResult result;
        result.symbol = resolved.requested;
        result.error = unresolved_error(resolved);
        return result;
    }
    return fundamentals_from(resolved.symbol,
                             provider_.get_statements(resolved.symbol),
                             provider_.get_snapshot(resolved.symbol));
}

EarningsQualityResult AnalysisPipeline::earnings_quality(const std::string& symbol) {
    auto resolved = resolve(symbol);
    if (!resolved.ok()) {
        EarningsQualityResult result;
        result.symbol = resolved.requested;
        result.error = unresolved_error(resolved);
        return result;
    }
    return earnings_from(resolved.symbol, provider_.get_statements(resolved.symbol));
}

SentimentResult AnalysisPipeline::sentiment(const std::string& symbol) {
    auto resolved = resolve(symbol);
    if (!resolved.ok()) {
        SentimentResult result;
        result.symbol = resolved.requested;
        result.error = unresolved_error(resolved);
        return result;
    }
    return sentiment_from(resolved.symbol, provider_.get_snapshot(resolved.symbol));
}

EsgRiskResult AnalysisPipeline::esg_risk(const std::string& symbol) {
    auto resolved = resolve(symbol);
    if (!resolved.ok()) {
        EsgRiskResult result;
        result.symbol = resolved.requested;
        result.error = unresolved_error(resolved);
        return result;
    }
    return esg_risk_from(resolved.symbol, provider_.get_snapshot(resolved.symbol));
}

std::optional<double> AnalysisPipeline::current_price(const std::string& symbol) {
    auto resolved = resolve(symbol);
    if (!resolved.ok()) return std::nullopt;

    auto snapshot = provider_.get_snapshot(resolved.symbol);
    if (auto price = price_from(snapshot, FetchResult<PriceSeries>())) {
        return price;
    }
    return price_from(snapshot, provider_.get_price_history(resolved.symbol, price_lookback_));
}

CompanyInfoResult AnalysisPipeline::company_info(const std::string& symbol) {
    CompanyInfoResult out;
    out.resolved = resolve(symbol);

    if (!out.resolved.ok()) {
        out.error = unresolved_error(out.resolved);
        return out;
    }

    auto snapshot = provider_.get_snapshot(out.resolved.symbol);
    if (snapshot.status == FetchStatus::ProviderFailure) {
        out.error = provider_error("company snapshot", snapshot.error);
    } else if (!snapshot.ok()) {
        out.error = "Could not fetch company info for " + out.resolved.symbol;
    } else {
        out.profile = snapshot.data;
        if (!out.profile->symbol) out.profile->symbol = out.resolved.symbol;
    }

    if (!out.error.empty()) {
        spdlog::warn("Company info failed: {}", out.error);
    }
    return out;
}

ComprehensiveResult AnalysisPipeline::comprehensive(const std::string& symbol) {
    ComprehensiveResult out;
    out.resolved = resolve(symbol);

    if (!out.resolved.ok()) {
        out.error = unresolved_error(out.resolved);
        spdlog::warn("Comprehensive analysis aborted: {}", out.error);
        return out;
    }

    const std::string& sym = out.resolved.symbol;
    auto prices = provider_.get_price_history(sym, price_lookback_);
    auto statements = provider_.get_statements(sym);
    auto snapshot = provider_.get_snapshot(sym);

    if (!prices.ok() && !statements.ok() && !snapshot.ok()) {
        out.error = "No market data available for " + sym + ": " + prices.error;
        spdlog::warn("Comprehensive analysis aborted: {}", out.error);
        return out;
    }

    AnalysisBundle bundle;
    bundle.technical = technical_from(sym, prices);
    bundle.fundamentals = fundamentals_from(sym, statements, snapshot);
    bundle.earnings_quality = earnings_from(sym, statements);
    bundle.sentiment = sentiment_from(sym, snapshot);
    bundle.esg_risk = esg_risk_from(sym, snapshot);

    out.score = scorer_.compute(sym, bundle);
    return out;
}

IntradayResult AnalysisPipeline::intraday(const std::string& symbol) {
    auto resolved = resolve(symbol);

    if (!resolved.ok()) {
        IntradayResult result;
        result.symbol = resolved.requested;
        result.error = unresolved_error(resolved);
        result.error_kind = resolved.status == FetchStatus::ProviderFailure
                                ? IntradayErrorKind::ProviderFailure
                                : IntradayErrorKind::MissingPrice;
        spdlog::warn("Intraday analysis aborted: {}", result.error);
        return result;
    }

    const std::string& sym = resolved.symbol;
    auto prices = provider_.get_price_history(sym, price_lookback_);
    auto snapshot = provider_.get_snapshot(sym);

    auto price = price_from(snapshot, prices);
    if (!price && prices.status == FetchStatus::ProviderFailure
        && snapshot.status == FetchStatus::ProviderFailure) {
        IntradayResult result;
        result.symbol = sym;
        result.error_kind = IntradayErrorKind::ProviderFailure;
        result.error = provider_error("current price", snapshot.error);
        spdlog::warn("Intraday analysis aborted: {}", result.error);
        return result;
    }

    return deriver_.derive(sym, price, technical_from(sym, prices), sentiment_from(sym, snapshot));
}
