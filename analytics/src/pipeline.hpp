#pragma once

#include "config.hpp"
#include "market_data.hpp"
#include "symbol_resolver.hpp"
#include "indicators.hpp"
#include "fundamentals.hpp"
#include "earnings_quality.hpp"
#include "sentiment.hpp"
#include "esg_risk.hpp"
#include "scoring.hpp"
#include "entry_exit.hpp"
#include <optional>
#include <string>

struct ComprehensiveResult {
    ResolvedSymbol resolved;
    std::optional<CompositeScore> score;
    std::string error;

    bool ok() const { return score.has_value(); }
};

struct CompanyInfoResult {
    ResolvedSymbol resolved;
    std::optional<Snapshot> profile;
    std::string error;

    bool ok() const { return profile.has_value(); }
};

// Per-request orchestration: resolve the symbol once, fetch each data kind
// once, run the calculators. Provider failures become error markers on the
// affected result; nothing here throws on bad data.
class AnalysisPipeline {
public:
    AnalysisPipeline(MarketDataProvider& provider, const Config& config);

    ResolvedSymbol resolve(const std::string& symbol);

    TechnicalResult technical(const std::string& symbol);
    FundamentalResult fundamentals(const std::string& symbol);
    EarningsQualityResult earnings_quality(const std::string& symbol);
    SentimentResult sentiment(const std::string& symbol);
    EsgRiskResult esg_risk(const std::string& symbol);

    // Snapshot price, else the latest close
    std::optional<double> current_price(const std::string& symbol);

    CompanyInfoResult company_info(const std::string& symbol);

    ComprehensiveResult comprehensive(const std::string& symbol);
    IntradayResult intraday(const std::string& symbol);

private:
    MarketDataProvider& provider_;
    SymbolResolver resolver_;
    std::string price_lookback_;
    double benchmark_return_;
    CompositeScorer scorer_;
    IntradayLevelDeriver deriver_;

    TechnicalResult technical_from(const std::string& symbol, const FetchResult<PriceSeries>& prices) const;
    FundamentalResult fundamentals_from(const std::string& symbol,
                                        const FetchResult<Statements>& statements,
                                        const FetchResult<Snapshot>& snapshot) const;
    EarningsQualityResult earnings_from(const std::string& symbol,
                                        const FetchResult<Statements>& statements) const;
    SentimentResult sentiment_from(const std::string& symbol, const FetchResult<Snapshot>& snapshot) const;
    EsgRiskResult esg_risk_from(const std::string& symbol, const FetchResult<Snapshot>& snapshot) const;

    static std::optional<double> price_from(const FetchResult<Snapshot>& snapshot,
                                           const FetchResult<PriceSeries>& prices);
    static std::string unresolved_error(const ResolvedSymbol& resolved);
};
