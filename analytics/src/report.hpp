#pragma once

#include "indicators.hpp"
#include "fundamentals.hpp"
#include "earnings_quality.hpp"
#include "sentiment.hpp"
#include "esg_risk.hpp"
#include "scoring.hpp"
#include "entry_exit.hpp"
#include "pipeline.hpp"
#include <nlohmann/json.hpp>

// JSON rendering of analysis results. Undefined values are emitted as null,
// error-marked results carry an "error" string.
nlohmann::json to_json(const TechnicalResult& r);
nlohmann::json to_json(const FundamentalResult& r);
nlohmann::json to_json(const EarningsQualityResult& r);
nlohmann::json to_json(const SentimentResult& r);
nlohmann::json to_json(const EsgRiskResult& r);
nlohmann::json to_json(const SubScore& s);
nlohmann::json to_json(const CompositeScore& c);
nlohmann::json to_json(const IntradayResult& r);
nlohmann::json to_json(const ComprehensiveResult& r);

// Company profile and current financial snapshot
nlohmann::json to_json(const Snapshot& s);
nlohmann::json to_json(const CompanyInfoResult& r);

nlohmann::json error_json(const std::string& symbol, const std::string& error);
