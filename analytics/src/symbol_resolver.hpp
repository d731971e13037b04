#pragma once

#include "market_data.hpp"
#include <string>

struct ResolvedSymbol {
    std::string requested;   // as normalized from user input
    std::string symbol;      // what the provider knows it as
    bool used_fallback = false;

    FetchStatus status = FetchStatus::NoData;
    std::string error;

    bool ok() const { return status == FetchStatus::Ok; }
};

// Normalizes user input and applies the secondary-market suffix fallback
// (e.g. "RELIANCE" -> "RELIANCE.NS") once, before any calculator runs.
class SymbolResolver {
public:
    SymbolResolver(MarketDataProvider& provider,
                   const std::string& fallback_suffix = ".NS",
                   const std::string& existence_lookback = "5d");

    ResolvedSymbol resolve(const std::string& input);

    // trim + upper-case
    static std::string normalize(const std::string& input);

private:
    MarketDataProvider& provider_;
    std::string fallback_suffix_;
    std::string existence_lookback_;

    // Ok when the provider has a snapshot or prices for the symbol
    FetchStatus lookup(const std::string& symbol, std::string& error);
};
