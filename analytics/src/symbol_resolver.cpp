#include "symbol_resolver.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

SymbolResolver::SymbolResolver(MarketDataProvider& provider,
                               const std::string& fallback_suffix,
                               const std::string& existence_lookback)
    : provider_(provider)
    , fallback_suffix_(util::to_upper(util::trim(fallback_suffix)))
    , existence_lookback_(existence_lookback) {}

std::string SymbolResolver::normalize(const std::string& input) {
    return util::to_upper(util::trim(input));
}

FetchStatus SymbolResolver::lookup(const std::string& symbol, std::string& error) {
    auto snapshot = provider_.get_snapshot(symbol);
    if (snapshot.ok() && snapshot.data.has_data()) {
        return FetchStatus::Ok;
    }

    auto prices = provider_.get_price_history(symbol, existence_lookback_);
    if (prices.ok() && !prices.data.empty()) {
        return FetchStatus::Ok;
    }

    if (snapshot.status == FetchStatus::ProviderFailure) {
        error = snapshot.error;
        return FetchStatus::ProviderFailure;
    }
    if (prices.status == FetchStatus::ProviderFailure) {
        error = prices.error;
        return FetchStatus::ProviderFailure;
    }

    error = "No data found for symbol " + symbol;
    return FetchStatus::NoData;
}

ResolvedSymbol SymbolResolver::resolve(const std::string& input) {
    ResolvedSymbol out;
    out.requested = normalize(input);
    out.symbol = out.requested;

    if (out.requested.empty()) {
        out.status = FetchStatus::NoData;
        out.error = "Empty symbol";
        return out;
    }

    std::string error;
    out.status = lookup(out.requested, error);
    if (out.ok()) {
        return out;
    }

    if (fallback_suffix_.empty() || util::ends_with(out.requested, fallback_suffix_)) {
        out.error = error;
        return out;
    }

    std::string candidate = out.requested + fallback_suffix_;
    spdlog::debug("No data for {}, retrying as {}", out.requested, candidate);

    std::string fallback_error;
    FetchStatus fallback_status = lookup(candidate, fallback_error);
    if (fallback_status == FetchStatus::Ok) {
        out.symbol = candidate;
        out.used_fallback = true;
        out.status = FetchStatus::Ok;
        out.error.clear();
        spdlog::info("Resolved {} to {}", out.requested, candidate);
        return out;
    }

    // A provider outage on either attempt outranks "not found"
    if (out.status == FetchStatus::ProviderFailure) {
        out.error = error;
    } else if (fallback_status == FetchStatus::ProviderFailure) {
        out.status = FetchStatus::ProviderFailure;
        out.error = fallback_error;
    } else {
        out.error = "No data found for symbol " + out.requested + " or " + candidate;
    }

    spdlog::warn("Could not resolve {}: {}", out.requested, out.error);
    return out;
}
