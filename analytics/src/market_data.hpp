#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>

// Closing prices, index 0 = most recent
using PriceSeries = std::vector<double>;

// One financial statement: line item -> per-period values (period 0 = latest).
// A reported-but-empty cell is std::nullopt; an unreported line item has no key.
struct Statement {
    std::map<std::string, std::vector<std::optional<double>>> rows;

    bool empty() const { return rows.empty(); }
    bool has(const std::string& item) const { return rows.count(item) > 0; }

    // First candidate row present wins; returns its latest non-null value
    std::optional<double> latest(const std::vector<std::string>& candidates) const;

    // Non-null values of the first candidate row present, latest first
    std::vector<double> series(const std::vector<std::string>& candidates) const;
};

struct Statements {
    Statement income;
    Statement balance;
    Statement cashflow;

    bool empty() const { return income.empty() && balance.empty() && cashflow.empty(); }
};

struct Snapshot {
    std::optional<std::string> symbol;
    std::optional<std::string> name;
    std::optional<std::string> currency;
    std::optional<std::string> sector;
    std::optional<std::string> industry;

    std::optional<double> current_price;
    std::optional<double> market_cap;
    std::optional<double> enterprise_value;
    std::optional<double> trailing_pe;
    std::optional<double> trailing_eps;
    std::optional<double> fifty_two_week_low;
    std::optional<double> fifty_two_week_high;

    // Risk / balance-sheet ratios
    std::optional<double> beta;
    std::optional<double> debt_to_equity;
    std::optional<double> current_ratio;
    std::optional<double> quick_ratio;
    std::optional<double> employees;

    // Cash flow as reported in the summary (not the statements)
    std::optional<double> operating_cashflow;
    std::optional<double> free_cashflow;
    std::optional<double> ebitda;

    // Analyst coverage
    std::optional<double> recommendation_mean;
    std::optional<std::string> recommendation_key;
    std::optional<double> analyst_count;
    std::optional<double> target_high_price;
    std::optional<double> target_low_price;
    std::optional<double> target_median_price;

    // Trading activity
    std::optional<double> volume;
    std::optional<double> average_volume;

    // Governance (1-10 scale upstream)
    std::optional<double> audit_risk;
    std::optional<double> board_risk;
    std::optional<double> compensation_risk;
    std::optional<double> shareholder_rights_risk;
    std::optional<double> overall_risk;

    // True when the provider returned a record with any usable price or name
    bool has_data() const { return current_price.has_value() || name.has_value(); }
};

enum class FetchStatus {
    Ok,
    NoData,          // provider answered, but there is nothing for this symbol
    ProviderFailure  // transport, HTTP or parse failure
};

// Result-or-error for a provider call
template <typename T>
struct FetchResult {
    FetchStatus status = FetchStatus::NoData;
    T data{};
    std::string error;

    bool ok() const { return status == FetchStatus::Ok; }

    static FetchResult success(T value) {
        FetchResult r;
        r.status = FetchStatus::Ok;
        r.data = std::move(value);
        return r;
    }

    static FetchResult no_data(const std::string& why) {
        FetchResult r;
        r.status = FetchStatus::NoData;
        r.error = why;
        return r;
    }

    static FetchResult failure(const std::string& why) {
        FetchResult r;
        r.status = FetchStatus::ProviderFailure;
        r.error = why;
        return r;
    }
};

std::string fetch_status_string(FetchStatus status);

// Capability interface over a market data source
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    // lookback uses the provider's range notation, e.g. "1y"
    virtual FetchResult<PriceSeries> get_price_history(const std::string& symbol,
                                                       const std::string& lookback) = 0;
    virtual FetchResult<Statements> get_statements(const std::string& symbol) = 0;
    virtual FetchResult<Snapshot> get_snapshot(const std::string& symbol) = 0;
};
