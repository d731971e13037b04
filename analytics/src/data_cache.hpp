#pragma once

#include "market_data.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// Decorates a provider with a TTL cache keyed by (symbol, data kind) and
// a minimum spacing between outbound calls. Only successful fetches are cached;
// expired entries are swept on every insert.
class CachingProvider : public MarketDataProvider {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // ttl_seconds == 0 disables caching; min_interval_ms == 0 disables spacing
    CachingProvider(std::shared_ptr<MarketDataProvider> inner,
                    int ttl_seconds = 300,
                    int min_interval_ms = 200,
                    Clock clock = nullptr,
                    Sleeper sleeper = nullptr);

    FetchResult<PriceSeries> get_price_history(const std::string& symbol,
                                               const std::string& lookback) override;
    FetchResult<Statements> get_statements(const std::string& symbol) override;
    FetchResult<Snapshot> get_snapshot(const std::string& symbol) override;

    size_t upstream_calls() const { return upstream_calls_; }
    size_t cached_entries() const;
    void clear();

private:
    template <typename T>
    struct Entry {
        FetchResult<T> result;
        std::chrono::steady_clock::time_point cached_at;
    };

    std::shared_ptr<MarketDataProvider> inner_;
    int ttl_seconds_;
    std::chrono::milliseconds min_interval_;
    Clock clock_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry<PriceSeries>> prices_;
    std::unordered_map<std::string, Entry<Statements>> statements_;
    std::unordered_map<std::string, Entry<Snapshot>> snapshots_;

    bool has_last_call_ = false;
    std::chrono::steady_clock::time_point last_call_;
    size_t upstream_calls_ = 0;

    template <typename T>
    bool is_fresh(const Entry<T>& entry) const;

    template <typename T>
    void evict_expired(std::unordered_map<std::string, Entry<T>>& cache);

    template <typename T, typename Fetch>
    FetchResult<T> get_or_fetch(std::unordered_map<std::string, Entry<T>>& cache,
                                const std::string& key, Fetch fetch);

    void wait_for_slot();
};
