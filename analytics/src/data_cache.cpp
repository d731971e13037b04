#include "data_cache.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

CachingProvider::CachingProvider(std::shared_ptr<MarketDataProvider> inner,
                                 int ttl_seconds,
                                 int min_interval_ms,
                                 Clock clock,
                                 Sleeper sleeper)
    : inner_(std::move(inner))
    , ttl_seconds_(ttl_seconds)
    , min_interval_(min_interval_ms)
    , clock_(std::move(clock))
    , sleeper_(std::move(sleeper))
{
    if (!inner_) {
        throw std::invalid_argument("CachingProvider requires an upstream provider");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

template <typename T>
bool CachingProvider::is_fresh(const Entry<T>& entry) const {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(clock_() - entry.cached_at).count();
    return age < ttl_seconds_;
}

template <typename T>
void CachingProvider::evict_expired(std::unordered_map<std::string, Entry<T>>& cache) {
    for (auto it = cache.begin(); it != cache.end();) {
        if (is_fresh(it->second)) {
            ++it;
        } else {
            it = cache.erase(it);
        }
    }
}

void CachingProvider::wait_for_slot() {
    auto now = clock_();
    if (has_last_call_ && min_interval_.count() > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_call_);
        if (elapsed < min_interval_) {
            auto wait = min_interval_ - elapsed;
            spdlog::debug("Rate limit: waiting {}ms before next provider call", wait.count());
            sleeper_(wait);
            now = clock_();
        }
    }
    last_call_ = now;
    has_last_call_ = true;
    upstream_calls_++;
}

template <typename T, typename Fetch>
FetchResult<T> CachingProvider::get_or_fetch(std::unordered_map<std::string, Entry<T>>& cache,
                                             const std::string& key, Fetch fetch) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ttl_seconds_ > 0) {
        auto it = cache.find(key);
        if (it != cache.end()) {
            if (is_fresh(it->second)) {
                spdlog::debug("Cache hit: {}", key);
                return it->second.result;
            }
            cache.erase(it);
        }
    }

    wait_for_slot();
    FetchResult<T> result = fetch();

    if (ttl_seconds_ > 0 && result.ok()) {
        evict_expired(prices_);
        evict_expired(statements_);
        evict_expired(snapshots_);
        cache[key] = Entry<T>{result, clock_()};
    }

    return result;
}

FetchResult<PriceSeries> CachingProvider::get_price_history(const std::string& symbol,
                                                            const std::string& lookback) {
    return get_or_fetch(prices_, symbol + ":prices:" + lookback, [&] {
        return inner_->get_price_history(symbol, lookback);
    });
}

FetchResult<Statements> CachingProvider::get_statements(const std::string& symbol) {
    return get_or_fetch(statements_, symbol + ":statements", [&] {
        return inner_->get_statements(symbol);
    });
}

FetchResult<Snapshot> CachingProvider::get_snapshot(const std::string& symbol) {
    return get_or_fetch(snapshots_, symbol + ":snapshot", [&] {
        return inner_->get_snapshot(symbol);
    });
}

size_t CachingProvider::cached_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prices_.size() + statements_.size() + snapshots_.size();
}

void CachingProvider::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_.clear();
    statements_.clear();
    snapshots_.clear();
}
