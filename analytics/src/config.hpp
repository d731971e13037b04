#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Market data provider
    std::string market_data_base_url;
    std::string http_user_agent;
    int http_timeout_ms;
    std::string symbol_fallback_suffix;
    std::string price_lookback;

    // Provider decorator
    int cache_ttl_seconds;        // 0 disables the cache
    int min_request_interval_ms;  // spacing between outbound provider calls

    // Scoring
    double benchmark_return;

    // Intraday sentiment override. The sentiment scorer produces an unbounded
    // integer; the override thresholds are on a 0-1 scale. The divisor maps one
    // onto the other and defaults to 1.0 (thresholds compared to the raw score).
    double intraday_sentiment_high;
    double intraday_sentiment_low;
    double intraday_sentiment_divisor;

    // Web search
    std::string search_base_url;
    std::string search_api_key;
    int search_max_results;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
