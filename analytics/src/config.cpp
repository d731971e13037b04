#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.market_data_base_url = get_env("MARKET_DATA_BASE_URL", "https://query2.finance.yahoo.com");
    cfg.http_user_agent = get_env("HTTP_USER_AGENT", "Mozilla/5.0 (X11; Linux x86_64) equityscout/1.0");
    cfg.http_timeout_ms = get_env_int("HTTP_TIMEOUT_MS", 8000);
    cfg.symbol_fallback_suffix = get_env("SYMBOL_FALLBACK_SUFFIX", ".NS");
    cfg.price_lookback = get_env("PRICE_LOOKBACK", "1y");

    cfg.cache_ttl_seconds = get_env_int("CACHE_TTL_SECONDS", 300);
    cfg.min_request_interval_ms = get_env_int("MIN_REQUEST_INTERVAL_MS", 200);

    cfg.benchmark_return = get_env_double("BENCHMARK_RETURN", 0.10);

    cfg.intraday_sentiment_high = get_env_double("INTRADAY_SENTIMENT_HIGH", 0.6);
    cfg.intraday_sentiment_low = get_env_double("INTRADAY_SENTIMENT_LOW", 0.4);
    cfg.intraday_sentiment_divisor = get_env_double("INTRADAY_SENTIMENT_DIVISOR", 1.0);

    cfg.search_base_url = get_env("SEARCH_BASE_URL", "https://api.tavily.com");
    cfg.search_api_key = get_env("SEARCH_API_KEY");
    cfg.search_max_results = get_env_int("SEARCH_MAX_RESULTS", 3);

    cfg.service_name = get_env("SERVICE_NAME", "equityscout");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (market_data_base_url.empty()) {
        throw std::runtime_error("MARKET_DATA_BASE_URL is required");
    }
    if (http_timeout_ms <= 0) {
        throw std::runtime_error("HTTP_TIMEOUT_MS must be positive");
    }
    if (cache_ttl_seconds < 0 || min_request_interval_ms < 0) {
        throw std::runtime_error("CACHE_TTL_SECONDS and MIN_REQUEST_INTERVAL_MS must not be negative");
    }
    if (intraday_sentiment_divisor == 0.0) {
        throw std::runtime_error("INTRADAY_SENTIMENT_DIVISOR must not be zero");
    }
    if (intraday_sentiment_low > intraday_sentiment_high) {
        throw std::runtime_error("INTRADAY_SENTIMENT_LOW must not exceed INTRADAY_SENTIMENT_HIGH");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Provider: {} (fallback suffix '{}')", market_data_base_url, symbol_fallback_suffix);
    spdlog::info("  Cache TTL: {}s, min request interval: {}ms",
                 cache_ttl_seconds, min_request_interval_ms);

    if (intraday_sentiment_divisor == 1.0) {
        spdlog::warn("Intraday sentiment thresholds ({}/{}) are compared to the raw sentiment score; "
                     "set INTRADAY_SENTIMENT_DIVISOR once the intended scale is confirmed",
                     intraday_sentiment_high, intraday_sentiment_low);
    }
}
