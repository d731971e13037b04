#include "config.hpp"
#include "yahoo_client.hpp"
#include "data_cache.hpp"
#include "pipeline.hpp"
#include "report.hpp"
#include "search_client.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void setup_logging(const std::string& service_name, const std::string& log_level) {
    // stdout carries the JSON reports
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialized at level: {}", log_level);
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--intraday | --info] SYMBOL...\n"
              << "       " << argv0 << " --search QUERY\n";
}

// RAII for curl_global_init / curl_global_cleanup
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

} // namespace

int main(int argc, char** argv) {
    bool intraday = false;
    bool info = false;
    std::string search_query;
    std::vector<std::string> symbols;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--intraday") {
            intraday = true;
        } else if (arg == "--info") {
            info = true;
        } else if (arg == "--search") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            search_query = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            symbols.push_back(arg);
        }
    }

    if ((symbols.empty() && search_query.empty()) || (intraday && info)) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        Config config = Config::from_env();
        setup_logging(config.service_name, config.log_level);
        config.validate();

        CurlGlobal curl_global;

        if (!search_query.empty()) {
            auto client = std::make_shared<HttpSearchClient>(
                config.search_base_url, config.search_api_key, config.http_timeout_ms);
            BackoffSearch search(client, config.search_max_results);
            std::cout << search.run(search_query) << std::endl;
            return 0;
        }

        auto yahoo = std::make_shared<YahooClient>(
            config.market_data_base_url, config.http_timeout_ms, config.http_user_agent);
        CachingProvider provider(yahoo, config.cache_ttl_seconds, config.min_request_interval_ms);
        AnalysisPipeline pipeline(provider, config);

        bool all_ok = true;
        for (const auto& symbol : symbols) {
            nlohmann::json out;
            if (info) {
                auto result = pipeline.company_info(symbol);
                all_ok = all_ok && result.ok();
                out = to_json(result);
            } else if (intraday) {
                auto result = pipeline.intraday(symbol);
                all_ok = all_ok && result.ok();
                out = to_json(result);
            } else {
                auto result = pipeline.comprehensive(symbol);
                all_ok = all_ok && result.ok();
                out = to_json(result);
            }
            std::cout << out.dump(2) << std::endl;
        }

        spdlog::info("Analyzed {} symbol(s), {} upstream provider call(s)",
                     symbols.size(), provider.upstream_calls());

        return all_ok ? 0 : 1;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        std::cout << nlohmann::json{{"error", e.what()}}.dump(2) << std::endl;
        return 1;
    }
}
