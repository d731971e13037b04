#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 8000, const std::string& user_agent = "");
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // nullopt on transport error, non-2xx status or unparseable body;
    // last_error() then describes what went wrong
    std::optional<nlohmann::json> get_json(const std::string& url);
    std::optional<nlohmann::json> post_json(const std::string& url, const nlohmann::json& body);

    const std::string& last_error() const { return last_error_; }
    long last_status() const { return last_status_; }

    std::string escape(const std::string& value);

private:
    int timeout_ms_;
    std::string user_agent_;
    CURL* curl_;
    std::string last_error_;
    long last_status_ = 0;

    std::optional<nlohmann::json> perform(const std::string& url, const std::string* post_body);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
