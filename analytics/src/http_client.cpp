#include "http_client.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

HttpClient::HttpClient(int timeout_ms, const std::string& user_agent)
    : timeout_ms_(timeout_ms)
    , user_agent_(user_agent)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string HttpClient::escape(const std::string& value) {
    char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) return value;
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::optional<nlohmann::json> HttpClient::get_json(const std::string& url) {
    return perform(url, nullptr);
}

std::optional<nlohmann::json> HttpClient::post_json(const std::string& url, const nlohmann::json& body) {
    std::string payload = body.dump();
    return perform(url, &payload);
}

std::optional<nlohmann::json> HttpClient::perform(const std::string& url, const std::string* post_body) {
    std::string response_string;
    last_error_.clear();
    last_status_ = 0;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");
    if (!user_agent_.empty()) {
        curl_easy_setopt(curl_, CURLOPT_USERAGENT, user_agent_.c_str());
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (post_body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_);
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &last_status_);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        last_error_ = std::string("request failed: ") + curl_easy_strerror(res);
        spdlog::error("HTTP {} {}", url, last_error_);
        return std::nullopt;
    }

    if (last_status_ < 200 || last_status_ >= 300) {
        last_error_ = "HTTP status " + std::to_string(last_status_);
        spdlog::warn("HTTP {} returned {}", url, last_status_);
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        last_error_ = std::string("invalid JSON: ") + e.what();
        spdlog::error("Failed to parse response from {}: {}", url, e.what());
        return std::nullopt;
    }
}
