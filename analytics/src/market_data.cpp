#include "market_data.hpp"

std::optional<double> Statement::latest(const std::vector<std::string>& candidates) const {
    for (const auto& name : candidates) {
        auto it = rows.find(name);
        if (it == rows.end()) continue;

        for (const auto& v : it->second) {
            if (v.has_value()) return v;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::vector<double> Statement::series(const std::vector<std::string>& candidates) const {
    std::vector<double> values;

    for (const auto& name : candidates) {
        auto it = rows.find(name);
        if (it == rows.end()) continue;

        for (const auto& v : it->second) {
            if (v.has_value()) values.push_back(*v);
        }
        break;
    }

    return values;
}

std::string fetch_status_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::Ok: return "ok";
        case FetchStatus::NoData: return "no_data";
        case FetchStatus::ProviderFailure: return "provider_failure";
        default: return "unknown";
    }
}
