#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace util {
    // UTC, second precision: 2024-05-01T09:15:00Z
    std::string current_iso8601();

    std::string to_lower(const std::string& str);
    std::string to_upper(const std::string& str);
    std::string trim(const std::string& str);
    bool ends_with(const std::string& str, const std::string& suffix);

    // Half away from zero, like printf rounding of the decimal value
    double round_to(double value, int decimals);

    double clamp(double value, double lo, double hi);

    double mean(const std::vector<double>& values);
    double population_stdev(const std::vector<double>& values);

    // Pearson r; nullopt on size mismatch, <2 samples or zero variance
    std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y);
}
