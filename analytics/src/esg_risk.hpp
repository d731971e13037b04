#pragma once

#include "market_data.hpp"
#include <optional>
#include <string>
#include <vector>

struct EsgRiskResult {
    std::string symbol;

    int esg_score = 0;   // higher is better
    std::vector<std::string> esg_reasons;
    int risk_score = 0;  // higher is riskier
    std::vector<std::string> risk_reasons;

    std::optional<double> beta;
    std::optional<double> debt_to_equity;
    std::optional<double> current_ratio;
    std::optional<double> quick_ratio;
    std::optional<std::string> sector;
    std::optional<std::string> industry;
    std::optional<double> audit_risk;
    std::optional<double> board_risk;
    std::optional<double> compensation_risk;
    std::optional<double> shareholder_rights_risk;
    std::optional<double> overall_risk;

    std::optional<std::string> error;
};

// Keyword and threshold heuristics only; no ESG data vendor is consulted
class EsgRiskScorer {
public:
    static EsgRiskResult analyze(const std::string& symbol, const Snapshot& snapshot);

private:
    static void score_esg(EsgRiskResult& result, const Snapshot& snapshot);
    static void score_risk(EsgRiskResult& result);
};
