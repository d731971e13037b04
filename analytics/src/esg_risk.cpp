#include "esg_risk.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

EsgRiskResult EsgRiskScorer::analyze(const std::string& symbol, const Snapshot& snapshot) {
    EsgRiskResult result;
    result.symbol = symbol;

    result.beta = snapshot.beta;
    result.debt_to_equity = snapshot.debt_to_equity;
    result.current_ratio = snapshot.current_ratio;
    result.quick_ratio = snapshot.quick_ratio;
    result.sector = snapshot.sector;
    result.industry = snapshot.industry;
    result.audit_risk = snapshot.audit_risk;
    result.board_risk = snapshot.board_risk;
    result.compensation_risk = snapshot.compensation_risk;
    result.shareholder_rights_risk = snapshot.shareholder_rights_risk;
    result.overall_risk = snapshot.overall_risk;

    score_esg(result, snapshot);
    score_risk(result);

    spdlog::debug("ESG/risk {}: esg={} risk={}", symbol, result.esg_score, result.risk_score);

    return result;
}

void EsgRiskScorer::score_esg(EsgRiskResult& result, const Snapshot& snapshot) {
    // Environmental: sector keyword match
    std::string sector = util::to_lower(snapshot.sector.value_or(""));
    auto contains = [&sector](const char* word) {
        return sector.find(word) != std::string::npos;
    };

    if (contains("energy") || contains("oil") || contains("gas")) {
        result.esg_score -= 5;
        result.esg_reasons.push_back("Energy sector - environmental concerns");
    } else if (contains("technology") || contains("software")) {
        result.esg_score += 5;
        result.esg_reasons.push_back("Technology sector - lower environmental impact");
    }

    // Social
    if (snapshot.employees && *snapshot.employees > 10000) {
        result.esg_score += 3;
        result.esg_reasons.push_back("Large employer - positive social impact");
    }

    // Governance
    if (snapshot.audit_risk) {
        if (*snapshot.audit_risk < 0.1) {
            result.esg_score += 5;
            result.esg_reasons.push_back("Low audit risk - good governance");
        } else if (*snapshot.audit_risk > 0.3) {
            result.esg_score -= 5;
            result.esg_reasons.push_back("High audit risk - governance concerns");
        }
    }
}

void EsgRiskScorer::score_risk(EsgRiskResult& result) {
    if (result.beta) {
        if (*result.beta > 1.5) {
            result.risk_score += 10;
            result.risk_reasons.push_back("High volatility (beta > 1.5)");
        } else if (*result.beta < 0.8) {
            result.risk_score -= 5;
            result.risk_reasons.push_back("Low volatility (beta < 0.8)");
        }
    }

    if (result.debt_to_equity) {
        if (*result.debt_to_equity > 1.0) {
            result.risk_score += 10;
            result.risk_reasons.push_back("High leverage (D/E > 1.0)");
        } else if (*result.debt_to_equity < 0.3) {
            result.risk_score -= 5;
            result.risk_reasons.push_back("Low leverage (D/E < 0.3)");
        }
    }

    if (result.current_ratio) {
        if (*result.current_ratio < 1.0) {
            result.risk_score += 5;
            result.risk_reasons.push_back("Low liquidity (current ratio < 1.0)");
        } else if (*result.current_ratio > 2.0) {
            result.risk_score -= 3;
            result.risk_reasons.push_back("High liquidity (current ratio > 2.0)");
        }
    }
}
