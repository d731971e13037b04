#pragma once

#include <string>
#include <vector>

// Statement row names, in lookup priority order. Providers rename rows
// between releases, so several spellings are tried.
namespace line_items {
    inline const std::vector<std::string> TOTAL_DEBT = {
        "Total Debt", "Short Long Term Debt", "Long Term Debt"
    };
    inline const std::vector<std::string> TOTAL_EQUITY = {
        "Total Stockholder Equity", "Total Equity Gross Minority Interest", "Stockholders Equity"
    };
    inline const std::vector<std::string> TOTAL_ASSETS = {"Total Assets"};
    inline const std::vector<std::string> TOTAL_LIABILITIES = {
        "Total Liab", "Total Liabilities Net Minority Interest"
    };

    inline const std::vector<std::string> TOTAL_REVENUE = {"Total Revenue"};
    inline const std::vector<std::string> NET_INCOME = {"Net Income"};
    inline const std::vector<std::string> EBITDA = {"Ebitda", "EBITDA"};

    inline const std::vector<std::string> OPERATING_CASH_FLOW = {
        "Total Cash From Operating Activities", "Operating Cash Flow"
    };
    inline const std::vector<std::string> CAPITAL_EXPENDITURE = {
        "Capital Expenditures", "Capital Expenditure"
    };
    inline const std::vector<std::string> FREE_CASH_FLOW = {"Free Cash Flow"};
}
