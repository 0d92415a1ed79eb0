#include "etf/indicator_map.hpp"

#include "etf/country_record.hpp"

std::optional<std::string> IndicatorMap::byName(const std::string& logical) const {
    if (logical == "gdp") {
        return gdp;
    }
    if (logical == "unemployment") {
        return unemployment;
    }
    if (logical == "government_debt") {
        return governmentDebt;
    }
    if (logical == "inflation") {
        return inflation;
    }
    if (logical == "current_account") {
        return currentAccount;
    }
    if (logical == "external_debt") {
        return externalDebt;
    }
    if (logical == "exports") {
        return exports;
    }
    if (logical == kFxChangeIndicator) {
        return std::string(kFxChangeIndicator);
    }
    return std::nullopt;
}

std::vector<std::string> IndicatorMap::all() const {
    return {gdp, unemployment, governmentDebt, inflation, currentAccount, externalDebt, exports};
}
