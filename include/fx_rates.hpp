#pragma once

#include <map>
#include <string>

struct FxRates {
    /**
     * @brief Base currency the rates are quoted against
     * @example "USD"
     */
    std::string base = "";

    /**
     * @brief Snapshot date, empty for the latest rates
     * @example "2024-03-02"
     */
    std::string date = "";

    /**
     * @brief Units of each currency per 1 unit of base
     * @example {"CAD": 1.35, "EUR": 0.92, "JPY": 149.8}
     */
    std::map<std::string, double> rates;
};
