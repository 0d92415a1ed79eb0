#pragma once

#include <ctime>
#include <string>

#include "etf/country_record.hpp"
#include "fx_rates.hpp"

class FxJoin {
   public:
    /**
     * @brief Attach FX rates to every row, dropping rows that cannot be priced.
     *
     * Rows whose currency is missing from latest, or quoted at a non-positive rate,
     * are removed and counted. When historical is given, rows with a positive
     * historical rate also get fxRate1y, fxChange and the "fx_change" indicator.
     *
     * @param table      Country table with resolved currencies, updated in place.
     * @param latest     Current rates (units per 1 USD).
     * @param historical Rates 365 days earlier, or nullptr when disabled.
     * @param stats      Receives drop counters.
     */
    static void apply(CountryTable& table, const FxRates& latest, const FxRates* historical, PipelineStats& stats);

    /**
     * @brief UTC date exactly 365 days before now.
     * @example 1709251200 (2024-03-01) -> "2023-03-02"
     */
    [[nodiscard]] static std::string historicalDate(std::time_t now);
};
