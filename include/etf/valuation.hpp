#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "etf/composite_scorer.hpp"
#include "etf/country_record.hpp"
#include "etf/indicator_map.hpp"

struct TopRow {
    std::string country  = "";
    std::string currency = "";

    /**
     * @brief Weight in percent, 2 decimals
     * @example 12.34
     */
    double weightPct = 0.0;

    /**
     * @brief USD bought by one unit of the currency (1 / fxRate), 2 decimals
     */
    double usdPerUnit = 0.0;

    std::optional<double> gdp;
    std::optional<double> unemployment;
    std::optional<double> inflation;
};

class Valuation {
   public:
    /**
     * @brief USD value of one basket unit: sum(weight / fxRate).
     * @param weights Scored countries.
     * @param wide    Enriched table holding the FX rates.
     * @return Value, or std::nullopt when a weighted country has no positive rate.
     */
    [[nodiscard]] static std::optional<double> usdValue(const std::vector<ScoredCountry>& weights,
                                                        const CountryTable&               wide);

    /**
     * @brief The n heaviest countries, weight descending, ties by country name ascending.
     */
    [[nodiscard]] static std::vector<TopRow> topN(const std::vector<ScoredCountry>& weights, const CountryTable& wide,
                                                  const IndicatorMap& indicators, std::size_t n = 10);

   private:
    [[nodiscard]] static const CountryRecord* find(const CountryTable& wide, const std::string& country);
};
