#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Indicator name under which the trailing 1-year FX change is scored.
 */
inline constexpr const char* kFxChangeIndicator = "fx_change";

/**
 * @brief One country after temporal collapse, enriched by the currency and FX stages.
 */
struct CountryRecord {
    /**
     * @example "Canada"
     */
    std::string country = "";

    /**
     * @brief Selected value per indicator, std::nullopt when no usable history exists
     * @example {"LUR": 5.4, "PCPIPCH": 3.9, "fx_change": -0.012}
     */
    std::map<std::string, std::optional<double>> values;

    /**
     * @brief ISO 4217 code, empty until resolved
     * @example "CAD"
     */
    std::string currency = "";

    /**
     * @brief Units of currency per 1 USD, strictly positive when present
     * @example 1.35
     */
    std::optional<double> fxRate;

    /**
     * @brief Same rate 365 days earlier
     */
    std::optional<double> fxRate1y;

    /**
     * @brief (fxRate - fxRate1y) / fxRate1y
     */
    std::optional<double> fxChange;

    [[nodiscard]] std::optional<double> value(const std::string& indicator) const {
        auto it = values.find(indicator);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

using CountryTable = std::vector<CountryRecord>;

/**
 * @brief Attrition and fallback counters of one pipeline run.
 */
struct PipelineStats {
    std::size_t panelCountries    = 0;
    std::size_t droppedNoCurrency = 0;
    std::size_t droppedNoRate     = 0;
    std::size_t droppedBadRate    = 0;
    std::size_t eligible          = 0;

    bool healthFilterSkipped = false;
    bool positivityFallback  = false;
    bool equalWeightFallback = false;

    /**
     * @brief Scoring columns left out because no country had a value
     */
    std::vector<std::string> skippedIndicators;
};
