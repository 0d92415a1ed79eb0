#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "etf/country_record.hpp"
#include "etf/indicator_map.hpp"

/**
 * @brief One eligibility predicate over a single indicator.
 *
 * Bounds are inclusive. aboveMedian requires value >= median of the column
 * over the table being filtered. A missing value never passes.
 */
struct HealthCondition {
    std::string           indicator = "";
    std::optional<double> min;
    std::optional<double> max;
    bool                  aboveMedian = false;

    [[nodiscard]] std::string describe() const;
};

struct HealthProfile {
    std::string                  name = "";
    std::vector<HealthCondition> conditions;

    /**
     * @brief Seven conditions: unemployment <= 8, government debt <= 80,
     *        0 <= inflation <= 5, current account >= -3, external debt <= 60,
     *        GDP and exports at or above their medians.
     */
    [[nodiscard]] static HealthProfile strict(const IndicatorMap& map);

    /**
     * @brief Four conditions: unemployment <= 12, government debt <= 120,
     *        -1 <= inflation <= 10, current account >= -6.
     */
    [[nodiscard]] static HealthProfile relaxed(const IndicatorMap& map);

    /**
     * @brief Indicators referenced by the conditions, first occurrence order.
     */
    [[nodiscard]] std::vector<std::string> indicators() const;
};

class HealthFilter {
   public:
    /**
     * @brief Keep the rows passing every condition of the profile.
     *
     * When no row passes, the input is returned unchanged, a warning is logged
     * and stats.healthFilterSkipped is set.
     */
    [[nodiscard]] static CountryTable apply(const CountryTable& table, const HealthProfile& profile,
                                            PipelineStats& stats);

    /**
     * @brief Median of every column referenced by an aboveMedian condition.
     */
    [[nodiscard]] static std::map<std::string, double> medians(const CountryTable& table, const HealthProfile& profile);

    [[nodiscard]] static bool passes(const CountryRecord& row, const HealthCondition& condition,
                                     const std::map<std::string, double>& medians);
};
