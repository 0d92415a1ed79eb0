#pragma once

#include <string>
#include <vector>

#include "etf/country_record.hpp"
#include "etf/panel.hpp"

class TemporalSelector {
   public:
    /**
     * @brief Collapse the panel to one value per (country, indicator).
     *
     * The current-year value wins; otherwise the latest earlier year with a value.
     * Values dated after currentYear are never used.
     *
     * @param panel       Loaded panel.
     * @param indicators  Indicators to keep; every row gets one cell per indicator.
     * @param currentYear Reference year (e.g., 2024).
     * @return One record per country, ordered by country name.
     */
    [[nodiscard]] static CountryTable select(const IndicatorPanel& panel, const std::vector<std::string>& indicators,
                                             int currentYear);
};
