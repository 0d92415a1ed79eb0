#include "etf/temporal_selector.hpp"

#include <map>
#include <set>
#include <utility>

CountryTable TemporalSelector::select(const IndicatorPanel& panel, const std::vector<std::string>& indicators,
                                      int currentYear) {
    const std::set<std::string> wanted(indicators.begin(), indicators.end());

    // country -> indicator -> (year, value) of the best candidate so far
    std::map<std::string, std::map<std::string, std::pair<int, double>>> best;

    for (const auto& record : panel.records) {
        auto& cells = best[record.country];

        if (!wanted.count(record.indicator) || !record.value || record.year > currentYear) {
            continue;
        }

        auto it = cells.find(record.indicator);
        if (it == cells.end() || record.year > it->second.first) {
            cells[record.indicator] = {record.year, *record.value};
        }
    }

    CountryTable table;
    table.reserve(best.size());

    for (const auto& [country, cells] : best) {
        CountryRecord row;
        row.country = country;
        for (const auto& indicator : indicators) {
            auto it = cells.find(indicator);
            if (it != cells.end()) {
                row.values[indicator] = it->second.second;
            } else {
                row.values[indicator] = std::nullopt;
            }
        }
        table.push_back(std::move(row));
    }

    return table;
}
