#include "etf/valuation.hpp"

#include <algorithm>
#include <iostream>

#include "stats.hpp"

const CountryRecord* Valuation::find(const CountryTable& wide, const std::string& country) {
    auto it = std::find_if(wide.begin(), wide.end(), [&country](const CountryRecord& r) { return r.country == country; });
    return it == wide.end() ? nullptr : &*it;
}

std::optional<double> Valuation::usdValue(const std::vector<ScoredCountry>& weights, const CountryTable& wide) {
    double value = 0.0;
    for (const auto& w : weights) {
        const auto* row = find(wide, w.country);
        if (!row || !row->fxRate || !(*row->fxRate > 0.0)) {
            std::cerr << "Error: no FX rate for weighted country " << w.country << std::endl;
            return std::nullopt;
        }
        value += w.weight * (1.0 / *row->fxRate);
    }
    return value;
}

std::vector<TopRow> Valuation::topN(const std::vector<ScoredCountry>& weights, const CountryTable& wide,
                                    const IndicatorMap& indicators, std::size_t n) {
    std::vector<ScoredCountry> sorted = weights;
    std::sort(sorted.begin(), sorted.end(), [](const ScoredCountry& a, const ScoredCountry& b) {
        if (a.weight != b.weight) {
            return a.weight > b.weight;
        }
        return a.country < b.country;
    });

    if (sorted.size() > n) {
        sorted.resize(n);
    }

    std::vector<TopRow> rows;
    rows.reserve(sorted.size());
    for (const auto& s : sorted) {
        TopRow row;
        row.country   = s.country;
        row.currency  = s.currency;
        row.weightPct = stats::round(s.weight * 100.0, 2);

        if (const auto* record = find(wide, s.country)) {
            if (record->fxRate && *record->fxRate > 0.0) {
                row.usdPerUnit = stats::round(1.0 / *record->fxRate, 2);
            }
            row.gdp          = record->value(indicators.gdp);
            row.unemployment = record->value(indicators.unemployment);
            row.inflation    = record->value(indicators.inflation);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}
