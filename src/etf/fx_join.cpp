#include "etf/fx_join.hpp"

#include <iostream>

void FxJoin::apply(CountryTable& table, const FxRates& latest, const FxRates* historical, PipelineStats& stats) {
    CountryTable priced;
    priced.reserve(table.size());

    for (auto& row : table) {
        auto it = latest.rates.find(row.currency);
        if (it == latest.rates.end()) {
            stats.droppedNoRate++;
            continue;
        }
        if (!(it->second > 0.0)) {
            std::cerr << "  [WARN] non-positive " << row.currency << " rate (" << it->second << "), dropping "
                      << row.country << std::endl;
            stats.droppedBadRate++;
            continue;
        }

        row.fxRate = it->second;

        if (historical) {
            row.values[kFxChangeIndicator] = std::nullopt;

            auto past = historical->rates.find(row.currency);
            if (past != historical->rates.end() && past->second > 0.0) {
                row.fxRate1y                   = past->second;
                row.fxChange                   = (it->second - past->second) / past->second;
                row.values[kFxChangeIndicator] = row.fxChange;
            }
        }

        priced.push_back(std::move(row));
    }

    table = std::move(priced);
}

std::string FxJoin::historicalDate(std::time_t now) {
    const std::time_t then = now - static_cast<std::time_t>(365) * 24 * 60 * 60;

    std::tm tm{};
    gmtime_r(&then, &tm);

    char buf[11];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return std::string(buf);
}
