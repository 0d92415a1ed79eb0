#include "etf/health_filter.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include "stats.hpp"

namespace {

HealthCondition atMost(const std::string& indicator, double max) {
    HealthCondition c;
    c.indicator = indicator;
    c.max       = max;
    return c;
}

HealthCondition atLeast(const std::string& indicator, double min) {
    HealthCondition c;
    c.indicator = indicator;
    c.min       = min;
    return c;
}

HealthCondition between(const std::string& indicator, double min, double max) {
    HealthCondition c;
    c.indicator = indicator;
    c.min       = min;
    c.max       = max;
    return c;
}

HealthCondition aboveMedian(const std::string& indicator) {
    HealthCondition c;
    c.indicator   = indicator;
    c.aboveMedian = true;
    return c;
}

}  // namespace

std::string HealthCondition::describe() const {
    std::ostringstream os;
    if (min && max) {
        os << *min << " <= " << indicator << " <= " << *max;
    } else if (min) {
        os << indicator << " >= " << *min;
    } else if (max) {
        os << indicator << " <= " << *max;
    }
    if (aboveMedian) {
        os << (min || max ? ", " : "") << indicator << " >= median";
    }
    return os.str();
}

HealthProfile HealthProfile::strict(const IndicatorMap& map) {
    HealthProfile profile;
    profile.name       = "strict";
    profile.conditions = {
        atMost(map.unemployment, 8.0),       // labor market slack
        atMost(map.governmentDebt, 80.0),    // fiscal headroom
        between(map.inflation, 0.0, 5.0),    // price stability, no deflation
        atLeast(map.currentAccount, -3.0),   // external balance
        atMost(map.externalDebt, 60.0),      // foreign liabilities
        aboveMedian(map.gdp),                // size
        aboveMedian(map.exports),            // export momentum
    };
    return profile;
}

HealthProfile HealthProfile::relaxed(const IndicatorMap& map) {
    HealthProfile profile;
    profile.name       = "relaxed";
    profile.conditions = {
        atMost(map.unemployment, 12.0),
        atMost(map.governmentDebt, 120.0),
        between(map.inflation, -1.0, 10.0),
        atLeast(map.currentAccount, -6.0),
    };
    return profile;
}

std::vector<std::string> HealthProfile::indicators() const {
    std::vector<std::string> result;
    for (const auto& c : conditions) {
        if (std::find(result.begin(), result.end(), c.indicator) == result.end()) {
            result.push_back(c.indicator);
        }
    }
    return result;
}

std::map<std::string, double> HealthFilter::medians(const CountryTable& table, const HealthProfile& profile) {
    std::map<std::string, double> result;
    for (const auto& c : profile.conditions) {
        if (!c.aboveMedian || result.count(c.indicator)) {
            continue;
        }

        std::vector<double> column;
        for (const auto& row : table) {
            if (const auto v = row.value(c.indicator)) {
                column.push_back(*v);
            }
        }

        if (const auto m = stats::median(std::move(column))) {
            result[c.indicator] = *m;
        }
    }
    return result;
}

bool HealthFilter::passes(const CountryRecord& row, const HealthCondition& condition,
                          const std::map<std::string, double>& medians) {
    const auto v = row.value(condition.indicator);
    if (!v) {
        return false;
    }
    if (condition.min && *v < *condition.min) {
        return false;
    }
    if (condition.max && *v > *condition.max) {
        return false;
    }
    if (condition.aboveMedian) {
        auto it = medians.find(condition.indicator);
        if (it == medians.end() || *v < it->second) {
            return false;
        }
    }
    return true;
}

CountryTable HealthFilter::apply(const CountryTable& table, const HealthProfile& profile, PipelineStats& stats) {
    const auto medianOf = medians(table, profile);

    CountryTable eligible;
    for (const auto& row : table) {
        const bool ok = std::all_of(profile.conditions.begin(), profile.conditions.end(),
                                    [&](const HealthCondition& c) { return passes(row, c, medianOf); });
        if (ok) {
            eligible.push_back(row);
        }
    }

    if (eligible.empty()) {
        std::cerr << "  [WARN] health profile '" << profile.name << "' matched no country, filter skipped" << std::endl;
        stats.healthFilterSkipped = true;
        stats.eligible            = table.size();
        return table;
    }

    stats.eligible = eligible.size();
    return eligible;
}
