#include "etf/composite_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>

#include "stats.hpp"

ScoreResult CompositeScorer::score(const CountryTable& table, const std::vector<std::string>& indicators) {
    ScoreResult result;
    if (table.empty()) {
        return result;
    }

    const std::size_t n = table.size();

    std::vector<double> composite(n, 0.0);
    std::size_t         scored = 0;

    for (const auto& indicator : indicators) {
        std::vector<std::optional<double>> column;
        column.reserve(n);
        for (const auto& row : table) {
            column.push_back(row.value(indicator));
        }

        /* Imputation */
        const auto median = stats::median(stats::present(column));
        if (!median) {
            std::cerr << "  [WARN] indicator " << indicator << " has no values, excluded from scoring" << std::endl;
            result.skippedIndicators.push_back(indicator);
            continue;
        }

        std::vector<double> filled;
        filled.reserve(n);
        for (const auto& v : column) {
            filled.push_back(v ? *v : *median);
        }

        /* Standardization */
        const auto z = stats::zScores(filled);
        for (std::size_t i = 0; i < n; ++i) {
            composite[i] += z[i];
        }
        scored++;
    }

    std::vector<ScoredCountry> all;
    all.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        ScoredCountry row;
        row.country        = table[i].country;
        row.currency       = table[i].currency;
        row.compositeScore = scored > 0 ? composite[i] / static_cast<double>(scored) : 0.0;
        all.push_back(row);
    }

    /* Positivity filter */
    for (const auto& row : all) {
        if (row.compositeScore > 0.0) {
            result.rows.push_back(row);
        }
    }
    if (result.rows.empty()) {
        std::cerr << "  [WARN] no positive composite score, weighting all " << n << " countries" << std::endl;
        result.positivityFallback = true;
        result.rows               = std::move(all);
    }

    /* Weight normalization */
    result.equalWeightFallback = normalize(result.rows);
    if (result.equalWeightFallback) {
        std::cerr << "  [WARN] composite scores cannot be normalized, using equal weights" << std::endl;
    }

    return result;
}

bool CompositeScorer::normalize(std::vector<ScoredCountry>& rows) {
    double sum = 0.0;
    for (const auto& row : rows) {
        sum += row.compositeScore;
    }

    // Every score must share the strict sign of the sum, else some weight would be <= 0.
    const bool usable = std::abs(sum) > 1e-12 && std::all_of(rows.begin(), rows.end(), [sum](const ScoredCountry& r) {
                            return sum > 0.0 ? r.compositeScore > 0.0 : r.compositeScore < 0.0;
                        });

    if (usable) {
        for (auto& row : rows) {
            row.weight = row.compositeScore / sum;
        }
        return false;
    }

    for (auto& row : rows) {
        row.weight = 1.0 / static_cast<double>(rows.size());
    }
    return true;
}
