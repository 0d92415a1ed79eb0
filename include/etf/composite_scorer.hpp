#pragma once

#include <string>
#include <vector>

#include "etf/country_record.hpp"

struct ScoredCountry {
    std::string country        = "";
    std::string currency       = "";
    double      compositeScore = 0.0;  // mean z-score across scored indicators
    double      weight         = 0.0;  // share of the basket, (0, 1]
};

struct ScoreResult {
    std::vector<ScoredCountry> rows;

    /**
     * @brief No composite score was positive; all rows were kept
     */
    bool positivityFallback = false;

    /**
     * @brief score / sum(score) was not usable; every row got 1 / n
     */
    bool equalWeightFallback = false;

    /**
     * @brief Requested indicators with no value in any row
     */
    std::vector<std::string> skippedIndicators;
};

class CompositeScorer {
   public:
    /**
     * @brief Score and weight the eligible countries.
     *
     * 1. Median imputation per indicator (a column missing everywhere is skipped).
     * 2. Population z-score per indicator (zero variance -> 0).
     * 3. Composite = mean z-score.
     * 4. Keep composite > 0, or every row when none is positive.
     * 5. weight = score / sum(score) over the kept rows.
     *
     * @param table      Eligible countries.
     * @param indicators Indicators to score.
     * @return Rows in table order; weights sum to 1 and are all > 0.
     */
    [[nodiscard]] static ScoreResult score(const CountryTable& table, const std::vector<std::string>& indicators);

   private:
    /**
     * @brief Normalize scores into weights, with the equal-weight guard.
     * @return true when the equal-weight guard was used.
     */
    static bool normalize(std::vector<ScoredCountry>& rows);
};
