#include <gtest/gtest.h>
#include "etf/etf_pipeline.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <numeric>

namespace {

const IndicatorMap kMap;

void addCountry(IndicatorPanel& panel, const std::string& name, double unemployment, double debt, double inflation,
                double current, double gdp) {
    addSeries(panel, name, kMap.unemployment, {{2022, unemployment + 0.5}, {2023, unemployment}});
    addSeries(panel, name, kMap.governmentDebt, {{2023, debt}, {2024, 999.0}});
    addSeries(panel, name, kMap.inflation, {{2022, inflation}, {2023, std::nullopt}});
    addSeries(panel, name, kMap.currentAccount, {{2023, current}});
    addSeries(panel, name, kMap.gdp, {{2023, gdp}});
}

class EtfPipelineTest: public ::testing::Test {
   protected:
    void SetUp() override {
        addCountry(panel, "Canada", 5.4, 107.0, 3.9, -0.6, 2140.0);
        addCountry(panel, "Japan", 2.6, 255.0, 3.2, 3.6, 4210.0);
        addCountry(panel, "Korea, Republic of", 2.7, 54.0, 3.6, 1.9, 1710.0);
        addCountry(panel, "Norway", 3.6, 43.0, 5.5, 16.0, 485.0);
        addCountry(panel, "Atlantis", 1.0, 10.0, 2.0, 5.0, 10.0);
        addCountry(panel, "Ghana", 3.1, 80.0, 9.0, -2.0, 76.0);

        lookup.known["Canada"] = {"CAD"};
        lookup.known["Japan"]  = {"JPY"};
        lookup.known["Korea"]  = {"KRW"};
        lookup.known["Norway"] = {"NOK"};
        lookup.known["Ghana"]  = {"GHS"};

        rates.latestRates     = {{"CAD", 1.35}, {"JPY", 150.0}, {"KRW", 1330.0}, {"NOK", 10.5}, {"EUR", 0.92}};
        rates.historicalRates = {{"CAD", 1.30}, {"JPY", 135.0}, {"NOK", 10.0}};

        config.fxHistorical = false;
    }

    IndicatorPanel     panel;
    FakeCurrencyLookup lookup;
    FakeRateSource     rates;
    EtfConfig          config;
};

double weightSum(const EtfResult& r) {
    return std::accumulate(r.weights.begin(), r.weights.end(), 0.0,
                           [](double acc, const ScoredCountry& s) { return acc + s.weight; });
}

}  // namespace

TEST_F(EtfPipelineTest, BuildsConsistentResult) {
    EtfPipeline pipeline(config, rates, lookup);
    const auto  result = pipeline.run(panel, 2023, "2022-06-15");
    ASSERT_NE(result, nullptr);

    EXPECT_EQ(result->stats.panelCountries, 6u);
    EXPECT_EQ(result->stats.droppedNoCurrency, 1u);  // Atlantis
    EXPECT_EQ(result->stats.droppedNoRate, 1u);      // Ghana
    EXPECT_EQ(result->stats.eligible, 3u);           // Japan fails the debt bound
    EXPECT_FALSE(result->stats.healthFilterSkipped);
    EXPECT_EQ(rates.historicalCalls.load(), 0);

    ASSERT_EQ(result->wide.size(), 3u);
    for (const auto& row : result->wide) {
        EXPECT_NE(row.country, "Japan");
        ASSERT_TRUE(row.fxRate.has_value());
        EXPECT_GT(*row.fxRate, 0.0);
    }

    ASSERT_FALSE(result->weights.empty());
    EXPECT_NEAR(weightSum(*result), 1.0, 1e-9);

    double expected = 0.0;
    for (const auto& w : result->weights) {
        EXPECT_GT(w.weight, 0.0);
        const auto it = std::find_if(result->wide.begin(), result->wide.end(),
                                     [&w](const CountryRecord& r) { return r.country == w.country; });
        ASSERT_NE(it, result->wide.end());
        EXPECT_EQ(w.currency, it->currency);
        expected += w.weight / *it->fxRate;
    }
    EXPECT_NEAR(result->usdValue, expected, 1e-12);

    EXPECT_EQ(result->top.size(), result->weights.size());
    for (std::size_t i = 1; i < result->top.size(); ++i) {
        EXPECT_GE(result->top[i - 1].weightPct, result->top[i].weightPct);
    }
}

TEST_F(EtfPipelineTest, UsesLatestYearNotAfterCurrentYear) {
    EtfPipeline pipeline(config, rates, lookup);
    const auto  result = pipeline.run(panel, 2023, "");
    ASSERT_NE(result, nullptr);

    for (const auto& row : result->wide) {
        // 2024 debt estimate ignored, 2022 inflation used when 2023 is missing
        EXPECT_LT(*row.value(kMap.governmentDebt), 999.0);
        EXPECT_TRUE(row.value(kMap.inflation).has_value());
    }
}

TEST_F(EtfPipelineTest, IdenticalInputsGiveIdenticalWeights) {
    EtfPipeline pipeline(config, rates, lookup);
    const auto  first  = pipeline.run(panel, 2023, "");
    const auto  second = pipeline.run(panel, 2023, "");
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);

    ASSERT_EQ(first->weights.size(), second->weights.size());
    for (std::size_t i = 0; i < first->weights.size(); ++i) {
        EXPECT_EQ(first->weights[i].country, second->weights[i].country);
        EXPECT_EQ(first->weights[i].weight, second->weights[i].weight);
    }
    EXPECT_EQ(first->usdValue, second->usdValue);
}

TEST_F(EtfPipelineTest, HistoricalRatesAddFxChange) {
    config.fxHistorical = true;
    EtfPipeline pipeline(config, rates, lookup);

    const auto result = pipeline.run(panel, 2023, "2022-06-15");
    ASSERT_NE(result, nullptr);

    EXPECT_EQ(rates.lastHistoricalDate, "2022-06-15");
    EXPECT_EQ(result->historicalDate, "2022-06-15");

    for (const auto& row : result->wide) {
        if (row.currency == "CAD") {
            EXPECT_NEAR(*row.fxChange, (1.35 - 1.30) / 1.30, 1e-12);
        }
        if (row.currency == "KRW") {
            EXPECT_FALSE(row.value(kFxChangeIndicator).has_value());
        }
    }
    EXPECT_NEAR(weightSum(*result), 1.0, 1e-9);
}

TEST_F(EtfPipelineTest, ImpossibleProfileIsSkipped) {
    HealthCondition condition;
    condition.indicator = kMap.unemployment;
    condition.max       = 0.1;

    HealthProfile profile;
    profile.name       = "impossible";
    profile.conditions = {condition};

    config.profiles["impossible"] = profile;
    config.healthProfile          = "impossible";

    EtfPipeline pipeline(config, rates, lookup);
    const auto  result = pipeline.run(panel, 2023, "");
    ASSERT_NE(result, nullptr);

    EXPECT_TRUE(result->stats.healthFilterSkipped);
    EXPECT_EQ(result->wide.size(), 4u);
    EXPECT_NEAR(weightSum(*result), 1.0, 1e-9);
}

TEST_F(EtfPipelineTest, RateServiceFailureFailsRun) {
    rates.failLatest = true;
    EtfPipeline pipeline(config, rates, lookup);
    EXPECT_EQ(pipeline.run(panel, 2023, ""), nullptr);
}

TEST_F(EtfPipelineTest, HistoricalFailureFailsRun) {
    config.fxHistorical  = true;
    rates.failHistorical = true;
    EtfPipeline pipeline(config, rates, lookup);
    EXPECT_EQ(pipeline.run(panel, 2023, "2022-06-15"), nullptr);
}

TEST_F(EtfPipelineTest, LookupFailureFailsBeforeRates) {
    lookup.failing.insert("Japan");
    EtfPipeline pipeline(config, rates, lookup);

    EXPECT_EQ(pipeline.run(panel, 2023, ""), nullptr);
    EXPECT_EQ(rates.latestCalls.load(), 0);
}

TEST_F(EtfPipelineTest, NothingPricedFailsRun) {
    rates.latestRates = {{"EUR", 0.92}};
    EtfPipeline pipeline(config, rates, lookup);
    EXPECT_EQ(pipeline.run(panel, 2023, ""), nullptr);
}

TEST_F(EtfPipelineTest, JsonDocument) {
    config.topN = 2;
    EtfPipeline pipeline(config, rates, lookup);
    const auto  result = pipeline.run(panel, 2023, "");
    ASSERT_NE(result, nullptr);

    const auto doc = result->toJson();
    EXPECT_EQ(doc["year"], 2023);
    EXPECT_DOUBLE_EQ(doc["usd_value"].get<double>(), result->usdValue);
    EXPECT_LE(doc["top"].size(), 2u);
    EXPECT_EQ(doc["weights"].size(), result->weights.size());
    EXPECT_EQ(doc["stats"]["dropped_no_currency"], 1);
    EXPECT_FALSE(doc.contains("historical_date"));
}
