#include <gtest/gtest.h>
#include "etf/valuation.hpp"
#include "fakes.hpp"

namespace {

ScoredCountry scored(const std::string& country, double weight, const std::string& currency = "") {
    ScoredCountry s;
    s.country        = country;
    s.currency       = currency;
    s.compositeScore = weight;
    s.weight         = weight;
    return s;
}

}  // namespace

TEST(ValuationTest, WeightedUsdPerUnit) {
    const std::vector<ScoredCountry> weights = {scored("A", 0.6), scored("B", 0.4)};
    const CountryTable               wide    = {makeRow("A", {}, "AAA", 2.0), makeRow("B", {}, "BBB", 4.0)};

    const auto value = Valuation::usdValue(weights, wide);
    ASSERT_TRUE(value.has_value());
    EXPECT_NEAR(*value, 0.4, 1e-12);
}

TEST(ValuationTest, MissingRateIsAnError) {
    const std::vector<ScoredCountry> weights = {scored("A", 1.0)};
    const CountryTable               wide    = {makeRow("A", {}, "AAA")};

    EXPECT_FALSE(Valuation::usdValue(weights, wide).has_value());
}

TEST(ValuationTest, TopTenOfTwelveSortedByWeight) {
    std::vector<ScoredCountry> weights;
    CountryTable               wide;
    double                     total = 0.0;
    for (int i = 1; i <= 12; ++i) {
        total += i;
    }
    for (int i = 1; i <= 12; ++i) {
        const auto name = "Country" + std::to_string(i);
        weights.push_back(scored(name, i / total, "C" + std::to_string(i)));
        wide.push_back(makeRow(name, {}, "C" + std::to_string(i), 1.0));
    }

    const auto top = Valuation::topN(weights, wide, IndicatorMap{}, 10);

    ASSERT_EQ(top.size(), 10u);
    EXPECT_EQ(top.front().country, "Country12");
    EXPECT_EQ(top.back().country, "Country3");
    for (std::size_t i = 1; i < top.size(); ++i) {
        EXPECT_GE(top[i - 1].weightPct, top[i].weightPct);
    }
}

TEST(ValuationTest, TiesBreakByCountryName) {
    const std::vector<ScoredCountry> weights = {scored("Zambia", 0.25), scored("Chile", 0.5), scored("Austria", 0.25)};
    const CountryTable wide = {makeRow("Zambia", {}, "ZMW", 20.0), makeRow("Chile", {}, "CLP", 900.0),
                               makeRow("Austria", {}, "EUR", 0.9)};

    const auto top = Valuation::topN(weights, wide, IndicatorMap{}, 10);

    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].country, "Chile");
    EXPECT_EQ(top[1].country, "Austria");
    EXPECT_EQ(top[2].country, "Zambia");
}

TEST(ValuationTest, TopRowProjection) {
    const IndicatorMap map;

    const std::vector<ScoredCountry> weights = {scored("Canada", 0.123456, "CAD")};
    const CountryTable               wide    = {
        makeRow("Canada", {{map.gdp, 2140.0}, {map.unemployment, 5.4}, {map.inflation, std::nullopt}}, "CAD", 1.35)};

    const auto top = Valuation::topN(weights, wide, map, 10);

    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].currency, "CAD");
    EXPECT_DOUBLE_EQ(top[0].weightPct, 12.35);
    EXPECT_DOUBLE_EQ(top[0].usdPerUnit, 0.74);
    EXPECT_DOUBLE_EQ(*top[0].gdp, 2140.0);
    EXPECT_DOUBLE_EQ(*top[0].unemployment, 5.4);
    EXPECT_FALSE(top[0].inflation.has_value());
}

TEST(ValuationTest, FewerCountriesThanN) {
    const std::vector<ScoredCountry> weights = {scored("A", 1.0)};
    const CountryTable               wide    = {makeRow("A", {}, "AAA", 2.0)};

    EXPECT_EQ(Valuation::topN(weights, wide, IndicatorMap{}, 10).size(), 1u);
}
