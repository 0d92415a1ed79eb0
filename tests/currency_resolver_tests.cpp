#include <gtest/gtest.h>
#include "etf/currency_resolver.hpp"
#include "fakes.hpp"

TEST(CurrencyResolverTest, NameVariantsInOrder) {
    const auto v = CurrencyResolver::nameVariants("Korea, Republic of");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0], "Korea, Republic of");
    EXPECT_EQ(v[1], "Korea");

    const auto p = CurrencyResolver::nameVariants("Bolivia (Plurinational State of)");
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[1], "Bolivia");

    const auto both = CurrencyResolver::nameVariants("Micronesia, Fed. States (x)");
    ASSERT_EQ(both.size(), 3u);
    EXPECT_EQ(both[1], "Micronesia, Fed. States");
    EXPECT_EQ(both[2], "Micronesia");

    EXPECT_EQ(CurrencyResolver::nameVariants("Canada").size(), 1u);
}

TEST(CurrencyResolverTest, StopsAtFirstResolvedVariant) {
    FakeCurrencyLookup lookup;
    lookup.known["Korea"] = {"KRW"};

    const auto match = CurrencyResolver::resolveName("Korea, Republic of", lookup);
    EXPECT_EQ(match.status, CurrencyMatch::Status::Resolved);
    EXPECT_EQ(match.codes.front(), "KRW");
    EXPECT_EQ(lookup.asked.size(), 2u);
}

TEST(CurrencyResolverTest, DropsAndCountsUnresolved) {
    FakeCurrencyLookup lookup;
    lookup.known["Canada"]  = {"CAD"};
    lookup.known["Germany"] = {"EUR"};

    CountryTable table = {makeRow("Canada", {}), makeRow("Atlantis", {}), makeRow("Germany", {})};

    PipelineStats stats;
    ASSERT_TRUE(CurrencyResolver::resolve(table, lookup, stats));

    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table[0].currency, "CAD");
    EXPECT_EQ(table[1].currency, "EUR");
    EXPECT_EQ(stats.droppedNoCurrency, 1u);
}

TEST(CurrencyResolverTest, FirstCodeOfSeveralIsUsed) {
    FakeCurrencyLookup lookup;
    lookup.known["Panama"] = {"PAB", "USD"};

    CountryTable  table = {makeRow("Panama", {})};
    PipelineStats stats;
    ASSERT_TRUE(CurrencyResolver::resolve(table, lookup, stats));
    EXPECT_EQ(table[0].currency, "PAB");
}

TEST(CurrencyResolverTest, UpstreamFailureAborts) {
    FakeCurrencyLookup lookup;
    lookup.known["Canada"] = {"CAD"};
    lookup.failing.insert("Chile");

    CountryTable  table = {makeRow("Canada", {}), makeRow("Chile", {})};
    PipelineStats stats;
    EXPECT_FALSE(CurrencyResolver::resolve(table, lookup, stats));
}

TEST(CurrencyResolverTest, ResolvedWithoutCodesIsUnresolved) {
    EXPECT_EQ(CurrencyMatch::resolved({}).status, CurrencyMatch::Status::Unresolved);
}
