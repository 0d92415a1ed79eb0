#pragma once

#include <string>
#include <vector>

#include "currency_lookup.hpp"
#include "etf/country_record.hpp"

class CurrencyResolver {
   public:
    /**
     * @brief Names to try for a country, in order: full name, text before '(',
     *        text before ','. Trimmed, without empty or repeated entries.
     * @example "Korea, Republic of" -> ["Korea, Republic of", "Korea"]
     */
    [[nodiscard]] static std::vector<std::string> nameVariants(const std::string& country);

    /**
     * @brief Resolve one country name, trying every variant.
     * @return The first Resolved match, a Failed match as soon as one occurs,
     *         or Unresolved when no variant matched.
     */
    [[nodiscard]] static CurrencyMatch resolveName(const std::string& country, ICurrencyLookup& lookup);

    /**
     * @brief Assign a currency to every row, dropping rows without one.
     * @param table  Country table, updated in place.
     * @param lookup Country metadata service.
     * @param stats  Receives the number of dropped rows.
     * @return false when the lookup service failed; the table is then unspecified.
     */
    [[nodiscard]] static bool resolve(CountryTable& table, ICurrencyLookup& lookup, PipelineStats& stats);
};
