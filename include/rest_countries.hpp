#pragma once

#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "currency_lookup.hpp"
#include "http.hpp"

/**
 * @brief Country -> currency lookup backed by restcountries.com (v3.1).
 *
 * Answers are memoized per name for the lifetime of the object, so the
 * three name variants tried per country cost at most one request each.
 */
class RestCountries: public ICurrencyLookup {
   public:
    explicit RestCountries(HttpOptions options = {});

    [[nodiscard]] CurrencyMatch lookup(const std::string& countryName) override;

    /**
     * @brief Interpret a /v3.1/name response.
     * @param status HTTP status (404 means unknown name).
     * @param body   Response body.
     * @example [{"currencies": {"EUR": {"name": "Euro", "symbol": "€"}}}]
     */
    [[nodiscard]] static CurrencyMatch parse(long status, const std::string& body);

   private:
    static constexpr std::string_view url_base_ = "https://restcountries.com/v3.1/name/";

    HttpOptions options_;

    std::mutex                           mutex_;
    std::map<std::string, CurrencyMatch> memo_;
};
