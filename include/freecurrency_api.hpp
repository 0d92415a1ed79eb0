#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "http.hpp"
#include "rate_source.hpp"

/**
 * @brief FreeCurrencyAPI (api.freecurrencyapi.com) rate source.
 */
class FreeCurrencyApi: public IRateSource {
   public:
    /**
     * @param apiKey  FreeCurrencyAPI key (FREECURRENCY_API_KEY).
     * @param options Timeout and retry policy for both endpoints.
     */
    explicit FreeCurrencyApi(std::string apiKey, HttpOptions options = {});

    [[nodiscard]] std::shared_ptr<FxRates> latest(const std::string& base) override;

    [[nodiscard]] std::shared_ptr<FxRates> historical(const std::string& base, const std::string& date) override;

    /**
     * @brief Parse a /v1/latest body.
     * @example {"data": {"CAD": 1.35, "EUR": 0.92}}
     * @return FxRates, or nullptr when the body is malformed.
     */
    [[nodiscard]] static std::shared_ptr<FxRates> parseLatest(const std::string& body, const std::string& base);

    /**
     * @brief Parse a /v1/historical body.
     * @example {"data": {"2023-03-02": {"CAD": 1.36, "EUR": 0.94}}}
     * @return FxRates, or nullptr when the body is malformed or lacks the date.
     */
    [[nodiscard]] static std::shared_ptr<FxRates> parseHistorical(const std::string& body, const std::string& base,
                                                                  const std::string& date);

   private:
    static constexpr std::string_view latest_url_     = "https://api.freecurrencyapi.com/v1/latest";
    static constexpr std::string_view historical_url_ = "https://api.freecurrencyapi.com/v1/historical";

    /**
     * @brief Query parameters besides apikey, in URL order
     */
    using Query = std::vector<std::pair<std::string, std::string>>;

    std::string apiKey_;
    HttpOptions options_;

    [[nodiscard]] std::optional<std::string> request(const std::string& endpoint, const Query& query,
                                                     const std::string& what) const;
};
