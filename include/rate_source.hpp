#pragma once

#include <memory>
#include <string>

#include "fx_rates.hpp"

/**
 * @brief Abstract source of batched exchange rates.
 *
 * One call returns the whole rate table for a base currency. Implementations
 * report failures (missing credential, non-success status, malformed body)
 * by returning nullptr after logging the cause.
 */
struct IRateSource {
    virtual ~IRateSource() = default;

    /**
     * @brief Latest rates for a base currency.
     * @param base Base currency code (e.g., "USD").
     * @return FxRates, or nullptr on failure.
     */
    [[nodiscard]] virtual std::shared_ptr<FxRates> latest(const std::string& base) = 0;

    /**
     * @brief Rates as of a specific date.
     * @param base Base currency code.
     * @param date Date (YYYY-MM-DD).
     * @return FxRates, or nullptr on failure.
     */
    [[nodiscard]] virtual std::shared_ptr<FxRates> historical(const std::string& base, const std::string& date) = 0;
};
