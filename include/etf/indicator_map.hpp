#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Logical indicator -> panel indicator identifier.
 *
 * Defaults are IMF World Economic Outlook subject codes.
 */
struct IndicatorMap {
    std::string gdp            = "NGDPD";        // GDP, current prices, USD billions
    std::string unemployment   = "LUR";          // unemployment rate, % of labor force
    std::string governmentDebt = "GGXWDG_NGDP";  // general government gross debt, % of GDP
    std::string inflation      = "PCPIPCH";      // inflation, average consumer prices, % change
    std::string currentAccount = "BCA_NGDPD";    // current account balance, % of GDP
    std::string externalDebt   = "D_NGDPD";      // external debt, % of GDP
    std::string exports        = "TX_RPCH";      // volume of exports of goods and services, % change

    /**
     * @brief Panel identifier of a logical name.
     * @param logical One of "gdp", "unemployment", "government_debt", "inflation",
     *                "current_account", "external_debt", "exports", or "fx_change".
     * @return Identifier, or std::nullopt for an unknown logical name.
     */
    [[nodiscard]] std::optional<std::string> byName(const std::string& logical) const;

    /**
     * @brief Every panel identifier, in declaration order.
     */
    [[nodiscard]] std::vector<std::string> all() const;
};
