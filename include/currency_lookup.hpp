#pragma once

#include <string>
#include <utility>
#include <vector>

struct CurrencyMatch {
    enum class Status
    {
        Resolved,    // at least one ISO 4217 code found
        Unresolved,  // the name is unknown to the service
        Failed       // upstream error, the run cannot continue
    };

    Status status = Status::Unresolved;

    /**
     * @brief ISO 4217 codes in service order
     * @example ["EUR"]
     */
    std::vector<std::string> codes;

    /**
     * @brief Cause of a Failed match
     */
    std::string error = "";

    [[nodiscard]] static CurrencyMatch resolved(std::vector<std::string> codes) {
        CurrencyMatch match;
        match.status = codes.empty() ? Status::Unresolved : Status::Resolved;
        match.codes  = std::move(codes);
        return match;
    }

    [[nodiscard]] static CurrencyMatch unresolved() { return CurrencyMatch{}; }

    [[nodiscard]] static CurrencyMatch failed(std::string error) {
        CurrencyMatch match;
        match.status = Status::Failed;
        match.error  = std::move(error);
        return match;
    }
};

/**
 * @brief Abstract country name -> currency metadata lookup.
 *
 * An unknown name is an expected miss (Unresolved), never an error.
 */
struct ICurrencyLookup {
    virtual ~ICurrencyLookup() = default;

    /**
     * @brief Look up the currencies of a country by name.
     * @param countryName Country name as it appears in the panel (or a shortened variant).
     */
    [[nodiscard]] virtual CurrencyMatch lookup(const std::string& countryName) = 0;
};
