#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "currency_lookup.hpp"
#include "etf/composite_scorer.hpp"
#include "etf/country_record.hpp"
#include "etf/health_filter.hpp"
#include "etf/indicator_map.hpp"
#include "etf/panel.hpp"
#include "etf/valuation.hpp"
#include "http.hpp"
#include "rate_source.hpp"

struct EtfConfig {
    PanelSchema  schema;
    std::string  panelPath = "data/imf_dataset.csv";
    IndicatorMap indicators;

    /**
     * @brief Name of the active health profile
     * @example "strict", "relaxed"
     */
    std::string healthProfile = "relaxed";

    /**
     * @brief Profiles declared in the config file, conditions already mapped to panel identifiers.
     *        When empty, the built-in strict and relaxed profiles apply.
     */
    std::map<std::string, HealthProfile> profiles;

    /**
     * @brief Explicit scoring indicators (panel identifiers); empty means the default set.
     */
    std::vector<std::string> scoreIndicatorIds;

    std::string fxBase       = "USD";
    bool        fxHistorical = true;
    HttpOptions http;

    std::size_t topN               = 10;
    long        cacheMaxAgeSeconds = 3600;

    /**
     * @brief Build a config from a parsed etf_config.json document.
     * @return Config, or nullptr on an unknown profile or indicator name or a mistyped value.
     */
    [[nodiscard]] static std::shared_ptr<EtfConfig> fromJson(const nlohmann::json& doc);

    /**
     * @brief Read and parse a config file.
     */
    [[nodiscard]] static std::shared_ptr<EtfConfig> load(const std::string& path);

    [[nodiscard]] HealthProfile activeProfile() const;

    /**
     * @brief Scored indicators: the explicit list, or the active profile's indicators
     *        followed by fx_change when historical rates are enabled.
     */
    [[nodiscard]] std::vector<std::string> scoreIndicators() const;

    /**
     * @brief Panel indicators the temporal selector must keep.
     */
    [[nodiscard]] std::vector<std::string> panelIndicators() const;
};

struct EtfResult {
    /**
     * @brief Scored projection: weights sum to 1, each > 0
     */
    std::vector<ScoredCountry> weights;

    /**
     * @brief Enriched, health-filtered country table (FX rates, indicators)
     */
    CountryTable wide;

    /**
     * @brief USD value of one basket unit
     */
    double usdValue = 0.0;

    std::vector<TopRow> top;

    PipelineStats stats;

    int         year           = 0;
    std::string historicalDate = "";

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Panel -> weights -> USD value, one synchronous run at a time.
 *
 * Either returns a complete result or nullptr; partial tables never escape.
 */
class EtfPipeline {
   public:
    EtfPipeline(EtfConfig config, IRateSource& rates, ICurrencyLookup& currencies);

    /**
     * @brief Run every stage.
     * @param panel          Loaded panel.
     * @param currentYear    Reference year for temporal selection.
     * @param historicalDate Date of the trailing rates (YYYY-MM-DD), unused when disabled.
     * @return Result, or nullptr when a collaborator failed or nothing could be priced.
     */
    [[nodiscard]] std::shared_ptr<EtfResult> run(const IndicatorPanel& panel, int currentYear,
                                                 const std::string& historicalDate) const;

    /**
     * @brief Run with the current UTC year and the date 365 days ago.
     */
    [[nodiscard]] std::shared_ptr<EtfResult> run(const IndicatorPanel& panel) const;

    [[nodiscard]] const EtfConfig& config() const { return config_; }

   private:
    EtfConfig        config_;
    IRateSource&     rates_;
    ICurrencyLookup& currencies_;
};
