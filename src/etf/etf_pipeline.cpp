#include "etf/etf_pipeline.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

#include "etf/currency_resolver.hpp"
#include "etf/fx_join.hpp"
#include "etf/temporal_selector.hpp"

namespace {

nlohmann::json optionalJson(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

}  // namespace

EtfPipeline::EtfPipeline(EtfConfig config, IRateSource& rates, ICurrencyLookup& currencies)
    : config_(std::move(config))
    , rates_(rates)
    , currencies_(currencies) {}

std::shared_ptr<EtfResult> EtfPipeline::run(const IndicatorPanel& panel) const {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm{};
    gmtime_r(&now, &tm);

    return run(panel, tm.tm_year + 1900, FxJoin::historicalDate(now));
}

std::shared_ptr<EtfResult> EtfPipeline::run(const IndicatorPanel& panel, int currentYear,
                                            const std::string& historicalDate) const {
    auto result            = std::make_shared<EtfResult>();
    result->year           = currentYear;
    result->historicalDate = config_.fxHistorical ? historicalDate : "";

    auto& stats = result->stats;

    /* Temporal selection */
    CountryTable table = TemporalSelector::select(panel, config_.panelIndicators(), currentYear);
    stats.panelCountries = table.size();
    std::cerr << "  [OK] " << table.size() << " countries selected for " << currentYear << std::endl;

    /* Currency resolution */
    if (!CurrencyResolver::resolve(table, currencies_, stats)) {
        return nullptr;
    }
    std::cerr << "  [OK] " << table.size() << " countries with a currency (" << stats.droppedNoCurrency
              << " unresolved)" << std::endl;

    /* FX join */
    const auto latest = rates_.latest(config_.fxBase);
    if (!latest) {
        std::cerr << "Error: latest " << config_.fxBase << " rates unavailable" << std::endl;
        return nullptr;
    }

    std::shared_ptr<FxRates> historical;
    if (config_.fxHistorical) {
        historical = rates_.historical(config_.fxBase, historicalDate);
        if (!historical) {
            std::cerr << "Error: " << config_.fxBase << " rates for " << historicalDate << " unavailable" << std::endl;
            return nullptr;
        }
    }

    FxJoin::apply(table, *latest, historical.get(), stats);
    std::cerr << "  [OK] " << table.size() << " countries priced (" << stats.droppedNoRate << " without rate, "
              << stats.droppedBadRate << " with invalid rate)" << std::endl;

    if (table.empty()) {
        std::cerr << "Error: no country could be priced" << std::endl;
        return nullptr;
    }

    /* Health filter */
    const auto profile = config_.activeProfile();
    result->wide       = HealthFilter::apply(table, profile, stats);
    std::cerr << "  [OK] " << result->wide.size() << " countries eligible under '" << profile.name << "' profile"
              << std::endl;

    /* Scoring */
    auto scored                = CompositeScorer::score(result->wide, config_.scoreIndicators());
    stats.positivityFallback   = scored.positivityFallback;
    stats.equalWeightFallback  = scored.equalWeightFallback;
    stats.skippedIndicators    = scored.skippedIndicators;
    result->weights            = std::move(scored.rows);

    /* Valuation */
    const auto value = Valuation::usdValue(result->weights, result->wide);
    if (!value) {
        return nullptr;
    }
    result->usdValue = *value;
    result->top      = Valuation::topN(result->weights, result->wide, config_.indicators, config_.topN);

    std::cerr << "  [OK] " << result->weights.size() << " countries weighted, ETF value " << result->usdValue << " USD"
              << std::endl;

    return result;
}

nlohmann::json EtfResult::toJson() const {
    nlohmann::json out;
    out["year"]      = year;
    out["usd_value"] = usdValue;
    if (!historicalDate.empty()) {
        out["historical_date"] = historicalDate;
    }

    out["stats"] = {
        {"panel_countries", stats.panelCountries},
        {"dropped_no_currency", stats.droppedNoCurrency},
        {"dropped_no_rate", stats.droppedNoRate},
        {"dropped_bad_rate", stats.droppedBadRate},
        {"eligible", stats.eligible},
        {"health_filter_skipped", stats.healthFilterSkipped},
        {"positivity_fallback", stats.positivityFallback},
        {"equal_weight_fallback", stats.equalWeightFallback},
        {"skipped_indicators", stats.skippedIndicators},
    };

    out["top"] = nlohmann::json::array();
    for (const auto& row : top) {
        out["top"].push_back({
            {"country", row.country},
            {"currency", row.currency},
            {"weight_pct", row.weightPct},
            {"usd_per_unit", row.usdPerUnit},
            {"gdp", optionalJson(row.gdp)},
            {"unemployment", optionalJson(row.unemployment)},
            {"inflation", optionalJson(row.inflation)},
        });
    }

    out["weights"] = nlohmann::json::array();
    for (const auto& w : weights) {
        out["weights"].push_back({
            {"country", w.country},
            {"currency", w.currency},
            {"composite_score", w.compositeScore},
            {"weight", w.weight},
        });
    }

    return out;
}
