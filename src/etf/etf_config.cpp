#include <algorithm>
#include <fstream>
#include <iostream>

#include "etf/etf_pipeline.hpp"

namespace {

bool readCondition(const nlohmann::json& item, const IndicatorMap& map, HealthCondition& out) {
    const auto logical = item.at("indicator").get<std::string>();
    const auto id      = map.byName(logical);
    if (!id) {
        std::cerr << "Config error: unknown indicator '" << logical << "' in health profile" << std::endl;
        return false;
    }

    out.indicator = *id;
    if (item.contains("min")) {
        out.min = item["min"].get<double>();
    }
    if (item.contains("max")) {
        out.max = item["max"].get<double>();
    }
    out.aboveMedian = item.value("above_median", false);

    if (!out.min && !out.max && !out.aboveMedian) {
        std::cerr << "Config error: condition on '" << logical << "' has no bound" << std::endl;
        return false;
    }
    if (out.min && out.max && *out.min > *out.max) {
        std::cerr << "Config error: condition on '" << logical << "' has min " << *out.min << " above max " << *out.max
                  << std::endl;
        return false;
    }
    return true;
}

}  // namespace

std::shared_ptr<EtfConfig> EtfConfig::fromJson(const nlohmann::json& doc) {
    auto config = std::make_shared<EtfConfig>();

    try {
        if (doc.contains("panel")) {
            const auto& p                  = doc["panel"];
            config->schema.countryColumn   = p.value("country_column", config->schema.countryColumn);
            config->schema.indicatorColumn = p.value("indicator_column", config->schema.indicatorColumn);
            config->schema.firstYear       = p.value("first_year", config->schema.firstYear);
            config->schema.lastYear        = p.value("last_year", config->schema.lastYear);
            config->panelPath              = p.value("path", config->panelPath);
        }

        if (doc.contains("indicators")) {
            const auto& i                     = doc["indicators"];
            config->indicators.gdp            = i.value("gdp", config->indicators.gdp);
            config->indicators.unemployment   = i.value("unemployment", config->indicators.unemployment);
            config->indicators.governmentDebt = i.value("government_debt", config->indicators.governmentDebt);
            config->indicators.inflation      = i.value("inflation", config->indicators.inflation);
            config->indicators.currentAccount = i.value("current_account", config->indicators.currentAccount);
            config->indicators.externalDebt   = i.value("external_debt", config->indicators.externalDebt);
            config->indicators.exports        = i.value("exports", config->indicators.exports);
        }

        if (doc.contains("profiles")) {
            for (const auto& [name, items] : doc["profiles"].items()) {
                HealthProfile profile;
                profile.name = name;
                for (const auto& item : items) {
                    HealthCondition condition;
                    if (!readCondition(item, config->indicators, condition)) {
                        return nullptr;
                    }
                    profile.conditions.push_back(condition);
                }
                if (profile.conditions.empty()) {
                    std::cerr << "Config error: health profile '" << name << "' has no conditions" << std::endl;
                    return nullptr;
                }
                config->profiles[name] = profile;
            }
        }

        config->healthProfile = doc.value("health_profile", config->healthProfile);
        if (!config->profiles.count(config->healthProfile) && config->healthProfile != "strict"
            && config->healthProfile != "relaxed") {
            std::cerr << "Config error: unknown health profile '" << config->healthProfile << "'" << std::endl;
            return nullptr;
        }

        if (doc.contains("score_indicators")) {
            for (const auto& item : doc["score_indicators"]) {
                const auto logical = item.get<std::string>();
                const auto id      = config->indicators.byName(logical);
                if (!id) {
                    std::cerr << "Config error: unknown score indicator '" << logical << "'" << std::endl;
                    return nullptr;
                }
                config->scoreIndicatorIds.push_back(*id);
            }
        }

        if (doc.contains("fx")) {
            const auto& fx               = doc["fx"];
            config->fxBase               = fx.value("base", config->fxBase);
            config->fxHistorical         = fx.value("historical", config->fxHistorical);
            config->http.timeoutSeconds  = fx.value("timeout_seconds", config->http.timeoutSeconds);
            config->http.maxRetries      = fx.value("max_retries", config->http.maxRetries);
            config->http.backoffMs       = fx.value("backoff_ms", config->http.backoffMs);
        }

        const auto topN = doc.value("top_n", static_cast<long long>(config->topN));
        if (topN <= 0) {
            std::cerr << "Config error: top_n must be positive" << std::endl;
            return nullptr;
        }
        config->topN = static_cast<std::size_t>(topN);

        if (doc.contains("cache")) {
            config->cacheMaxAgeSeconds = doc["cache"].value("max_age_seconds", config->cacheMaxAgeSeconds);
            if (config->cacheMaxAgeSeconds < 0) {
                std::cerr << "Config error: cache.max_age_seconds must not be negative" << std::endl;
                return nullptr;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return nullptr;
    }

    if (config->schema.firstYear > config->schema.lastYear) {
        std::cerr << "Config error: panel.first_year is after panel.last_year" << std::endl;
        return nullptr;
    }

    return config;
}

std::shared_ptr<EtfConfig> EtfConfig::load(const std::string& path) {
    nlohmann::json doc;
    {
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "Error: Cannot open config file: " << path << std::endl;
            return nullptr;
        }
        try {
            f >> doc;
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Config parse error: " << e.what() << std::endl;
            return nullptr;
        }
    }
    return fromJson(doc);
}

HealthProfile EtfConfig::activeProfile() const {
    auto it = profiles.find(healthProfile);
    if (it != profiles.end()) {
        return it->second;
    }
    if (healthProfile == "strict") {
        return HealthProfile::strict(indicators);
    }
    return HealthProfile::relaxed(indicators);
}

std::vector<std::string> EtfConfig::scoreIndicators() const {
    if (!scoreIndicatorIds.empty()) {
        return scoreIndicatorIds;
    }

    auto result = activeProfile().indicators();
    if (fxHistorical && std::find(result.begin(), result.end(), kFxChangeIndicator) == result.end()) {
        result.emplace_back(kFxChangeIndicator);
    }
    return result;
}

std::vector<std::string> EtfConfig::panelIndicators() const {
    auto result = indicators.all();

    auto add = [&result](const std::string& id) {
        if (id != kFxChangeIndicator && std::find(result.begin(), result.end(), id) == result.end()) {
            result.push_back(id);
        }
    };
    for (const auto& id : activeProfile().indicators()) {
        add(id);
    }
    for (const auto& id : scoreIndicatorIds) {
        add(id);
    }
    return result;
}
