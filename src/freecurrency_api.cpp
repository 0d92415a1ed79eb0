#include <iostream>

#include <nlohmann/json.hpp>

#include "freecurrency_api.hpp"

namespace {

void readRates(const nlohmann::json& object, FxRates& out) {
    for (const auto& [code, rate] : object.items()) {
        if (rate.is_number()) {
            out.rates[code] = rate.get<double>();
        }
    }
}

}  // namespace

FreeCurrencyApi::FreeCurrencyApi(std::string apiKey, HttpOptions options)
    : apiKey_(std::move(apiKey))
    , options_(options) {}

std::shared_ptr<FxRates> FreeCurrencyApi::latest(const std::string& base) {
    const auto body = request(std::string(latest_url_), {{"base_currency", base}}, "latest rates");
    if (!body) {
        return nullptr;
    }
    return parseLatest(*body, base);
}

std::shared_ptr<FxRates> FreeCurrencyApi::historical(const std::string& base, const std::string& date) {
    const auto body =
        request(std::string(historical_url_), {{"base_currency", base}, {"date", date}}, "historical rates (" + date + ")");
    if (!body) {
        return nullptr;
    }
    return parseHistorical(*body, base, date);
}

std::optional<std::string> FreeCurrencyApi::request(const std::string& endpoint, const Query& query,
                                                    const std::string& what) const {
    if (apiKey_.empty()) {
        std::cerr << "Error: FreeCurrencyAPI key is not set, cannot fetch " << what << std::endl;
        return std::nullopt;
    }

    const auto key = Http::escape(apiKey_);
    if (!key) {
        return std::nullopt;
    }
    std::string url = endpoint + "?apikey=" + *key;
    for (const auto& [name, value] : query) {
        const auto encoded = Http::escape(value);
        if (!encoded) {
            return std::nullopt;
        }
        url += "&" + name + "=" + *encoded;
    }

    const auto response = Http::get(url, options_);
    if (!response.ok()) {
        std::cerr << "Error: FreeCurrencyAPI " << what << " request failed: "
                  << (response.error.empty() ? "HTTP " + std::to_string(response.status) : response.error)
                  << std::endl;
        return std::nullopt;
    }
    return response.body;
}

std::shared_ptr<FxRates> FreeCurrencyApi::parseLatest(const std::string& body, const std::string& base) {
    try {
        const auto parsed = nlohmann::json::parse(body);
        if (!parsed.contains("data") || !parsed["data"].is_object()) {
            std::cerr << "Error: FreeCurrencyAPI latest response has no data object" << std::endl;
            return nullptr;
        }

        auto rates  = std::make_shared<FxRates>();
        rates->base = base;
        readRates(parsed["data"], *rates);
        return rates;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: FreeCurrencyAPI latest response: " << e.what() << std::endl;
    }
    return nullptr;
}

std::shared_ptr<FxRates> FreeCurrencyApi::parseHistorical(const std::string& body, const std::string& base,
                                                          const std::string& date) {
    try {
        const auto parsed = nlohmann::json::parse(body);

        /**
         * @note DATA
         * @example {"data": {"2023-03-02": {"CAD": 1.36, ...}}}
         */
        if (!parsed.contains("data") || !parsed["data"].contains(date) || !parsed["data"][date].is_object()) {
            std::cerr << "Error: FreeCurrencyAPI historical response has no rates for " << date << std::endl;
            return nullptr;
        }

        auto rates  = std::make_shared<FxRates>();
        rates->base = base;
        rates->date = date;
        readRates(parsed["data"][date], *rates);
        return rates;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: FreeCurrencyAPI historical response: " << e.what() << std::endl;
    }
    return nullptr;
}
