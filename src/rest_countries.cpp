#include <vector>

#include <nlohmann/json.hpp>

#include "rest_countries.hpp"

RestCountries::RestCountries(HttpOptions options)
    : options_(options) {}

CurrencyMatch RestCountries::lookup(const std::string& countryName) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = memo_.find(countryName);
        if (it != memo_.end()) {
            return it->second;
        }
    }

    const auto name = Http::escape(countryName);
    if (!name) {
        return CurrencyMatch::failed("cannot encode country name '" + countryName + "'");
    }

    const auto response = Http::get(std::string(url_base_) + *name + "?fullText=true&fields=currencies", options_);

    CurrencyMatch match;
    if (!response.error.empty()) {
        match = CurrencyMatch::failed("restcountries request for '" + countryName + "' failed: " + response.error);
    } else {
        match = parse(response.status, response.body);
    }

    // Failures are not memoized; a later run may succeed.
    if (match.status != CurrencyMatch::Status::Failed) {
        std::lock_guard<std::mutex> lock(mutex_);
        memo_[countryName] = match;
    }
    return match;
}

CurrencyMatch RestCountries::parse(long status, const std::string& body) {
    if (status == 404) {
        return CurrencyMatch::unresolved();
    }
    if (status < 200 || status >= 300) {
        return CurrencyMatch::failed("restcountries returned HTTP " + std::to_string(status));
    }

    try {
        const auto parsed = nlohmann::json::parse(body);
        if (!parsed.is_array()) {
            return CurrencyMatch::failed("restcountries returned an unexpected document");
        }

        std::vector<std::string> codes;
        for (const auto& country : parsed) {
            if (!country.contains("currencies") || !country["currencies"].is_object()) {
                continue;
            }
            for (const auto& entry : country["currencies"].items()) {
                codes.push_back(entry.key());
            }
            if (!codes.empty()) {
                break;
            }
        }
        return CurrencyMatch::resolved(std::move(codes));
    } catch (const nlohmann::json::exception& e) {
        return CurrencyMatch::failed(std::string("restcountries response: ") + e.what());
    }
}
