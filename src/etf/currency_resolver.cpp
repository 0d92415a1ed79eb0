#include "etf/currency_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace {

std::string trim(const std::string& text) {
    const auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    const auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

}  // namespace

std::vector<std::string> CurrencyResolver::nameVariants(const std::string& country) {
    std::vector<std::string> variants;

    auto add = [&variants](const std::string& name) {
        const auto t = trim(name);
        if (!t.empty() && std::find(variants.begin(), variants.end(), t) == variants.end()) {
            variants.push_back(t);
        }
    };

    add(country);
    add(country.substr(0, country.find('(')));
    add(country.substr(0, country.find(',')));

    return variants;
}

CurrencyMatch CurrencyResolver::resolveName(const std::string& country, ICurrencyLookup& lookup) {
    for (const auto& name : nameVariants(country)) {
        auto match = lookup.lookup(name);
        if (match.status == CurrencyMatch::Status::Failed) {
            return match;
        }
        if (match.status == CurrencyMatch::Status::Resolved && !match.codes.empty()) {
            return match;
        }
    }
    return CurrencyMatch::unresolved();
}

bool CurrencyResolver::resolve(CountryTable& table, ICurrencyLookup& lookup, PipelineStats& stats) {
    CountryTable resolved;
    resolved.reserve(table.size());

    for (auto& row : table) {
        const auto match = resolveName(row.country, lookup);

        if (match.status == CurrencyMatch::Status::Failed) {
            std::cerr << "Error: currency lookup failed for " << row.country << ": " << match.error << std::endl;
            return false;
        }

        if (match.status != CurrencyMatch::Status::Resolved) {
            std::cerr << "  [WARN] no currency for " << row.country << std::endl;
            stats.droppedNoCurrency++;
            continue;
        }

        row.currency = match.codes.front();
        resolved.push_back(std::move(row));
    }

    table = std::move(resolved);
    return true;
}
