#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "etf/etf_cache.hpp"
#include "etf/etf_pipeline.hpp"
#include "freecurrency_api.hpp"
#include "http.hpp"
#include "rest_countries.hpp"

/**
 * @brief Resolve a path relative to the executable's directory.
 *        Walks up from the exe directory (at most 4 levels) and returns the
 *        first existing candidate, e.g. build/app/etf -> <root>/config/etf_config.json.
 */
static std::string resolveFromExe(const std::string& relativePath) {
    char    buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return relativePath;
    }
    buf[len] = '\0';
    std::string exePath(buf);
    for (int i = 0; i < 4; ++i) {
        auto pos = exePath.rfind('/');
        if (pos == std::string::npos) {
            return relativePath;
        }
        exePath = exePath.substr(0, pos);

        const auto candidate = exePath + "/" + relativePath;
        if (access(candidate.c_str(), R_OK) == 0) {
            return candidate;
        }
    }
    return relativePath;
}

struct Defer {
    std::function<void()> f;
    explicit Defer(std::function<void()> f)
        : f(std::move(f)) {}
    ~Defer() {
        if (f) {
            f();
        }
    }
};

static std::string cell(const std::optional<double>& v) {
    if (!v) {
        return "-";
    }
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << *v;
    return os.str();
}

static void printResult(const EtfResult& result) {
    // clang-format off
    std::clog << std::endl;
    std::clog << "=== Currency ETF (" << result.year << ") ===" << std::endl;
    std::clog << std::endl;
    std::clog << std::left  << std::setw(28) << "Country"
              << std::setw(6)  << "Ccy"
              << std::right << std::setw(10) << "Weight %"
              << std::setw(10) << "USD/unit"
              << std::setw(12) << "GDP"
              << std::setw(10) << "Unemp."
              << std::setw(10) << "Infl." << std::endl;
    std::clog << std::string(86, '-') << std::endl;
    for (const auto& row : result.top) {
        std::clog << std::left  << std::setw(28) << row.country.substr(0, 27)
                  << std::setw(6)  << row.currency
                  << std::right << std::fixed << std::setprecision(2)
                  << std::setw(10) << row.weightPct
                  << std::setw(10) << row.usdPerUnit
                  << std::setw(12) << cell(row.gdp)
                  << std::setw(10) << cell(row.unemployment)
                  << std::setw(10) << cell(row.inflation) << std::endl;
    }
    std::clog << std::string(86, '-') << std::endl;
    std::clog << "ETF value: " << std::setprecision(4) << result.usdValue << " USD" << std::endl;
    std::clog << std::endl;
    std::clog << "Countries in panel:      " << result.stats.panelCountries << std::endl;
    std::clog << "Dropped (no currency):   " << result.stats.droppedNoCurrency << std::endl;
    std::clog << "Dropped (no FX rate):    " << result.stats.droppedNoRate + result.stats.droppedBadRate << std::endl;
    std::clog << "Eligible:                " << result.stats.eligible
              << (result.stats.healthFilterSkipped ? " (health filter skipped)" : "") << std::endl;
    std::clog << "Weighted:                " << result.weights.size()
              << (result.stats.positivityFallback ? " (no positive score, all kept)" : "") << std::endl;
    // clang-format on
}

int main(int argc, char* argv[]) {
    const char* apiKey = std::getenv("FREECURRENCY_API_KEY");
    if (!apiKey || std::string(apiKey).empty()) {
        std::cerr << "Error: FREECURRENCY_API_KEY environment variable is not set.\n"
                  << "Get your free API key at: https://app.freecurrencyapi.com/register\n"
                  << "Usage: export FREECURRENCY_API_KEY=<your_key>" << std::endl;
        return 1;
    }

    // Parse arguments
    bool        jsonMode = false;
    std::string configPath;
    std::string panelPath;
    long        topN = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            jsonMode = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--panel" && i + 1 < argc) {
            panelPath = argv[++i];
        } else if (arg == "--top" && i + 1 < argc) {
            topN = std::strtol(argv[++i], nullptr, 10);
        } else {
            std::cerr << "Usage: " << argv[0] << " [--config path] [--panel path] [--top n] [--json]" << std::endl;
            return 1;
        }
    }

    if (configPath.empty()) {
        configPath = resolveFromExe("config/etf_config.json");
    }

    auto config = EtfConfig::load(configPath);
    if (!config) {
        return 1;
    }
    if (topN > 0) {
        config->topN = static_cast<std::size_t>(topN);
    }
    if (panelPath.empty()) {
        panelPath = resolveFromExe(config->panelPath);
    }

    std::cerr << "Loading panel " << panelPath << "..." << std::endl;
    const auto panel = PanelLoader::load(panelPath, config->schema);
    if (!panel) {
        return 1;
    }
    std::cerr << "  [OK] " << panel->records.size() << " panel cells" << std::endl;

    Http::init();
    Defer _cleanup([] { Http::close(); });

    FreeCurrencyApi rates(apiKey, config->http);
    RestCountries   countries(config->http);
    EtfPipeline     pipeline(*config, rates, countries);

    EtfCache cache([&pipeline, &panel] { return pipeline.run(*panel); });

    const auto snapshot = cache.getOrRefresh(std::chrono::seconds(config->cacheMaxAgeSeconds));
    if (!snapshot) {
        std::cerr << "ETF build failed." << std::endl;
        return 1;
    }

    if (jsonMode) {
        std::cout << snapshot->result->toJson().dump(2) << std::endl;
    } else {
        printResult(*snapshot->result);
    }

    return 0;
}
