#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "freecurrency_api.hpp"
#include "http.hpp"

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

int main(int argc, char* argv[]) {
    const char* apiKey = std::getenv("FREECURRENCY_API_KEY");
    if (!apiKey || std::string(apiKey).empty()) {
        std::cerr << "Error: FREECURRENCY_API_KEY environment variable is not set.\n"
                  << "Usage: export FREECURRENCY_API_KEY=<your_key>" << std::endl;
        return 1;
    }

    /* parse arguments: currency codes to show, all when none given */
    std::vector<std::string> codes(argv + 1, argv + argc);

    Http::init();
    Defer _cleanup([] { Http::close(); });

    FreeCurrencyApi api(apiKey);

    const auto rates = api.latest("USD");
    if (!rates) {
        return 1;
    }

    // clang-format off
    std::clog << std::left << std::setw(8) << "Code"
              << std::right << std::setw(16) << "per 1 USD"
              << std::setw(16) << "USD per unit" << std::endl;
    std::clog << std::string(40, '-') << std::endl;
    // clang-format on

    for (const auto& [code, rate] : rates->rates) {
        if (!codes.empty() && std::find(codes.begin(), codes.end(), code) == codes.end()) {
            continue;
        }
        // clang-format off
        std::clog << std::left << std::setw(8) << code
                  << std::right << std::fixed << std::setprecision(4)
                  << std::setw(16) << rate
                  << std::setw(16) << (rate > 0.0 ? 1.0 / rate : 0.0) << std::endl;
        // clang-format on
    }

    return 0;
}
