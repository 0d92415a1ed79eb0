#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>
#include <tuple>
#include <utility>

#include <rapidcsv.h>

#include "etf/panel.hpp"

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end   = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

int findColumn(const std::vector<std::string>& header, const std::string& name) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

}  // namespace

std::shared_ptr<IndicatorPanel> PanelLoader::load(const std::string& path, const PanelSchema& schema) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "Error: Cannot open panel file: " << path << std::endl;
        return nullptr;
    }
    return parse(f, schema);
}

std::shared_ptr<IndicatorPanel> PanelLoader::parse(std::istream& in, const PanelSchema& schema) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    // Strip a UTF-8 byte order mark and CRLF line endings.
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }
    text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());

    std::vector<std::vector<std::string>> rows;
    try {
        std::istringstream csv(text);

        /**
         * @note No label row or column: the header is read as row 0.
         *       Quoted fields may span lines (IMF notes columns do).
         */
        rapidcsv::Document doc(csv, rapidcsv::LabelParams(-1, -1),
                               rapidcsv::SeparatorParams(',', false, false, true, true), rapidcsv::ConverterParams(),
                               rapidcsv::LineReaderParams(false, '#', true));

        rows.reserve(doc.GetRowCount());
        for (std::size_t i = 0; i < doc.GetRowCount(); ++i) {
            rows.push_back(doc.GetRow<std::string>(i));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Panel data is not valid CSV: " << e.what() << std::endl;
        return nullptr;
    }

    if (rows.empty()) {
        std::cerr << "Error: Panel data is empty" << std::endl;
        return nullptr;
    }

    std::vector<std::string> header = rows.front();
    for (auto& h : header) {
        h = trim(h);
    }

    const int countryCol   = findColumn(header, schema.countryColumn);
    const int indicatorCol = findColumn(header, schema.indicatorColumn);
    if (countryCol < 0 || indicatorCol < 0) {
        std::cerr << "Error: Panel header lacks '" << (countryCol < 0 ? schema.countryColumn : schema.indicatorColumn)
                  << "' column" << std::endl;
        return nullptr;
    }

    /* (column index, year) for every declared year column present in the header */
    std::vector<std::pair<std::size_t, int>> yearCols;
    for (int year = schema.firstYear; year <= schema.lastYear; ++year) {
        const int col = findColumn(header, std::to_string(year));
        if (col >= 0) {
            yearCols.emplace_back(static_cast<std::size_t>(col), year);
        }
    }
    if (yearCols.empty()) {
        std::cerr << "Error: Panel header has no year columns in [" << schema.firstYear << ", " << schema.lastYear
                  << "]" << std::endl;
        return nullptr;
    }

    auto panel = std::make_shared<IndicatorPanel>();

    std::set<std::tuple<std::string, std::string, int>> seen;

    std::size_t skipped    = 0;
    std::size_t duplicates = 0;

    for (std::size_t r = 1; r < rows.size(); ++r) {
        const auto& fields = rows[r];
        auto        cell   = [&fields](std::size_t i) { return i < fields.size() ? trim(fields[i]) : std::string(); };

        const bool blank =
            std::all_of(fields.begin(), fields.end(), [](const std::string& f) { return trim(f).empty(); });
        if (blank) {
            continue;
        }

        const std::string country   = cell(static_cast<std::size_t>(countryCol));
        const std::string indicator = cell(static_cast<std::size_t>(indicatorCol));
        if (country.empty() || indicator.empty()) {
            ++skipped;
            continue;
        }

        for (const auto& [col, year] : yearCols) {
            if (!seen.emplace(country, indicator, year).second) {
                ++duplicates;
                continue;
            }

            PanelRecord record;
            record.country   = country;
            record.indicator = indicator;
            record.year      = year;
            record.value     = parseValue(cell(col));
            panel->records.push_back(std::move(record));
        }
    }

    if (skipped > 0) {
        std::cerr << "  [WARN] skipped " << skipped << " panel rows without country or indicator" << std::endl;
    }
    if (duplicates > 0) {
        std::cerr << "  [WARN] ignored " << duplicates << " duplicate panel cells (first occurrence kept)" << std::endl;
    }

    return panel;
}

std::optional<double> PanelLoader::parseValue(const std::string& cell) {
    std::string text;
    text.reserve(cell.size());
    for (const char c : trim(cell)) {
        if (c != ',') {
            text += c;
        }
    }

    if (text.empty() || text == "n/a" || text == "NA" || text == "--" || text == "..") {
        return std::nullopt;
    }

    char*        end   = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}
