#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct PanelRecord {
    /**
     * @example "Canada"
     */
    std::string country = "";

    /**
     * @example "LUR" (unemployment rate)
     */
    std::string indicator = "";

    /**
     * @example 2023
     */
    int year = 0;

    /**
     * @brief Observation, std::nullopt when the cell is empty or "n/a"
     */
    std::optional<double> value;
};

/**
 * @brief Country x indicator x year observations, in file order.
 */
struct IndicatorPanel {
    std::vector<PanelRecord> records;
};

/**
 * @brief Which columns of the panel file carry what.
 *
 * Year columns are exactly the header cells spelling a year in
 * [firstYear, lastYear]; every other column besides country/indicator is ignored.
 */
struct PanelSchema {
    std::string countryColumn   = "Country";
    std::string indicatorColumn = "WEO Subject Code";
    int         firstYear       = 1980;
    int         lastYear        = 2035;
};

class PanelLoader {
   public:
    /**
     * @brief Load a panel CSV file.
     * @return IndicatorPanel, or nullptr when the file cannot be opened or the header
     *         does not match the schema.
     */
    [[nodiscard]] static std::shared_ptr<IndicatorPanel> load(const std::string& path, const PanelSchema& schema);

    /**
     * @brief Parse panel CSV text from a stream (RFC 4180, quoted fields may span lines).
     * @return IndicatorPanel, or nullptr on malformed CSV or a header that does not match.
     */
    [[nodiscard]] static std::shared_ptr<IndicatorPanel> parse(std::istream& in, const PanelSchema& schema);

    /**
     * @brief Parse a numeric cell. Thousands separators are accepted;
     *        "", "n/a", "NA", "--", ".." and non-numeric text are missing.
     */
    [[nodiscard]] static std::optional<double> parseValue(const std::string& cell);
};
