#pragma once

#include "Series.hpp"

#include <istream>
#include <string>
#include <vector>

namespace demark {
namespace validation {

/**
 * @brief Structure to hold a single OHLCV bar with timestamp
 */
struct OHLCVBar {
    std::string date;      // YYYYMMDD or YYYY-MM-DD
    std::string time;      // HHMM, may be empty
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

/**
 * @brief Parser for OHLC(V) text files
 *
 * Fields are separated by whitespace or commas:
 *   Date Time Open High Low Close [Volume]
 *   Date Open High Low Close [Volume]
 * Example: 20241001 0000 63327.60 63606.00 63006.70 63531.99 1336.93
 *
 * A six-field line is read as Date Time O H L C when the second field looks
 * like a time (HHMM or HH:MM[:SS]), otherwise as Date O H L C Volume.
 * A first line whose last column is not numeric is treated as a header.
 * Lines starting with '#' are comments.
 */
class OHLCVParser {
public:
    /**
     * @brief Parse OHLCV data from file
     * @return Vector of OHLCV bars, or empty on error
     */
    static std::vector<OHLCVBar> parse_file(const std::string& filepath);

    /**
     * @brief Parse OHLCV data from an already opened stream
     */
    static std::vector<OHLCVBar> parse_stream(std::istream& input);

    /**
     * @brief Convert parsed bars into a BarSeries for the engine
     */
    static BarSeries to_series(const std::vector<OHLCVBar>& bars, const std::string& symbol = {});

    /**
     * @brief Get last parse error message
     */
    static std::string get_last_error();

private:
    static std::string last_error_;
};

} // namespace validation
} // namespace demark
