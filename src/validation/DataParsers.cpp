#include "validation/DataParsers.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace demark {
namespace validation {

namespace {

bool parse_number(const std::string& token, double& value)
{
    std::istringstream iss(token);
    iss >> value;
    return !iss.fail() && iss.eof();
}

bool looks_like_time(const std::string& token)
{
    if (token.find(':') != std::string::npos) {
        return true;
    }
    return token.size() == 4
        && std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string> split_fields(std::string line)
{
    std::replace(line.begin(), line.end(), ',', ' ');
    std::istringstream iss(line);
    std::vector<std::string> fields;
    std::string token;
    while (iss >> token) {
        fields.push_back(token);
    }
    return fields;
}

// Fills `bar` from the split fields. Returns false when a price is not numeric.
bool fill_bar(const std::vector<std::string>& fields, OHLCVBar& bar)
{
    std::size_t price_start = 1;
    bool has_volume = false;

    switch (fields.size()) {
        case 5:
            break;
        case 6:
            if (looks_like_time(fields[1])) {
                price_start = 2;
            } else {
                has_volume = true;
            }
            break;
        case 7:
            price_start = 2;
            has_volume = true;
            break;
        default:
            return false;
    }

    bar.date = fields[0];
    bar.time = price_start == 2 ? fields[1] : std::string();

    if (!parse_number(fields[price_start], bar.open)
        || !parse_number(fields[price_start + 1], bar.high)
        || !parse_number(fields[price_start + 2], bar.low)
        || !parse_number(fields[price_start + 3], bar.close)) {
        return false;
    }

    bar.volume = 0.0;
    if (has_volume && !parse_number(fields[price_start + 4], bar.volume)) {
        return false;
    }
    return true;
}

} // namespace

// ============================================================================
// OHLCVParser Implementation
// ============================================================================

std::string OHLCVParser::last_error_;

std::vector<OHLCVBar> OHLCVParser::parse_file(const std::string& filepath)
{
    last_error_.clear();

    std::ifstream file(filepath);
    if (!file.is_open()) {
        last_error_ = "Failed to open file: " + filepath;
        return {};
    }

    return parse_stream(file);
}

std::vector<OHLCVBar> OHLCVParser::parse_stream(std::istream& input)
{
    last_error_.clear();
    std::vector<OHLCVBar> bars;

    std::string line;
    size_t line_num = 0;
    bool first_content_line = true;

    while (std::getline(input, line)) {
        ++line_num;

        // Skip empty lines and comments
        const auto first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        const auto fields = split_fields(line);

        // A column header is a first line that does not end in a number
        if (first_content_line) {
            first_content_line = false;
            double last_value = 0.0;
            if (!fields.empty() && !parse_number(fields.back(), last_value)) {
                continue;
            }
        }

        if (fields.size() < 5 || fields.size() > 7) {
            last_error_ = "Parse error at line " + std::to_string(line_num)
                        + ": expected 5 to 7 fields, got " + std::to_string(fields.size());
            return std::vector<OHLCVBar>();
        }

        OHLCVBar bar;
        if (!fill_bar(fields, bar)) {
            last_error_ = "Parse error at line " + std::to_string(line_num) + ": " + line;
            return std::vector<OHLCVBar>();  // Return empty on error
        }

        bars.push_back(bar);
    }

    if (bars.empty()) {
        last_error_ = "No data parsed from input";
    }

    return bars;
}

BarSeries OHLCVParser::to_series(const std::vector<OHLCVBar>& bars, const std::string& symbol)
{
    BarSeries series;
    series.symbol = symbol;
    series.bars.reserve(bars.size());

    for (const auto& bar : bars) {
        Bar out;
        out.open = bar.open;
        out.high = bar.high;
        out.low = bar.low;
        out.close = bar.close;
        out.date = bar.date;
        out.time = bar.time;
        series.bars.push_back(std::move(out));
    }

    return series;
}

std::string OHLCVParser::get_last_error()
{
    return last_error_;
}

} // namespace validation
} // namespace demark
