#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace demark {

/// One OHLC bar. Identified by its position in the owning series.
struct Bar {
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};

    // Carried through to exports, never read by the calculators
    std::string date;
    std::string time;
};

/// Ordered bars for a single instrument
struct BarSeries {
    std::string symbol;
    std::vector<Bar> bars;

    std::size_t size() const noexcept { return bars.size(); }
    bool empty() const noexcept { return bars.empty(); }

    const Bar& operator[](std::size_t idx) const noexcept { return bars[idx]; }
};

/// Check that a bar carries finite prices and high >= low
bool validate_bar(const Bar& bar, std::string& error);

} // namespace demark
