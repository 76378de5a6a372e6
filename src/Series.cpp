#include "Series.hpp"

#include <cmath>

namespace demark {

bool validate_bar(const Bar& bar, std::string& error)
{
    if (!std::isfinite(bar.open) || !std::isfinite(bar.high)
        || !std::isfinite(bar.low) || !std::isfinite(bar.close)) {
        error = "Bar contains non-finite prices";
        return false;
    }

    if (bar.high < bar.low) {
        error = "Bar high " + std::to_string(bar.high) + " is below low " + std::to_string(bar.low);
        return false;
    }

    error.clear();
    return true;
}

} // namespace demark
