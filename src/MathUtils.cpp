#include "MathUtils.hpp"

#include <algorithm>
#include <numeric>

namespace demark {

double price_of(const Bar& bar, PriceField field) noexcept
{
    switch (field) {
        case PriceField::Open: return bar.open;
        case PriceField::High: return bar.high;
        case PriceField::Low: return bar.low;
        case PriceField::Close: return bar.close;
    }
    return bar.close;
}

std::optional<double> mean(std::span<const double> values) noexcept
{
    if (values.empty()) {
        return std::nullopt;
    }
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

std::optional<double> close_location(const Bar& bar) noexcept
{
    const double range = bar.high - bar.low;
    if (!(range > 0.0)) {
        return std::nullopt;
    }
    return std::clamp((bar.close - bar.low) / range, 0.0, 1.0);
}

} // namespace demark
