#pragma once

#include "Series.hpp"

#include <optional>
#include <span>

namespace demark {

enum class PriceField {
    Open,
    High,
    Low,
    Close
};

double price_of(const Bar& bar, PriceField field) noexcept;

/// Arithmetic mean, or nullopt for an empty range
std::optional<double> mean(std::span<const double> values) noexcept;

/**
 * @brief Position of the close inside the bar's high-low range
 *
 * (close - low) / (high - low), clamped to [0, 1].
 *
 * @return nullopt when the bar has zero range (high == low)
 */
std::optional<double> close_location(const Bar& bar) noexcept;

} // namespace demark
