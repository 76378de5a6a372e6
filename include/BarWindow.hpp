#pragma once

#include "MathUtils.hpp"
#include "Series.hpp"

#include <cstddef>
#include <deque>
#include <optional>

namespace demark {

/// Rolling window over the most recent bars of one instrument.
///
/// Offsets are counted backwards from the latest bar: offset 0 is the bar
/// being processed, offset 1 the bar before it, and so on. The window keeps
/// at most `capacity` bars but remembers how many bars it has seen in total,
/// so calculators can reason about absolute bar indices.
class BarWindow {
public:
    explicit BarWindow(std::size_t capacity = 64);

    /// Append a new bar, evicting the oldest one once capacity is reached
    void append_bar(const Bar& bar);

    /// Bars currently retained
    std::size_t size() const noexcept { return bars_.size(); }

    /// Bars appended since construction or the last clear()
    std::size_t bar_count() const noexcept { return bar_count_; }

    std::size_t capacity() const noexcept { return capacity_; }

    bool empty() const noexcept { return bars_.empty(); }

    /// Absolute index of the latest bar. Requires a non-empty window.
    std::size_t current_index() const noexcept { return bar_count_ - 1; }

    /// Check if enough bars have been seen for a given lookback
    bool has_enough_data(std::size_t required_bars) const noexcept {
        return bar_count_ >= required_bars;
    }

    /// Bar at `offset` back from the latest. Throws std::out_of_range.
    const Bar& at(std::size_t offset) const;

    const Bar& latest() const { return at(0); }

    double value(PriceField field, std::size_t offset) const {
        return price_of(at(offset), field);
    }

    /// Minimum of `field` over offsets [first_offset, last_offset]
    double lowest(PriceField field, std::size_t first_offset, std::size_t last_offset) const;

    /// Maximum of `field` over offsets [first_offset, last_offset]
    double highest(PriceField field, std::size_t first_offset, std::size_t last_offset) const;

    /// Simple moving average of the `length` bars ending `offset` bars back.
    /// Returns nullopt while fewer bars are retained than the average needs.
    std::optional<double> sma(PriceField field, std::size_t length, std::size_t offset = 0) const;

    /// Clear all data
    void clear();

private:
    std::deque<Bar> bars_;
    std::size_t capacity_;
    std::size_t bar_count_{0};

    void trim_if_needed();
    void check_range(std::size_t first_offset, std::size_t last_offset) const;
};

} // namespace demark
