#include "BarWindow.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace demark {

BarWindow::BarWindow(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1))
{
}

void BarWindow::append_bar(const Bar& bar)
{
    bars_.push_back(bar);
    ++bar_count_;
    trim_if_needed();
}

const Bar& BarWindow::at(std::size_t offset) const
{
    if (offset >= bars_.size()) {
        throw std::out_of_range("BarWindow offset " + std::to_string(offset)
                                + " beyond " + std::to_string(bars_.size()) + " retained bars");
    }
    return bars_[bars_.size() - 1 - offset];
}

double BarWindow::lowest(PriceField field, std::size_t first_offset, std::size_t last_offset) const
{
    check_range(first_offset, last_offset);
    double result = value(field, first_offset);
    for (std::size_t k = first_offset + 1; k <= last_offset; ++k) {
        result = std::min(result, value(field, k));
    }
    return result;
}

double BarWindow::highest(PriceField field, std::size_t first_offset, std::size_t last_offset) const
{
    check_range(first_offset, last_offset);
    double result = value(field, first_offset);
    for (std::size_t k = first_offset + 1; k <= last_offset; ++k) {
        result = std::max(result, value(field, k));
    }
    return result;
}

std::optional<double> BarWindow::sma(PriceField field, std::size_t length, std::size_t offset) const
{
    if (length == 0 || offset + length > bars_.size()) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (std::size_t k = offset; k < offset + length; ++k) {
        sum += value(field, k);
    }
    return sum / static_cast<double>(length);
}

void BarWindow::clear()
{
    bars_.clear();
    bar_count_ = 0;
}

void BarWindow::trim_if_needed()
{
    while (bars_.size() > capacity_) {
        bars_.pop_front();
    }
}

void BarWindow::check_range(std::size_t first_offset, std::size_t last_offset) const
{
    if (first_offset > last_offset || last_offset >= bars_.size()) {
        throw std::out_of_range("BarWindow range [" + std::to_string(first_offset) + ", "
                                + std::to_string(last_offset) + "] beyond "
                                + std::to_string(bars_.size()) + " retained bars");
    }
}

} // namespace demark
