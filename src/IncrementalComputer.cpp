#include "IncrementalComputer.hpp"

#include "Logger.hpp"

#include <string>
#include <utility>

namespace demark {

IncrementalComputer::IncrementalComputer(const EngineConfig& config, bool keep_history)
    : engine_(config)
    , state_(engine_.initial_state())
    , keep_history_(keep_history)
{
}

bool IncrementalComputer::append_bar(const Bar& bar)
{
    std::string error;
    if (!validate_bar(bar, error)) {
        ++rejected_count_;
        Logger::warning("Rejected bar " + std::to_string(bar_count_) + ": " + error);
        return false;
    }

    state_ = engine_.step(std::move(state_), bar);
    ++bar_count_;

    if (keep_history_) {
        history_.push_back(state_.latest);
    }
    return true;
}

std::optional<IndicatorState> IncrementalComputer::latest() const
{
    if (bar_count_ == 0) {
        return std::nullopt;
    }
    return state_.latest;
}

void IncrementalComputer::reset()
{
    state_ = engine_.initial_state();
    history_.clear();
    bar_count_ = 0;
    rejected_count_ = 0;
}

} // namespace demark
