#include "IndicatorState.hpp"

namespace demark {

bool Readiness::is_ready(CalculatorId id) const noexcept
{
    switch (id) {
        case CalculatorId::MovingAverage1: return ma1;
        case CalculatorId::MovingAverage2: return ma2;
        case CalculatorId::Setup: return setup;
        case CalculatorId::Countdown: return countdown;
        case CalculatorId::Tdst: return tdst;
        case CalculatorId::HigherLow: return higher_low;
        case CalculatorId::Ma2Blue: return ma2_blue;
        case CalculatorId::Exhaustion: return exhaustion;
    }
    return false;
}

bool Readiness::all_ready() const noexcept
{
    return ma1 && ma2 && setup && countdown && tdst && higher_low && ma2_blue && exhaustion;
}

std::string_view to_string(CalculatorId id)
{
    switch (id) {
        case CalculatorId::MovingAverage1: return "TD MA I";
        case CalculatorId::MovingAverage2: return "TD MA II";
        case CalculatorId::Setup: return "TD SETUP";
        case CalculatorId::Countdown: return "TD COUNTDOWN";
        case CalculatorId::Tdst: return "TDST";
        case CalculatorId::HigherLow: return "HIGHER LOW";
        case CalculatorId::Ma2Blue: return "TD MA II BLUE";
        case CalculatorId::Exhaustion: return "EXHAUSTION";
    }
    return "UNKNOWN";
}

std::string_view to_string(IndicatorStatus status)
{
    switch (status) {
        case IndicatorStatus::Ok: return "OK";
        case IndicatorStatus::InsufficientHistory: return "INSUFFICIENT_HISTORY";
    }
    return "UNKNOWN";
}

std::string_view to_string(SetupPhase phase)
{
    switch (phase) {
        case SetupPhase::Idle: return "IDLE";
        case SetupPhase::Building: return "BUILDING";
        case SetupPhase::Completed: return "COMPLETED";
    }
    return "UNKNOWN";
}

std::string_view to_string(ExhaustionLevel level)
{
    switch (level) {
        case ExhaustionLevel::None: return "NONE";
        case ExhaustionLevel::Maturing: return "MATURING";
        case ExhaustionLevel::Vulnerable: return "VULNERABLE";
        case ExhaustionLevel::Exhausted: return "EXHAUSTED";
        case ExhaustionLevel::Confirmed: return "CONFIRMED";
    }
    return "UNKNOWN";
}

} // namespace demark
