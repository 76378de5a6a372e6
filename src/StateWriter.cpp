#include "StateWriter.hpp"

#include "JsonFormat.hpp"

#include <json/json.h>

#include <fstream>
#include <iomanip>

namespace demark {

namespace {

std::string join_signals(const std::vector<std::string>& signals)
{
    std::string joined;
    for (const auto& s : signals) {
        if (!joined.empty()) {
            joined += ';';
        }
        joined += s;
    }
    return joined;
}

Json::Value decision_to_json(const ExitDecision& decision)
{
    Json::Value out(Json::objectValue);
    out["triggered"] = decision.triggered;
    out["reason"] = std::string(to_string(decision.reason));
    return out;
}

} // namespace

std::vector<std::string> StateWriter::csv_columns()
{
    return {
        "bar", "date", "time", "open", "high", "low", "close",
        "ma1_active", "ma1_value", "ma2_active", "ma2_value", "entry_valid",
        "setup_count", "setup_complete", "setup_phase",
        "setup_bar9_close", "setup_bar9_range_pct", "setup_bar9_degenerate_range",
        "setup_lowest_low", "bars_since_setup9", "highest_close_since_setup9",
        "bearish_setup_count",
        "tdst_support", "tdst_active", "tdst_resistance", "tdst_res_active", "tdst_res_broken",
        "countdown", "countdown_complete", "recent_higher_low",
        "ma2_fast", "ma2_slow", "ma2_both_blue", "ma2_entry_valid", "ma2_fast_below_slow",
        "exhaustion_level", "stall_detected", "range_compression", "tdst_broken",
        "exhaustion_signals"
    };
}

bool StateWriter::write_csv(const std::string& output_path,
                            const BarSeries& series,
                            const std::vector<IndicatorState>& states,
                            std::string* error)
{
    if (states.size() != series.size()) {
        if (error) {
            *error = "State count " + std::to_string(states.size())
                   + " does not match bar count " + std::to_string(series.size());
        }
        return false;
    }

    std::ofstream file(output_path);
    if (!file.is_open()) {
        if (error) {
            *error = "Unable to open '" + output_path + "' for writing";
        }
        return false;
    }

    const auto columns = csv_columns();
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) file << ",";
        file << columns[i];
    }
    file << "\n";

    file << std::setprecision(10);
    for (std::size_t row = 0; row < states.size(); ++row) {
        const Bar& bar = series[row];
        const IndicatorState& s = states[row];

        file << s.bar_index << "," << bar.date << "," << bar.time << ","
             << bar.open << "," << bar.high << "," << bar.low << "," << bar.close << ","
             << s.ma1_active << "," << s.ma1_value << ","
             << s.ma2_active << "," << s.ma2_value << "," << s.entry_valid << ","
             << s.setup_count << "," << s.setup_complete << "," << to_string(s.setup_phase) << ","
             << s.setup_bar9_close << "," << s.setup_bar9_range_pct << ","
             << s.setup_bar9_degenerate_range << ","
             << s.setup_lowest_low << "," << s.bars_since_setup9 << ","
             << s.highest_close_since_setup9 << ","
             << s.bearish_setup_count << ","
             << s.tdst_support << "," << s.tdst_active << ","
             << s.tdst_resistance << "," << s.tdst_res_active << "," << s.tdst_res_broken << ","
             << s.countdown << "," << s.countdown_complete << "," << s.recent_higher_low << ","
             << s.ma2_fast << "," << s.ma2_slow << "," << s.ma2_both_blue << ","
             << s.ma2_entry_valid << "," << s.ma2_fast_below_slow << ","
             << to_string(s.exhaustion_level) << "," << s.stall_detected << ","
             << s.range_compression << "," << s.tdst_broken << ","
             << join_signals(s.exhaustion_signals) << "\n";
    }

    if (!file.good()) {
        if (error) {
            *error = "Failed to write '" + output_path + "'";
        }
        return false;
    }
    if (error) {
        error->clear();
    }
    return true;
}

std::string StateWriter::to_json_string(const IndicatorState& state)
{
    Json::Value root(Json::objectValue);
    root["bar_index"] = static_cast<Json::UInt64>(state.bar_index);

    Json::Value& ma = root["moving_average"];
    ma["ma1_active"] = state.ma1_active;
    ma["ma1_value"] = state.ma1_value;
    ma["ma2_active"] = state.ma2_active;
    ma["ma2_value"] = state.ma2_value;
    ma["entry_valid"] = state.entry_valid;

    Json::Value& setup = root["setup"];
    setup["count"] = state.setup_count;
    setup["complete"] = state.setup_complete;
    setup["phase"] = std::string(to_string(state.setup_phase));
    setup["bar9_close"] = state.setup_bar9_close;
    setup["bar9_range_pct"] = state.setup_bar9_range_pct;
    setup["bar9_degenerate_range"] = state.setup_bar9_degenerate_range;
    setup["lowest_low"] = state.setup_lowest_low;
    setup["bars_since_setup9"] = state.bars_since_setup9;
    setup["highest_close_since_setup9"] = state.highest_close_since_setup9;
    setup["bearish_count"] = state.bearish_setup_count;

    Json::Value& tdst = root["tdst"];
    tdst["support"] = state.tdst_support;
    tdst["support_active"] = state.tdst_active;
    tdst["resistance"] = state.tdst_resistance;
    tdst["resistance_active"] = state.tdst_res_active;
    tdst["resistance_broken"] = state.tdst_res_broken;

    Json::Value& countdown = root["countdown"];
    countdown["count"] = state.countdown;
    countdown["complete"] = state.countdown_complete;

    root["recent_higher_low"] = state.recent_higher_low;

    Json::Value& blue = root["ma2_blue"];
    blue["fast"] = state.ma2_fast;
    blue["slow"] = state.ma2_slow;
    blue["roc_fast"] = state.ma2_roc_fast;
    blue["roc_slow"] = state.ma2_roc_slow;
    blue["fast_blue"] = state.ma2_fast_blue;
    blue["slow_blue"] = state.ma2_slow_blue;
    blue["both_blue"] = state.ma2_both_blue;
    blue["fast_above_slow"] = state.ma2_fast_above_slow;
    blue["entry_valid"] = state.ma2_entry_valid;
    blue["fast_below_slow"] = state.ma2_fast_below_slow;

    Json::Value& exhaustion = root["exhaustion"];
    exhaustion["level"] = std::string(to_string(state.exhaustion_level));
    exhaustion["stall_detected"] = state.stall_detected;
    exhaustion["range_compression"] = state.range_compression;
    exhaustion["tdst_broken"] = state.tdst_broken;
    Json::Value& signals = exhaustion["signals"];
    signals = Json::Value(Json::arrayValue);
    for (const auto& s : state.exhaustion_signals) {
        signals.append(s);
    }

    const Readiness& r = state.readiness;
    Json::Value& ready = root["readiness"];
    ready["ma1"] = r.ma1;
    ready["ma2"] = r.ma2;
    ready["setup"] = r.setup;
    ready["countdown"] = r.countdown;
    ready["tdst"] = r.tdst;
    ready["higher_low"] = r.higher_low;
    ready["ma2_blue"] = r.ma2_blue;
    ready["exhaustion"] = r.exhaustion;

    return detail::to_json_text(root);
}

std::string StateWriter::to_json_string(const ExitEvaluation& evaluation)
{
    Json::Value root(Json::objectValue);
    Json::Value& tranches = root["tranches"];
    tranches = Json::Value(Json::arrayValue);
    for (const auto& t : evaluation.tranches) {
        Json::Value entry = decision_to_json(t.decision);
        entry["tranche"] = static_cast<int>(t.tranche);
        entry["fraction"] = t.fraction;
        tranches.append(entry);
    }
    root["total_fraction"] = evaluation.total_fraction();
    return detail::to_json_text(root);
}

} // namespace demark
