// src/governance/parameter_governance.cpp

#include "forecast_ngin/governance/parameter_governance.hpp"
#include <cmath>
#include <sstream>
#include "forecast_ngin/core/logger.hpp"
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

namespace {

// Absorbs binary representation error, e.g. 0.95 - 0.94 > 0.01
constexpr double STEP_TOLERANCE = 1e-9;

std::chrono::hours days(int n) {
    return std::chrono::hours(24 * n);
}

std::string pair_key(const std::string& asset, const std::string& parameter) {
    return asset + "/" + parameter;
}

std::string format_day(const Timestamp& ts) {
    return core::format_utc(ts, "%Y-%m-%d");
}

}  // namespace

std::string governance_status_to_string(GovernanceStatus status) {
    switch (status) {
        case GovernanceStatus::INELIGIBLE:
            return "INELIGIBLE";
        case GovernanceStatus::ELIGIBLE:
            return "ELIGIBLE";
        case GovernanceStatus::PROPOSED:
            return "PROPOSED";
        case GovernanceStatus::OBSERVING:
            return "OBSERVING";
    }
    return "UNKNOWN";
}

nlohmann::json TuningSuggestion::to_json() const {
    nlohmann::json j;
    j["asset"] = asset_id;
    j["parameter"] = parameter_name;
    j["direction"] = direction;
    j["change"] = change;
    j["reason"] = reason;
    return j;
}

ParameterGovernance::ParameterGovernance(std::shared_ptr<const ForecastConfig> config,
                                         std::shared_ptr<ParameterStore> parameters,
                                         std::shared_ptr<TuningLedger> ledger, Clock clock)
    : config_(std::move(config)),
      parameters_(std::move(parameters)),
      ledger_(std::move(ledger)),
      clock_(std::move(clock)) {}

GovernanceState ParameterGovernance::derive_state(const GovernanceConfig& config,
                                                  const std::vector<TuningHistoryEntry>& entries,
                                                  const Timestamp& genesis,
                                                  const std::string& asset,
                                                  const std::string& parameter,
                                                  const Timestamp& now) {
    std::optional<Timestamp> last_pair;
    std::optional<Timestamp> last_asset;
    for (const auto& entry : entries) {
        if (entry.asset_id != asset)
            continue;
        if (!last_asset || entry.timestamp > *last_asset)
            last_asset = entry.timestamp;
        if (entry.parameter_name == parameter && (!last_pair || entry.timestamp > *last_pair))
            last_pair = entry.timestamp;
    }

    GovernanceState state;

    if (last_pair) {
        const Timestamp observation_end = *last_pair + days(config.observation_days);
        if (now < observation_end) {
            state.status = GovernanceStatus::OBSERVING;
            state.until = observation_end;
            state.reason = "Observing change of " + format_day(*last_pair) + " until " +
                           format_day(observation_end);
            return state;
        }
    }

    if (!last_asset) {
        const Timestamp first_allowed = genesis + days(config.first_tuning_wait_days);
        if (now < first_allowed) {
            state.status = GovernanceStatus::INELIGIBLE;
            state.until = first_allowed;
            state.reason = "First tuning requires " +
                           std::to_string(config.first_tuning_wait_days) + " days (eligible " +
                           format_day(first_allowed) + ")";
            return state;
        }
    } else {
        const Timestamp next_allowed = *last_asset + days(config.min_days_between_tunings);
        if (now < next_allowed) {
            state.status = GovernanceStatus::INELIGIBLE;
            state.until = next_allowed;
            state.reason = "Min " + std::to_string(config.min_days_between_tunings) +
                           " days between tunings on " + asset + " (eligible " +
                           format_day(next_allowed) + ")";
            return state;
        }
    }

    if (parameter == parameters::SIGMA_CAP_DAILY && last_pair) {
        const Timestamp next_allowed = *last_pair + days(config.cap_cadence_days);
        if (now < next_allowed) {
            state.status = GovernanceStatus::INELIGIBLE;
            state.until = next_allowed;
            state.reason = "sigma_cap_daily changes at most every " +
                           std::to_string(config.cap_cadence_days) + " days (eligible " +
                           format_day(next_allowed) + ")";
            return state;
        }
    }

    state.status = GovernanceStatus::ELIGIBLE;
    state.reason = "Tuning eligible";
    return state;
}

GovernanceState ParameterGovernance::proposal_state(const GovernanceConfig& config,
                                                    const std::vector<TuningHistoryEntry>& entries,
                                                    const Timestamp& genesis,
                                                    const std::string& asset,
                                                    const std::string& parameter,
                                                    const Timestamp& now) {
    GovernanceState pair_state = derive_state(config, entries, genesis, asset, parameter, now);
    if (pair_state.status != GovernanceStatus::ELIGIBLE) {
        return pair_state;
    }
    for (const char* other :
         {parameters::LAMBDA, parameters::DF, parameters::SIGMA_CAP_DAILY}) {
        if (parameter == other)
            continue;
        GovernanceState other_state = derive_state(config, entries, genesis, asset, other, now);
        if (other_state.status == GovernanceStatus::OBSERVING) {
            GovernanceState blocked;
            blocked.status = GovernanceStatus::INELIGIBLE;
            blocked.until = other_state.until;
            blocked.reason = std::string(other) + " on " + asset + " is still under observation";
            return blocked;
        }
    }
    return pair_state;
}

GovernanceState ParameterGovernance::state(const std::string& asset,
                                           const std::string& parameter) const {
    {
        std::lock_guard<std::mutex> lock(pairs_mutex_);
        if (in_flight_.count(pair_key(asset, parameter)) > 0) {
            return GovernanceState{GovernanceStatus::PROPOSED, "Proposal being applied",
                                   std::nullopt};
        }
    }
    return derive_state(config_->governance, ledger_->entries(), ledger_->genesis(), asset,
                        parameter, clock_());
}

std::pair<bool, std::string> ParameterGovernance::check_eligibility(
    const std::string& asset, const std::string& parameter) const {
    if (!config_->governance.bounds_for(parameter).has_value()) {
        return {false, "Unknown parameter: " + parameter};
    }
    if (!ledger_->is_loaded()) {
        return {false, "Tuning ledger not loaded"};
    }
    {
        std::lock_guard<std::mutex> lock(pairs_mutex_);
        if (in_flight_.count(pair_key(asset, parameter)) > 0) {
            return {false, "Proposal being applied"};
        }
    }
    GovernanceState current = proposal_state(config_->governance, ledger_->entries(),
                                             ledger_->genesis(), asset, parameter, clock_());
    return {current.status == GovernanceStatus::ELIGIBLE, current.reason};
}

std::map<std::string, LiveParameters> ParameterGovernance::current_values() const {
    return parameters_->current_values();
}

std::shared_ptr<std::mutex> ParameterGovernance::pair_mutex(const std::string& key) {
    std::lock_guard<std::mutex> lock(pairs_mutex_);
    auto& mutex = pair_mutexes_[key];
    if (!mutex) {
        mutex = std::make_shared<std::mutex>();
    }
    return mutex;
}

Result<void> ParameterGovernance::check_value(const std::string& parameter, double current,
                                              double proposed) const {
    auto bounds = config_->governance.bounds_for(parameter);
    if (!bounds.has_value()) {
        return make_error<void>(ErrorCode::GOVERNANCE_REJECTED, "Unknown parameter: " + parameter,
                                "ParameterGovernance");
    }

    std::ostringstream msg;
    if (!std::isfinite(proposed)) {
        msg << "Proposed " << parameter << " is not finite";
    } else if (proposed < bounds->min_value || proposed > bounds->max_value) {
        msg << "Value " << proposed << " out of bounds [" << bounds->min_value << ", "
            << bounds->max_value << "]";
    } else if (bounds->integral && std::floor(proposed) != proposed) {
        msg << parameter << " must be an integer, got " << proposed;
    } else if (std::fabs(proposed - current) > bounds->max_step + STEP_TOLERANCE) {
        msg << "Step size " << std::fabs(proposed - current) << " exceeds max "
            << bounds->max_step;
    } else if (proposed == current) {
        msg << parameter << " already " << current;
    } else {
        return Result<void>();
    }
    return make_error<void>(ErrorCode::GOVERNANCE_REJECTED, msg.str(), "ParameterGovernance");
}

Result<TuningHistoryEntry> ParameterGovernance::propose_change(const std::string& asset,
                                                               const std::string& parameter,
                                                               double new_value,
                                                               const std::string& reason) {
    Logger::register_component("ParameterGovernance");

    const std::string key = pair_key(asset, parameter);
    auto mutex = pair_mutex(key);
    std::lock_guard<std::mutex> pair_lock(*mutex);

    auto current = parameters_->get_value(asset, parameter);
    if (current.is_error()) {
        WARN("Rejected " << key << ": " << current.error()->what());
        return make_error<TuningHistoryEntry>(ErrorCode::GOVERNANCE_REJECTED,
                                              current.error()->what(), "ParameterGovernance");
    }
    const double old_value = current.value();

    auto valid = check_value(parameter, old_value, new_value);
    if (valid.is_error()) {
        WARN("Rejected " << key << " -> " << new_value << ": " << valid.error()->what());
        return forward_error<TuningHistoryEntry>(valid, "ParameterGovernance");
    }

    // The ledger stores whole seconds; keep the in-memory entry identical
    const Timestamp now = core::truncate_to_seconds(clock_());
    TuningHistoryEntry entry{asset, parameter, old_value, new_value, now, reason};
    const GovernanceConfig& rules = config_->governance;
    const Timestamp genesis = ledger_->genesis();

    // Timing rules are evaluated against the ledger contents at append time
    auto check = [&](const std::vector<TuningHistoryEntry>& entries) -> Result<void> {
        GovernanceState timing = proposal_state(rules, entries, genesis, asset, parameter, now);
        if (timing.status != GovernanceStatus::ELIGIBLE) {
            return make_error<void>(ErrorCode::GOVERNANCE_REJECTED, timing.reason,
                                    "ParameterGovernance");
        }
        return Result<void>();
    };

    {
        std::lock_guard<std::mutex> lock(pairs_mutex_);
        in_flight_.insert(key);
    }
    auto appended = ledger_->append_if(entry, check);
    Result<void> applied;
    if (appended.is_ok()) {
        applied = parameters_->set_value(asset, parameter, new_value);
    }
    {
        std::lock_guard<std::mutex> lock(pairs_mutex_);
        in_flight_.erase(key);
    }

    if (appended.is_error()) {
        WARN("Rejected " << key << " -> " << new_value << ": " << appended.error()->what());
        return forward_error<TuningHistoryEntry>(appended, "ParameterGovernance");
    }
    if (applied.is_error()) {
        ERROR("Ledger updated but live value not applied for " << key << ": "
                                                               << applied.error()->what());
        return forward_error<TuningHistoryEntry>(applied, "ParameterGovernance");
    }

    INFO("Parameter tuning recorded: " << asset << " " << parameter << " " << old_value << " -> "
                                       << new_value << " (" << reason << ")");
    return entry;
}

std::vector<TuningSuggestion> ParameterGovernance::suggest_changes(
    const DiagnosticsReport& report) const {
    const GovernanceConfig& rules = config_->governance;
    std::vector<TuningSuggestion> suggestions;

    if (!report.overall.has_value() || report.overall->count < rules.min_points_for_suggestion) {
        DEBUG("Not enough scored points for tuning suggestions");
        return suggestions;
    }
    if (report.overall->mean < rules.good_crps_threshold) {
        DEBUG("Overall CRPS " << report.overall->mean << " below "
                              << rules.good_crps_threshold << ", no suggestions");
        return suggestions;
    }

    std::ostringstream reason;
    auto short_it = report.by_bucket.find(HorizonBucket::SHORT);
    if (short_it != report.by_bucket.end() &&
        short_it->second.count >= rules.min_points_for_suggestion &&
        short_it->second.mean > rules.short_crps_threshold) {
        reason << "Short-horizon CRPS too high (" << short_it->second.mean << " > "
               << rules.short_crps_threshold << ")";
        suggestions.push_back({"ALL", parameters::LAMBDA, "down", -rules.lambda_bounds.max_step,
                               reason.str()});
    }

    auto coverage_it = report.coverage.find(95);
    if (coverage_it != report.coverage.end() &&
        coverage_it->second.count >= rules.min_points_for_suggestion) {
        const double observed = coverage_it->second.observed;
        reason.str("");
        if (observed < rules.coverage_95_low) {
            reason << "95% coverage too low (" << observed << " < " << rules.coverage_95_low
                   << "), too many breaches";
            suggestions.push_back(
                {"ALL", parameters::DF, "down", -rules.df_bounds.max_step, reason.str()});
        } else if (observed > rules.coverage_95_high) {
            reason << "95% coverage too high (" << observed << " > " << rules.coverage_95_high
                   << "), too conservative";
            suggestions.push_back(
                {"ALL", parameters::DF, "up", rules.df_bounds.max_step, reason.str()});
        }
    }

    auto long_it = report.by_bucket.find(HorizonBucket::LONG);
    if (long_it != report.by_bucket.end() &&
        long_it->second.count >= rules.min_points_for_suggestion &&
        long_it->second.mean > rules.long_crps_threshold) {
        reason.str("");
        reason << "Long-horizon CRPS high (" << long_it->second.mean << " > "
               << rules.long_crps_threshold << "), cap change subject to "
               << rules.cap_cadence_days << "-day cadence";
        suggestions.push_back({"ALL", parameters::SIGMA_CAP_DAILY, "down",
                               -rules.cap_bounds.max_step, reason.str()});
    }

    for (const auto& s : suggestions) {
        INFO("Tuning suggestion: " << s.parameter_name << " " << s.direction << " (" << s.reason
                                   << ")");
    }
    return suggestions;
}

}  // namespace forecast_ngin
