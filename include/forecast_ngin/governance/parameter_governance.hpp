// include/forecast_ngin/governance/parameter_governance.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/forecast_config.hpp"
#include "forecast_ngin/core/parameter_store.hpp"
#include "forecast_ngin/core/types.hpp"
#include "forecast_ngin/evaluation/diagnostics.hpp"
#include "forecast_ngin/governance/tuning_ledger.hpp"

namespace forecast_ngin {

enum class GovernanceStatus { INELIGIBLE, ELIGIBLE, PROPOSED, OBSERVING };

std::string governance_status_to_string(GovernanceStatus status);

/**
 * @brief Tuning state of one (asset, parameter) pair at a point in time
 */
struct GovernanceState {
    GovernanceStatus status{GovernanceStatus::INELIGIBLE};
    std::string reason;
    std::optional<Timestamp> until;  // End of the current waiting or observation period
};

/**
 * @brief Advisory change derived from diagnostics; never applied automatically
 */
struct TuningSuggestion {
    std::string asset_id;  // "ALL" when derived from pooled diagnostics
    std::string parameter_name;
    std::string direction;  // "up" or "down"
    double change{0.0};
    std::string reason;

    nlohmann::json to_json() const;
};

/**
 * @brief Gates parameter changes behind timing and magnitude rules
 *
 * The state of a pair is derived from the tuning ledger and the clock only:
 * - no change on the asset yet: INELIGIBLE until genesis + first_tuning_wait_days
 * - change on the pair at T: OBSERVING until T + observation_days
 * - any change on the asset at A: INELIGIBLE until A + min_days_between_tunings
 * - sigma_cap_daily additionally waits cap_cadence_days after its last change
 *
 * PROPOSED is only visible while an accepted proposal is being written.
 */
class ParameterGovernance {
public:
    ParameterGovernance(std::shared_ptr<const ForecastConfig> config,
                        std::shared_ptr<ParameterStore> parameters,
                        std::shared_ptr<TuningLedger> ledger, Clock clock = system_now);

    /**
     * @brief Pure state derivation over ledger entries
     */
    static GovernanceState derive_state(const GovernanceConfig& config,
                                        const std::vector<TuningHistoryEntry>& entries,
                                        const Timestamp& genesis, const std::string& asset,
                                        const std::string& parameter, const Timestamp& now);

    /**
     * @brief Timing verdict for a new proposal on the pair
     *
     * Adds to derive_state the rule that no parameter of an asset changes while
     * another parameter of the same asset is OBSERVING.
     */
    static GovernanceState proposal_state(const GovernanceConfig& config,
                                          const std::vector<TuningHistoryEntry>& entries,
                                          const Timestamp& genesis, const std::string& asset,
                                          const std::string& parameter, const Timestamp& now);

    GovernanceState state(const std::string& asset, const std::string& parameter) const;

    /**
     * @brief Whether a proposal for the pair would pass the timing rules now
     * @return (eligible, human readable reason)
     */
    std::pair<bool, std::string> check_eligibility(const std::string& asset,
                                                   const std::string& parameter) const;

    std::map<std::string, LiveParameters> current_values() const;

    /**
     * @brief Validate and apply one parameter change
     *
     * Rejections return GOVERNANCE_REJECTED with the reason and leave both
     * the ledger and the live parameters untouched.
     *
     * @return The ledger entry that was appended
     */
    Result<TuningHistoryEntry> propose_change(const std::string& asset,
                                              const std::string& parameter, double new_value,
                                              const std::string& reason);

    std::vector<TuningSuggestion> suggest_changes(const DiagnosticsReport& report) const;

private:
    std::shared_ptr<std::mutex> pair_mutex(const std::string& key);
    Result<void> check_value(const std::string& parameter, double current, double proposed) const;

    std::shared_ptr<const ForecastConfig> config_;
    std::shared_ptr<ParameterStore> parameters_;
    std::shared_ptr<TuningLedger> ledger_;
    Clock clock_;

    mutable std::mutex pairs_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> pair_mutexes_;
    std::set<std::string> in_flight_;
};

}  // namespace forecast_ngin
