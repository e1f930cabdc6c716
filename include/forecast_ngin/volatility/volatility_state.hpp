// include/forecast_ngin/volatility/volatility_state.hpp
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/parameter_store.hpp"
#include "forecast_ngin/core/types.hpp"

namespace forecast_ngin {

class VolatilityBootstrap;

/**
 * @brief EWMA variance estimate of one asset
 *
 * variance_estimate is the variance of base-interval (one minute by default)
 * log returns. last_price anchors observe_price and is absent until a price
 * has been seen.
 */
struct VolatilityState {
    std::string asset_id;
    double variance_estimate{0.0};
    double decay_lambda{0.0};
    Timestamp last_update_ts{};
    uint64_t sample_count{0};
    std::optional<Price> last_price;

    nlohmann::json to_json() const;

    /**
     * @brief Parse and validate a persisted record
     * @return CORRUPT_PERSISTED_STATE if any field is missing or out of range
     */
    static Result<VolatilityState> from_json(const nlohmann::json& j);
};

/**
 * @brief Per-asset EWMA states with one reader/writer lock per asset
 *
 * The map lock is held only to find or create an entry. Each entry lock
 * serializes writers of that asset while snapshot reads share it. Bootstrap
 * runs under the entry's exclusive lock, so concurrent first accesses observe
 * a single bootstrapped value.
 */
class VolatilityStateStore {
public:
    VolatilityStateStore(std::shared_ptr<ParameterStore> parameters,
                         std::shared_ptr<VolatilityBootstrap> bootstrap, Clock clock = system_now);

    /**
     * @brief Apply variance' = lambda * variance + (1 - lambda) * r^2
     *
     * The asset is bootstrapped first if it has no state. Lambda is the live
     * value from the ParameterStore and is recorded on the state.
     *
     * @param asset Asset identifier
     * @param log_return Base-interval log return
     * @param ts Observation time
     * @return Updated state, or INVALID_OBSERVATION with the state left unchanged
     */
    Result<VolatilityState> update(const std::string& asset, double log_return,
                                   const Timestamp& ts);

    /**
     * @brief Derive the log return from the previous accepted price and update
     * The first price for an asset only anchors the state.
     */
    Result<VolatilityState> observe_price(const std::string& asset, Price price,
                                          const Timestamp& ts);

    /**
     * @brief Current snapshot of an asset, bootstrapping it on first reference
     */
    Result<VolatilityState> get(const std::string& asset);

    /**
     * @brief Current snapshot without triggering bootstrap
     */
    std::optional<VolatilityState> peek(const std::string& asset) const;

    /**
     * @brief Install an explicit state, replacing whatever was there
     */
    Result<void> seed(const std::string& asset, double variance, std::optional<Price> price,
                      const Timestamp& ts);

    /**
     * @brief Forget an asset so that its next reference bootstraps again
     */
    void reset(const std::string& asset);

    std::map<std::string, VolatilityState> snapshot_all() const;

    /**
     * @brief Load states recovered from persistence
     * Assets that already hold a state in this process keep it.
     */
    void restore(const std::map<std::string, VolatilityState>& states);

private:
    struct Entry {
        mutable std::shared_mutex mutex;
        std::optional<VolatilityState> state;
    };

    std::shared_ptr<Entry> entry_for(const std::string& asset);
    std::shared_ptr<Entry> find_entry(const std::string& asset) const;

    // Requires the entry's exclusive lock
    Result<void> ensure_initialized(Entry& entry, const std::string& asset);
    Result<VolatilityState> apply_return(Entry& entry, const std::string& asset,
                                         double log_return, const Timestamp& ts,
                                         std::optional<Price> price);

    std::shared_ptr<ParameterStore> parameters_;
    std::shared_ptr<VolatilityBootstrap> bootstrap_;
    Clock clock_;

    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace forecast_ngin
