// include/forecast_ngin/simulation/forecast_engine.hpp
#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/forecast_config.hpp"
#include "forecast_ngin/core/parameter_store.hpp"
#include "forecast_ngin/core/types.hpp"
#include "forecast_ngin/data/price_source.hpp"
#include "forecast_ngin/evaluation/prediction_logger.hpp"
#include "forecast_ngin/evaluation/prediction_record.hpp"
#include "forecast_ngin/governance/parameter_governance.hpp"
#include "forecast_ngin/governance/tuning_ledger.hpp"
#include "forecast_ngin/simulation/path_ensemble.hpp"
#include "forecast_ngin/simulation/path_generator.hpp"
#include "forecast_ngin/storage/state_persistence.hpp"
#include "forecast_ngin/storage/storage_backend.hpp"
#include "forecast_ngin/volatility/market_hours.hpp"
#include "forecast_ngin/volatility/volatility_bootstrap.hpp"
#include "forecast_ngin/volatility/volatility_scaler.hpp"
#include "forecast_ngin/volatility/volatility_state.hpp"

namespace forecast_ngin {

/**
 * @brief One forecast request
 */
struct ForecastRequest {
    std::string asset_id;
    Timestamp t0{};
    int64_t increment_seconds{60};
    int64_t horizon_seconds{3600};
    bool update_from_spot{true};    // Feed the fetched spot into the EWMA before generating
    std::optional<uint64_t> seed;  // Overrides the configured seed
};

struct ForecastResult {
    PathEnsemble ensemble;
    HorizonLabel label{HorizonLabel::CUSTOM};
    ParameterSnapshot parameters;
    bool logged{false};
};

/**
 * @brief Wires the volatility model, generator, persistence and governance together
 *
 * Request flow: spot fetch -> EWMA update -> state snapshot (bootstrap on
 * first use) -> market-hours gate -> scaler -> generator -> sampled logging
 * -> throttled state persistence. Logging and persistence failures are
 * reported but never fail the request.
 */
class ForecastEngine {
public:
    ForecastEngine(std::shared_ptr<const ForecastConfig> config,
                   std::shared_ptr<PriceSource> prices, std::shared_ptr<StorageBackend> storage,
                   Clock clock = system_now);

    /**
     * @brief Build components, replay the tuning ledger and reload volatility state
     */
    Result<void> initialize();

    bool is_initialized() const {
        return initialized_;
    }

    Result<ForecastResult> forecast(const ForecastRequest& request);

    /**
     * @brief Generate an ensemble on an explicit grid without updating the EWMA
     * @param step_count Grid points including t0
     */
    Result<PathEnsemble> generate(const std::string& asset, const Timestamp& t0,
                                  int64_t increment_seconds, int step_count);

    /**
     * @brief Force a state snapshot regardless of the throttle
     */
    Result<void> persist_state();

    // Component access
    ParameterStore* get_parameters() { return parameters_.get(); }
    VolatilityStateStore* get_state_store() { return states_.get(); }
    ParameterGovernance* get_governance() { return governance_.get(); }
    PredictionLogger* get_prediction_logger() { return prediction_logger_.get(); }
    TuningLedger* get_ledger() { return ledger_.get(); }

private:
    Result<ForecastResult> build(const std::string& asset, const Timestamp& t0, Price spot,
                                 int64_t increment_seconds, int step_count, HorizonLabel label,
                                 std::optional<uint64_t> seed);
    uint64_t next_seed(std::optional<uint64_t> requested) const;
    void persist_if_due();

    std::shared_ptr<const ForecastConfig> config_;
    std::shared_ptr<PriceSource> prices_;
    std::shared_ptr<StorageBackend> storage_;
    Clock clock_;

    std::shared_ptr<ParameterStore> parameters_;
    std::shared_ptr<TuningLedger> ledger_;
    std::shared_ptr<VolatilityBootstrap> bootstrap_;
    std::shared_ptr<VolatilityStateStore> states_;
    std::unique_ptr<StatePersistence> persistence_;
    std::unique_ptr<VolatilityScaler> scaler_;
    std::unique_ptr<MarketHoursGate> gate_;
    std::unique_ptr<PathGenerator> generator_;
    std::shared_ptr<PredictionLogger> prediction_logger_;
    std::unique_ptr<ParameterGovernance> governance_;

    std::atomic<bool> dirty_{false};
    bool initialized_{false};
};

}  // namespace forecast_ngin
