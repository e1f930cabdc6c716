// src/simulation/forecast_engine.cpp

#include "forecast_ngin/simulation/forecast_engine.hpp"
#include <cmath>
#include <random>
#include "forecast_ngin/core/logger.hpp"
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

ForecastEngine::ForecastEngine(std::shared_ptr<const ForecastConfig> config,
                               std::shared_ptr<PriceSource> prices,
                               std::shared_ptr<StorageBackend> storage, Clock clock)
    : config_(std::move(config)),
      prices_(std::move(prices)),
      storage_(std::move(storage)),
      clock_(std::move(clock)) {}

Result<void> ForecastEngine::initialize() {
    Logger::register_component("ForecastEngine");

    if (initialized_) {
        return Result<void>();
    }
    if (!config_ || !prices_ || !storage_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Engine requires configuration, price source and storage",
                                "ForecastEngine");
    }

    auto problems = config_->validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            ERROR("Invalid configuration " << problem.field << ": " << problem.message);
        }
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                std::to_string(problems.size()) + " configuration errors",
                                "ForecastEngine");
    }

    parameters_ = std::make_shared<ParameterStore>(config_);

    ledger_ = std::make_shared<TuningLedger>(storage_, config_->persistence.ledger_key, clock_);
    auto ledger_loaded = ledger_->load();
    if (ledger_loaded.is_error()) {
        // Without a trustworthy ledger neither live values nor eligibility can be derived
        ERROR("Tuning ledger unusable: " << ledger_loaded.error()->what());
        return ledger_loaded;
    }
    auto replayed = ledger_->apply_to(*parameters_);
    if (replayed.is_error()) {
        return replayed;
    }

    bootstrap_ = std::make_shared<VolatilityBootstrap>(prices_, config_);
    states_ = std::make_shared<VolatilityStateStore>(parameters_, bootstrap_, clock_);

    persistence_ = std::make_unique<StatePersistence>(storage_, config_->persistence, clock_);
    LoadedStates loaded = persistence_->load();
    states_->restore(loaded.states);
    for (const auto& asset : loaded.rejected_assets) {
        WARN("Persisted state for " << asset << " rejected, asset will bootstrap");
    }
    INFO("Restored volatility state for " << loaded.states.size() << " assets");

    scaler_ = std::make_unique<VolatilityScaler>(config_, parameters_);
    gate_ = std::make_unique<MarketHoursGate>(config_);
    generator_ = std::make_unique<PathGenerator>(config_->generator.significant_digits);
    prediction_logger_ = std::make_shared<PredictionLogger>(storage_, config_->persistence);
    governance_ = std::make_unique<ParameterGovernance>(config_, parameters_, ledger_, clock_);

    initialized_ = true;
    return Result<void>();
}

uint64_t ForecastEngine::next_seed(std::optional<uint64_t> requested) const {
    if (requested.has_value()) {
        return *requested;
    }
    if (config_->generator.seed.has_value()) {
        return *config_->generator.seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | static_cast<uint64_t>(rd());
}

Result<ForecastResult> ForecastEngine::build(const std::string& asset, const Timestamp& t0,
                                             Price spot, int64_t increment_seconds,
                                             int step_count, HorizonLabel label,
                                             std::optional<uint64_t> seed) {
    // One snapshot read; nothing below holds the asset lock
    auto state = states_->get(asset);
    if (state.is_error()) {
        return forward_error<ForecastResult>(state, "ForecastEngine");
    }
    const VolatilityState& snapshot = state.value();

    const AssetProfile& profile = config_->profile_for(asset);
    const LiveParameters live = parameters_->get(asset);
    const bool flatten = gate_->should_flatten(asset, t0);

    GenerationInput input;
    input.asset_id = asset;
    input.t0 = t0;
    input.spot = spot;
    input.increment_seconds = increment_seconds;
    input.step_count = step_count;
    input.family = profile.family_for(live.df, config_->generator.gaussian_df_threshold);
    input.flatten = flatten;
    input.seed = next_seed(seed);

    if (flatten) {
        DEBUG(asset << " outside market hours at " << core::to_iso8601(t0) << ", flattening");
    } else {
        auto sigma = scaler_->scale(snapshot, increment_seconds, label);
        if (sigma.is_error()) {
            ERROR("Scaling failed for " << asset << ": " << sigma.error()->what());
            return forward_error<ForecastResult>(sigma, "ForecastEngine");
        }
        input.sigma_step = sigma.value().sigma_step;
    }

    auto ensemble = generator_->generate(input);
    if (ensemble.is_error()) {
        ERROR("Path generation failed for " << asset << ": " << ensemble.error()->what());
        return forward_error<ForecastResult>(ensemble, "ForecastEngine");
    }

    ForecastResult result;
    result.ensemble = ensemble.take_value();
    result.label = label;
    result.parameters.family = family_to_string(input.family);
    result.parameters.df = live.df;
    result.parameters.lambda = snapshot.decay_lambda;
    result.parameters.sigma_cap_daily = live.sigma_cap_daily;
    result.parameters.shrink_high = profile.shrink_high;
    result.parameters.variance = snapshot.variance_estimate;
    result.parameters.sigma_step = input.sigma_step;
    result.parameters.model_version = config_->persistence.model_version;
    return result;
}

Result<ForecastResult> ForecastEngine::forecast(const ForecastRequest& request) {
    Logger::register_component("ForecastEngine");

    if (!initialized_) {
        return make_error<ForecastResult>(ErrorCode::NOT_INITIALIZED, "Engine not initialized",
                                          "ForecastEngine");
    }
    if (request.increment_seconds <= 0 || request.horizon_seconds <= 0 ||
        request.horizon_seconds % request.increment_seconds != 0) {
        return make_error<ForecastResult>(ErrorCode::INVALID_ARGUMENT,
                                          "Horizon must be a positive multiple of the increment",
                                          "ForecastEngine");
    }

    auto spot = prices_->get_spot(request.asset_id);
    if (spot.is_error()) {
        return forward_error<ForecastResult>(spot, "ForecastEngine");
    }
    const PricePoint& point = spot.value();

    if (request.update_from_spot) {
        auto observed = states_->observe_price(request.asset_id, point.price, point.timestamp);
        if (observed.is_error()) {
            if (observed.error()->code() != ErrorCode::INVALID_OBSERVATION) {
                return forward_error<ForecastResult>(observed, "ForecastEngine");
            }
            // Rejected tick leaves the state as it was; forecast from the last good estimate
            WARN("Spot not absorbed for " << request.asset_id << ": "
                                          << observed.error()->what());
        } else {
            dirty_ = true;
        }
    }
    if (!std::isfinite(point.price) || point.price <= 0.0) {
        return make_error<ForecastResult>(ErrorCode::MARKET_DATA_ERROR,
                                          "Invalid spot price for " + request.asset_id,
                                          "ForecastEngine");
    }

    const HorizonLabel label =
        VolatilityScaler::classify(request.increment_seconds, request.horizon_seconds);
    const int step_count =
        static_cast<int>(request.horizon_seconds / request.increment_seconds) + 1;

    auto built = build(request.asset_id, request.t0, point.price, request.increment_seconds,
                       step_count, label, request.seed);
    if (built.is_error()) {
        return built;
    }
    ForecastResult result = built.take_value();

    PredictionRecord record;
    record.asset_id = request.asset_id;
    record.t0 = request.t0;
    record.request_time = clock_();
    record.label = label;
    record.increment_seconds = request.increment_seconds;
    record.step_count = step_count;
    record.parameters = result.parameters;
    record.ensemble = result.ensemble;

    auto logged = prediction_logger_->maybe_log(record);
    if (logged.is_error()) {
        WARN("Prediction not logged for " << request.asset_id << ": "
                                          << logged.error()->what());
    } else {
        result.logged = logged.value();
    }

    persist_if_due();

    INFO("Forecast " << request.asset_id << " t0=" << core::to_iso8601(request.t0) << " "
                     << horizon_label_to_string(label) << " steps=" << step_count
                     << " sigma_step=" << result.parameters.sigma_step
                     << (result.ensemble.flattened ? " (flattened)" : ""));
    return result;
}

Result<PathEnsemble> ForecastEngine::generate(const std::string& asset, const Timestamp& t0,
                                              int64_t increment_seconds, int step_count) {
    if (!initialized_) {
        return make_error<PathEnsemble>(ErrorCode::NOT_INITIALIZED, "Engine not initialized",
                                        "ForecastEngine");
    }
    if (increment_seconds <= 0 || step_count < 1) {
        return make_error<PathEnsemble>(ErrorCode::INVALID_ARGUMENT,
                                        "Increment and step count must be positive",
                                        "ForecastEngine");
    }

    auto spot = prices_->get_spot(asset);
    if (spot.is_error()) {
        return forward_error<PathEnsemble>(spot, "ForecastEngine");
    }
    if (!std::isfinite(spot.value().price) || spot.value().price <= 0.0) {
        return make_error<PathEnsemble>(ErrorCode::MARKET_DATA_ERROR,
                                        "Invalid spot price for " + asset, "ForecastEngine");
    }

    const HorizonLabel label =
        VolatilityScaler::classify(increment_seconds, increment_seconds * (step_count - 1));
    auto built = build(asset, t0, spot.value().price, increment_seconds, step_count, label,
                       std::nullopt);
    if (built.is_error()) {
        return forward_error<PathEnsemble>(built, "ForecastEngine");
    }
    return built.take_value().ensemble;
}

void ForecastEngine::persist_if_due() {
    auto saved = persistence_->maybe_save(*states_, dirty_.load());
    if (saved.is_error()) {
        WARN("Volatility state not persisted: " << saved.error()->what());
        return;
    }
    if (saved.value()) {
        dirty_ = false;
    }
}

Result<void> ForecastEngine::persist_state() {
    if (!initialized_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Engine not initialized",
                                "ForecastEngine");
    }
    auto saved = persistence_->save(states_->snapshot_all());
    if (saved.is_ok()) {
        dirty_ = false;
    }
    return saved;
}

}  // namespace forecast_ngin
