// include/forecast_ngin/simulation/path_generator.hpp
#pragma once

#include <cstdint>
#include <string>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/types.hpp"
#include "forecast_ngin/simulation/path_ensemble.hpp"

namespace forecast_ngin {

/**
 * @brief Inputs of one ensemble draw
 */
struct GenerationInput {
    std::string asset_id;
    Timestamp t0{};
    Price spot{0.0};
    int64_t increment_seconds{0};
    int step_count{0};
    double sigma_step{0.0};
    DistributionFamily family{StudentT{}};
    bool flatten{false};
    uint64_t seed{0};
};

/**
 * @brief Builds the 1000-path ensemble from a scaled volatility
 *
 * Shocks for all 999 stochastic paths are drawn as one matrix. Student-t
 * draws are scaled by sigma / sqrt(df / (df - 2)) so every family has step
 * variance sigma^2. Log prices are accumulated along each row and
 * exponentiated.
 */
class PathGenerator {
public:
    explicit PathGenerator(int significant_digits = 8) : significant_digits_(significant_digits) {}

    /**
     * @brief Generate an ensemble, deterministic for a given input
     * @return INVALID_ARGUMENT for a bad spot or grid, INVALID_SCALING for a
     *         non-positive sigma or df <= 2, PATH_GENERATION_ERROR when any
     *         produced price is non-finite or non-positive
     */
    Result<PathEnsemble> generate(const GenerationInput& input) const;

    /**
     * @brief Round to a number of significant decimal digits
     */
    static double round_significant(double value, int digits);

private:
    int significant_digits_;
};

}  // namespace forecast_ngin
