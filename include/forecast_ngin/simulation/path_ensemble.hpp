// include/forecast_ngin/simulation/path_ensemble.hpp
#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/types.hpp"

namespace forecast_ngin {

/**
 * @brief Ensemble storage: one row per path, one column per grid point
 */
using PriceMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief The 1000 price trajectories returned for one request
 *
 * Column k holds the prices at t0 + k * increment. Row 0 is the flat path,
 * rows 1..999 are the stochastic draws. Immutable once generated.
 */
struct PathEnsemble {
    std::string asset_id;
    Timestamp t0{};
    int64_t increment_seconds{0};
    int step_count{0};
    bool flattened{false};
    PriceMatrix paths;

    Timestamp grid_time(int k) const {
        return t0 + std::chrono::seconds(increment_seconds * k);
    }

    std::vector<Timestamp> grid() const;

    Price start_price() const {
        return paths(0, 0);
    }

    /**
     * @brief Check shape, flat path 0, shared start price and positivity
     * @return PATH_GENERATION_ERROR describing the first violated invariant
     */
    Result<void> validate() const;

    /**
     * @brief Serialize as metadata plus an ordered list of 1000 price lists
     */
    nlohmann::json to_json() const;

    /**
     * @brief Parse a serialized ensemble, values kept bit-for-bit
     */
    static Result<PathEnsemble> from_json(const nlohmann::json& j);
};

}  // namespace forecast_ngin
