// src/simulation/path_ensemble.cpp

#include "forecast_ngin/simulation/path_ensemble.hpp"
#include <cmath>
#include "forecast_ngin/core/time_utils.hpp"

namespace forecast_ngin {

std::vector<Timestamp> PathEnsemble::grid() const {
    std::vector<Timestamp> points;
    points.reserve(static_cast<size_t>(step_count));
    for (int k = 0; k < step_count; ++k) {
        points.push_back(grid_time(k));
    }
    return points;
}

Result<void> PathEnsemble::validate() const {
    if (step_count < 1 || paths.rows() != kEnsembleSize || paths.cols() != step_count) {
        return make_error<void>(ErrorCode::PATH_GENERATION_ERROR,
                                "Ensemble shape " + std::to_string(paths.rows()) + "x" +
                                    std::to_string(paths.cols()) + " does not match " +
                                    std::to_string(kEnsembleSize) + "x" +
                                    std::to_string(step_count),
                                "PathEnsemble");
    }

    Eigen::Index valid = (paths.array().isFinite() && (paths.array() > 0.0)).count();
    Eigen::Index invalid = paths.size() - valid;
    if (invalid > 0) {
        return make_error<void>(ErrorCode::PATH_GENERATION_ERROR,
                                std::to_string(invalid) +
                                    " prices are non-finite or non-positive for " + asset_id,
                                "PathEnsemble");
    }

    const double s0 = paths(0, 0);
    if ((paths.row(0).array() != s0).any()) {
        return make_error<void>(ErrorCode::PATH_GENERATION_ERROR, "Path 0 is not flat",
                                "PathEnsemble");
    }
    if ((paths.col(0).array() != s0).any()) {
        return make_error<void>(ErrorCode::PATH_GENERATION_ERROR,
                                "Paths do not share the starting price", "PathEnsemble");
    }
    return Result<void>();
}

nlohmann::json PathEnsemble::to_json() const {
    nlohmann::json j;
    j["asset"] = asset_id;
    j["t0"] = core::to_epoch_seconds(t0);
    j["increment"] = increment_seconds;
    j["step_count"] = step_count;
    j["flattened"] = flattened;

    nlohmann::json rows = nlohmann::json::array();
    for (Eigen::Index i = 0; i < paths.rows(); ++i) {
        std::vector<double> row(paths.row(i).data(), paths.row(i).data() + paths.cols());
        rows.push_back(std::move(row));
    }
    j["paths"] = std::move(rows);
    return j;
}

Result<PathEnsemble> PathEnsemble::from_json(const nlohmann::json& j) {
    try {
        PathEnsemble ensemble;
        ensemble.asset_id = j.at("asset").get<std::string>();
        ensemble.t0 = core::from_epoch_seconds(j.at("t0").get<double>());
        ensemble.increment_seconds = j.at("increment").get<int64_t>();
        ensemble.step_count = j.at("step_count").get<int>();
        if (j.contains("flattened"))
            ensemble.flattened = j.at("flattened").get<bool>();

        const auto& rows = j.at("paths");
        if (!rows.is_array() || ensemble.step_count < 1) {
            return make_error<PathEnsemble>(ErrorCode::INVALID_DATA,
                                            "Ensemble has no paths or no steps", "PathEnsemble");
        }

        ensemble.paths.resize(static_cast<Eigen::Index>(rows.size()), ensemble.step_count);
        for (size_t i = 0; i < rows.size(); ++i) {
            const auto& row = rows[i];
            if (!row.is_array() || row.size() != static_cast<size_t>(ensemble.step_count)) {
                return make_error<PathEnsemble>(ErrorCode::INVALID_DATA,
                                                "Path " + std::to_string(i) +
                                                    " has the wrong length",
                                                "PathEnsemble");
            }
            for (size_t k = 0; k < row.size(); ++k) {
                ensemble.paths(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k)) =
                    row[k].get<double>();
            }
        }
        return Result<PathEnsemble>(std::move(ensemble));
    } catch (const nlohmann::json::exception& e) {
        return make_error<PathEnsemble>(ErrorCode::JSON_PARSE_ERROR,
                                        std::string("Malformed ensemble: ") + e.what(),
                                        "PathEnsemble");
    }
}

}  // namespace forecast_ngin
