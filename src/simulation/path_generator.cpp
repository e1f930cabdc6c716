// src/simulation/path_generator.cpp

#include "forecast_ngin/simulation/path_generator.hpp"
#include <cmath>
#include <random>
#include "forecast_ngin/core/logger.hpp"

namespace forecast_ngin {

double PathGenerator::round_significant(double value, int digits) {
    if (value == 0.0 || !std::isfinite(value)) {
        return value;
    }
    int magnitude = static_cast<int>(std::floor(std::log10(std::fabs(value))));
    int decimals = digits - 1 - magnitude;
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

Result<PathEnsemble> PathGenerator::generate(const GenerationInput& input) const {
    if (!std::isfinite(input.spot) || input.spot <= 0.0) {
        return make_error<PathEnsemble>(ErrorCode::INVALID_ARGUMENT,
                                        "Spot price must be finite and positive for " +
                                            input.asset_id,
                                        "PathGenerator");
    }
    if (input.step_count < 1 || input.increment_seconds <= 0) {
        return make_error<PathEnsemble>(ErrorCode::INVALID_ARGUMENT,
                                        "step_count and increment must be positive",
                                        "PathGenerator");
    }

    const Eigen::Index steps = input.step_count - 1;
    PathEnsemble ensemble;
    ensemble.asset_id = input.asset_id;
    ensemble.t0 = input.t0;
    ensemble.increment_seconds = input.increment_seconds;
    ensemble.step_count = input.step_count;
    ensemble.flattened = input.flatten;
    ensemble.paths = PriceMatrix::Constant(kEnsembleSize, input.step_count, input.spot);

    if (!input.flatten && steps > 0) {
        if (!std::isfinite(input.sigma_step) || input.sigma_step <= 0.0) {
            return make_error<PathEnsemble>(ErrorCode::INVALID_SCALING,
                                            "sigma_step must be strictly positive",
                                            "PathGenerator");
        }

        std::mt19937_64 rng(input.seed);
        Eigen::MatrixXd shocks;

        if (std::holds_alternative<StudentT>(input.family)) {
            const double df = std::get<StudentT>(input.family).df;
            if (!std::isfinite(df) || df <= 2.0) {
                return make_error<PathEnsemble>(ErrorCode::INVALID_SCALING,
                                                "Student-t needs df > 2 for a finite variance",
                                                "PathGenerator");
            }
            std::student_t_distribution<double> dist(df);
            const double scale = input.sigma_step / std::sqrt(df / (df - 2.0));
            shocks = Eigen::MatrixXd::NullaryExpr(kStochasticPaths, steps,
                                                  [&]() { return dist(rng); });
            shocks *= scale;
        } else {
            std::normal_distribution<double> dist(0.0, 1.0);
            shocks = Eigen::MatrixXd::NullaryExpr(kStochasticPaths, steps,
                                                  [&]() { return dist(rng); });
            shocks *= input.sigma_step;
        }

        // Cumulative log return along each path
        for (Eigen::Index k = 1; k < steps; ++k) {
            shocks.col(k) += shocks.col(k - 1);
        }

        ensemble.paths.block(1, 1, kStochasticPaths, steps) =
            input.spot * shocks.array().exp().matrix();
    }

    const int digits = significant_digits_;
    ensemble.paths = ensemble.paths.unaryExpr(
        [digits](double v) { return PathGenerator::round_significant(v, digits); });

    auto valid = ensemble.validate();
    if (valid.is_error()) {
        ERROR("Path generation failed for " << input.asset_id << ": " << valid.error()->what());
        return make_error<PathEnsemble>(ErrorCode::PATH_GENERATION_ERROR, valid.error()->what(),
                                        "PathGenerator");
    }

    DEBUG("Generated " << kEnsembleSize << "x" << input.step_count << " ensemble for "
                       << input.asset_id << " sigma_step=" << input.sigma_step
                       << " family=" << family_to_string(input.family)
                       << (input.flatten ? " (flat)" : ""));
    return Result<PathEnsemble>(std::move(ensemble));
}

}  // namespace forecast_ngin
