// include/forecast_ngin/data/price_source.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/types.hpp"

namespace forecast_ngin {

/**
 * @brief One observed price
 */
struct PricePoint {
    Timestamp timestamp;
    Price price{0.0};
};

/**
 * @brief Realized prices keyed by whole epoch seconds; missing grid points are absent
 */
using RealizedSeries = std::map<int64_t, Price>;

/**
 * @brief Interface to the live and historical price service
 *
 * Implementations own their retry and caching policy. Every value returned
 * is treated as untrusted input and validated by the caller.
 */
class PriceSource {
public:
    virtual ~PriceSource() = default;

    /**
     * @brief Latest spot price for an asset
     */
    virtual Result<PricePoint> get_spot(const std::string& asset) = 0;

    /**
     * @brief Realized prices at exactly the requested timestamps
     * No interpolation: a timestamp without an observation is simply absent from the map.
     */
    virtual Result<RealizedSeries> get_realized(const std::string& asset,
                                                const std::vector<Timestamp>& timestamps) = 0;

    /**
     * @brief Bar closes in (end - lookback, end], ascending by time
     */
    virtual Result<std::vector<PricePoint>> get_history(const std::string& asset,
                                                        const Timestamp& end,
                                                        std::chrono::seconds lookback) = 0;
};

}  // namespace forecast_ngin
