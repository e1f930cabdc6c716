// include/forecast_ngin/storage/storage_backend.hpp
#pragma once

#include <string>
#include <vector>
#include "forecast_ngin/core/error.hpp"
#include "forecast_ngin/core/time_utils.hpp"
#include "forecast_ngin/core/types.hpp"

namespace forecast_ngin {

/**
 * @brief Durable storage used for logs, snapshots and the tuning ledger
 *
 * Keys are relative, '/'-separated names. Partitions are append-only line
 * logs; documents are replaced as a whole with atomic_write.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /**
     * @brief Append one line to a partition, creating it if needed
     */
    virtual Result<void> append(const std::string& partition, const std::string& line) = 0;

    /**
     * @brief All lines of a partition in write order
     * @return FILE_NOT_FOUND if the partition does not exist
     */
    virtual Result<std::vector<std::string>> read(const std::string& partition) const = 0;

    /**
     * @brief Replace a document so readers see either the old or the new content
     */
    virtual Result<void> atomic_write(const std::string& key, const std::string& content) = 0;

    /**
     * @brief Whole content of a document
     * @return FILE_NOT_FOUND if the document does not exist
     */
    virtual Result<std::string> read_all(const std::string& key) const = 0;

    /**
     * @brief Keys beginning with prefix, sorted
     */
    virtual Result<std::vector<std::string>> list(const std::string& prefix) const = 0;
};

/**
 * @brief Day partition key "<name>/YYYY-MM/<name>_YYYY-MM-DD.jsonl" for a UTC timestamp
 */
inline std::string day_partition(const std::string& name, const Timestamp& ts) {
    return name + "/" + core::format_utc(ts, "%Y-%m") + "/" + name + "_" +
           core::format_utc(ts, "%Y-%m-%d") + ".jsonl";
}

}  // namespace forecast_ngin
