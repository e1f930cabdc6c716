// include/forecast_ngin/storage/file_storage_backend.hpp
#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "forecast_ngin/storage/storage_backend.hpp"

namespace forecast_ngin {

/**
 * @brief StorageBackend on a local directory tree
 *
 * atomic_write goes through "<key>.tmp" and a rename, so a crash leaves
 * either the previous document or the new one.
 */
class FileStorageBackend : public StorageBackend {
public:
    explicit FileStorageBackend(std::filesystem::path root);

    Result<void> append(const std::string& partition, const std::string& line) override;
    Result<std::vector<std::string>> read(const std::string& partition) const override;
    Result<void> atomic_write(const std::string& key, const std::string& content) override;
    Result<std::string> read_all(const std::string& key) const override;
    Result<std::vector<std::string>> list(const std::string& prefix) const override;

    const std::filesystem::path& root() const {
        return root_;
    }

private:
    Result<std::filesystem::path> resolve(const std::string& key) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

}  // namespace forecast_ngin
