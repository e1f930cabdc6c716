// src/storage/file_storage_backend.cpp

#include "forecast_ngin/storage/file_storage_backend.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace forecast_ngin {

FileStorageBackend::FileStorageBackend(std::filesystem::path root) : root_(std::move(root)) {}

Result<std::filesystem::path> FileStorageBackend::resolve(const std::string& key) const {
    std::filesystem::path relative(key);
    if (key.empty() || relative.is_absolute()) {
        return make_error<std::filesystem::path>(ErrorCode::INVALID_ARGUMENT,
                                                 "Storage keys must be relative: '" + key + "'",
                                                 "FileStorageBackend");
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return make_error<std::filesystem::path>(ErrorCode::INVALID_ARGUMENT,
                                                     "Storage key escapes root: " + key,
                                                     "FileStorageBackend");
        }
    }
    return root_ / relative;
}

Result<void> FileStorageBackend::append(const std::string& partition, const std::string& line) {
    auto path = resolve(partition);
    if (path.is_error()) {
        return forward_error<void>(path, "FileStorageBackend");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::create_directories(path.value().parent_path(), ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create directory for " + partition + ": " +
                                    ec.message(),
                                "FileStorageBackend");
    }

    std::ofstream file(path.value(), std::ios::app);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to open " + partition,
                                "FileStorageBackend");
    }
    file << line << '\n';
    file.flush();
    if (!file.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to append to " + partition,
                                "FileStorageBackend");
    }
    return Result<void>();
}

Result<std::vector<std::string>> FileStorageBackend::read(const std::string& partition) const {
    auto path = resolve(partition);
    if (path.is_error()) {
        return forward_error<std::vector<std::string>>(path, "FileStorageBackend");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream file(path.value());
    if (!file.is_open()) {
        return make_error<std::vector<std::string>>(ErrorCode::FILE_NOT_FOUND,
                                                    "No partition " + partition,
                                                    "FileStorageBackend");
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

Result<void> FileStorageBackend::atomic_write(const std::string& key, const std::string& content) {
    auto path = resolve(key);
    if (path.is_error()) {
        return forward_error<void>(path, "FileStorageBackend");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::filesystem::path& target = path.value();
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create directory for " + key + ": " + ec.message(),
                                "FileStorageBackend");
    }

    std::filesystem::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to open " + tmp.string(),
                                    "FileStorageBackend");
        }
        file << content;
        file.flush();
        if (!file.good()) {
            file.close();
            std::filesystem::remove(tmp, ec);
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write " + tmp.string(),
                                    "FileStorageBackend");
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(tmp, cleanup);
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to replace " + key + ": " + ec.message(),
                                "FileStorageBackend");
    }
    return Result<void>();
}

Result<std::string> FileStorageBackend::read_all(const std::string& key) const {
    auto path = resolve(key);
    if (path.is_error()) {
        return forward_error<std::string>(path, "FileStorageBackend");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream file(path.value());
    if (!file.is_open()) {
        return make_error<std::string>(ErrorCode::FILE_NOT_FOUND, "No document " + key,
                                       "FileStorageBackend");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Result<std::vector<std::string>> FileStorageBackend::list(const std::string& prefix) const {
    std::vector<std::string> keys;
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(root_, ec)) {
        return keys;
    }

    for (auto it = std::filesystem::recursive_directory_iterator(root_, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        std::string key = std::filesystem::relative(it->path(), root_).generic_string();
        if (key.size() >= 4 && key.compare(key.size() - 4, 4, ".tmp") == 0) {
            continue;
        }
        if (key.rfind(prefix, 0) == 0) {
            keys.push_back(key);
        }
    }
    if (ec) {
        return make_error<std::vector<std::string>>(ErrorCode::FILE_IO_ERROR,
                                                    "Failed to list " + prefix + ": " +
                                                        ec.message(),
                                                    "FileStorageBackend");
    }

    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace forecast_ngin
