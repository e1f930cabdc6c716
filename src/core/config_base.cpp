#include "forecast_ngin/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace forecast_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        nlohmann::json j = to_json();
        std::filesystem::path target(filepath);
        std::filesystem::path tmp = target;
        tmp += ".tmp";

        {
            std::ofstream file(tmp);
            if (!file.is_open()) {
                return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to open file for writing: " + tmp.string(),
                                        "ConfigBase");
            }
            file << std::setw(4) << j << std::endl;
            if (!file.good()) {
                return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to write config: " + tmp.string(), "ConfigBase");
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, target, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to replace config file: " + filepath, "ConfigBase");
        }
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error saving config: ") + e.what(), "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                    "Failed to open file for reading: " + filepath, "ConfigBase");
        }
        nlohmann::json j;
        file >> j;
        from_json(j);
        return Result<void>();
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error parsing config: ") + e.what(), "ConfigBase");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error loading config: ") + e.what(), "ConfigBase");
    }
}

}  // namespace forecast_ngin
