//===== config_base.cpp =====

#include "bar_catalog/core/config_base.hpp"
#include <filesystem>
#include <iomanip>

namespace bar_catalog {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    namespace fs = std::filesystem;
    const fs::path target(filepath);
    const fs::path staging = target.string() + ".tmp";

    try {
        const nlohmann::json j = to_json();
        {
            std::ofstream out(staging, std::ios::trunc);
            if (!out) {
                return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                        "Cannot write config to " + staging.string(),
                                        "ConfigBase");
            }
            out << std::setw(4) << j << '\n';
            if (!out.flush()) {
                return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                        "Short write of config " + staging.string(), "ConfigBase");
            }
        }

        std::error_code ec;
        fs::rename(staging, target, ec);
        if (ec) {
            const std::string reason = ec.message();
            fs::remove(staging, ec);
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Cannot move config into place at " + filepath + ": " + reason,
                                    "ConfigBase");
        }
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Saving config ") + filepath + " failed: " + e.what(),
                                "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filepath, ec)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                "ConfigBase");
    }

    std::ifstream in(filepath);
    if (!in) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot read config " + filepath,
                                "ConfigBase");
    }

    try {
        from_json(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Invalid config JSON in " + filepath + ": " + e.what(),
                                "ConfigBase");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                "Loading config " + filepath + " failed: " + e.what(),
                                "ConfigBase");
    }
    return Result<void>();
}

}  // namespace bar_catalog
