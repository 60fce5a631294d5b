#include "FilterFile.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../ErrorCode.hpp"
#include "FilterComponent.hpp"

namespace fairbloom::filter {
void write_filter_file(std::string const& path, FilterComponent const& component) {
    auto const serialized = component.to_json().dump();

    auto parent_dir = std::filesystem::path(path).parent_path();
    if (false == parent_dir.empty()) {
        std::error_code fs_error;
        std::filesystem::create_directories(parent_dir, fs_error);
        if (fs_error) {
            SPDLOG_ERROR(
                    "Failed to create directory {} - {}",
                    parent_dir.string(),
                    fs_error.message()
            );
            throw FilterFileOperationFailed(
                    ErrorCodeFailure,
                    __FILENAME__,
                    __LINE__,
                    fmt::format("Failed to create directory {}", parent_dir.string())
            );
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        SPDLOG_ERROR("Failed to open filter file {} for writing.", path);
        throw FilterFileOperationFailed(
                ErrorCodeFailure,
                __FILENAME__,
                __LINE__,
                fmt::format("Failed to open filter file {}", path)
        );
    }

    out << serialized;
    out.close();
    if (!out) {
        SPDLOG_ERROR("Failed to write filter file {}.", path);
        throw FilterFileOperationFailed(
                ErrorCodeFailure,
                __FILENAME__,
                __LINE__,
                fmt::format("Failed to write filter file {}", path)
        );
    }
}

auto read_filter_file(std::string const& path, FilterFactory const& factory) -> FilterComponent {
    std::error_code fs_error;
    if (false == std::filesystem::is_regular_file(path, fs_error)) {
        SPDLOG_ERROR("Filter file {} does not exist.", path);
        throw FilterFileOperationFailed(
                ErrorCodeFileNotFound,
                __FILENAME__,
                __LINE__,
                fmt::format("Filter file {} does not exist", path)
        );
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        SPDLOG_ERROR("Failed to open filter file {} for reading.", path);
        throw FilterFileOperationFailed(
                ErrorCodeFailure,
                __FILENAME__,
                __LINE__,
                fmt::format("Failed to open filter file {}", path)
        );
    }

    nlohmann::json serialized;
    try {
        serialized = nlohmann::json::parse(in);
    } catch (nlohmann::json::exception const& e) {
        SPDLOG_ERROR("Filter file {} is not a JSON document - {}", path, e.what());
        throw FilterFileOperationFailed(
                ErrorCodeCorrupt,
                __FILENAME__,
                __LINE__,
                fmt::format("Filter file {} is not a JSON document", path)
        );
    }

    return FilterComponent::from_json(serialized, factory);
}
}  // namespace fairbloom::filter
