#include "FilterConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "ErrorCode.hpp"
#include "filter/HashAlgorithm.hpp"

namespace fairbloom {
namespace {
auto trim(std::string_view input) -> std::string_view {
    while (false == input.empty() && std::isspace(static_cast<unsigned char>(input.front()))) {
        input.remove_prefix(1);
    }
    while (false == input.empty() && std::isspace(static_cast<unsigned char>(input.back()))) {
        input.remove_suffix(1);
    }
    return input;
}
}  // namespace

void validate_filter_config(FilterConfig const& config) {
    auto const rate = config.false_positive_rate;
    if (std::isnan(rate) || rate <= 0.0 || rate >= 1.0) {
        throw FilterConfigValidationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                fmt::format("False positive rate {} is not in ]0, 1[", rate)
        );
    }
    if (config.capacity <= 0) {
        throw FilterConfigValidationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                fmt::format("Capacity {} must be positive", config.capacity)
        );
    }
    auto const threshold = config.false_probability_threshold;
    if (std::isnan(threshold) || threshold < 0.0 || threshold > 1.0) {
        throw FilterConfigValidationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                fmt::format("False probability threshold {} is not in [0, 1]", threshold)
        );
    }

    auto const& algorithms = config.hash_algorithms;
    for (auto it = algorithms.cbegin(); it != algorithms.cend(); ++it) {
        if (std::find(algorithms.cbegin(), it, *it) != it) {
            throw FilterConfigValidationFailed(
                    ErrorCodeBadParam,
                    __FILENAME__,
                    __LINE__,
                    fmt::format(
                            "Hash algorithm {} is listed more than once",
                            hash_algorithm_to_string(*it)
                    )
            );
        }
    }
}

auto parse_hash_algorithm_list(std::string_view csv) -> std::optional<std::vector<HashAlgorithm>> {
    std::vector<HashAlgorithm> algorithms;
    while (true) {
        auto const separator_pos = csv.find(',');
        auto const name = trim(csv.substr(0, separator_pos));
        if (false == name.empty()) {
            auto const algorithm = parse_hash_algorithm(name);
            if (false == algorithm.has_value()) {
                return std::nullopt;
            }
            algorithms.push_back(algorithm.value());
        }
        if (std::string_view::npos == separator_pos) {
            break;
        }
        csv.remove_prefix(separator_pos + 1);
    }

    if (algorithms.empty()) {
        return std::nullopt;
    }
    return algorithms;
}

auto hash_algorithm_list_to_string(std::vector<HashAlgorithm> const& algorithms) -> std::string {
    std::string out;
    for (auto const algorithm : algorithms) {
        if (false == out.empty()) {
            out += ',';
        }
        out += hash_algorithm_to_string(algorithm);
    }
    return out;
}
}  // namespace fairbloom
