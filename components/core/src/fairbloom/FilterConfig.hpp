#ifndef FAIRBLOOM_FILTERCONFIG_HPP
#define FAIRBLOOM_FILTERCONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "filter/HashAlgorithm.hpp"
#include "TraceableException.hpp"

namespace fairbloom {
/**
 * Parameters of the filters created on demand (e.g. by an auto-growing aggregate or the CLI)
 */
struct FilterConfig {
    // Target false positive probability, in ]0, 1[
    double false_positive_rate{0.01};
    // Number of items a filter is sized for
    int64_t capacity{1000};
    // Threshold above which aggregate members stop receiving items
    double false_probability_threshold{1.0};
    // Explicit hash algorithms; a random selection of the optimal size is used when empty
    std::vector<HashAlgorithm> hash_algorithms;
};

class FilterConfigValidationFailed : public TraceableException {
public:
    // Constructors
    FilterConfigValidationFailed(
            ErrorCode error_code,
            char const* const filename,
            int line_number,
            std::string message
    )
            : TraceableException(error_code, filename, line_number),
              m_message(std::move(message)) {}

    // Methods
    [[nodiscard]] auto what() const noexcept -> char const* override { return m_message.c_str(); }

private:
    std::string m_message;
};

/**
 * @param config
 * @throw FilterConfigValidationFailed with ErrorCodeBadParam if a value is out of range or a hash
 * algorithm is listed twice
 */
void validate_filter_config(FilterConfig const& config);

/**
 * Parses a comma-separated list of hash algorithm names. Whitespace around names is ignored.
 * @param csv
 * @return The algorithms in the given order, or std::nullopt if the list is empty or a name is
 * unknown
 */
[[nodiscard]] auto parse_hash_algorithm_list(std::string_view csv)
        -> std::optional<std::vector<HashAlgorithm>>;

[[nodiscard]] auto hash_algorithm_list_to_string(std::vector<HashAlgorithm> const& algorithms)
        -> std::string;
}  // namespace fairbloom

#endif  // FAIRBLOOM_FILTERCONFIG_HPP
