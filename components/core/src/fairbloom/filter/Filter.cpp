#include "Filter.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../ErrorCode.hpp"
#include "HashAlgorithm.hpp"

namespace fairbloom {
namespace {
constexpr char cFilterType[] = "filter";
// Largest size whose byte count still fits the bit array
constexpr size_t cMaxSize = std::numeric_limits<size_t>::max() - 7;

auto get_num_bytes(size_t size) -> size_t {
    return size / 8 + (0 != size % 8 ? 1 : 0);
}

auto hex_to_nibble(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

auto resolve_hash_algorithms(std::vector<std::string> const& names) -> std::vector<HashAlgorithm> {
    std::vector<HashAlgorithm> algorithms;
    algorithms.reserve(names.size());
    for (auto const& name : names) {
        auto const algorithm = parse_hash_algorithm(name);
        if (false == algorithm.has_value()) {
            throw Filter::OperationFailed(
                    ErrorCodeBadParam,
                    __FILENAME__,
                    __LINE__,
                    fmt::format("Hash algorithm {} is not supported", name)
            );
        }
        algorithms.push_back(algorithm.value());
    }
    return algorithms;
}

void validate_probability(double probability) {
    if (std::isnan(probability) || probability > 1.0 || probability < 0.0) {
        throw Filter::OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                "False positive probability cannot be negative or greater than 1"
        );
    }
}

auto get_random_engine() -> std::mt19937_64& {
    thread_local std::mt19937_64 random_engine{std::random_device{}()};
    return random_engine;
}
}  // namespace

Filter::Filter(size_t size, std::vector<HashAlgorithm> hash_algorithms)
        : m_size{size},
          m_hash_algorithms{std::move(hash_algorithms)} {
    if (0 == m_size) {
        throw OperationFailed(ErrorCodeBadParam, __FILENAME__, __LINE__, "Size cannot be null");
    }
    if (m_size > cMaxSize) {
        throw OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                fmt::format("Size {} exceeds the maximum of {} bits", m_size, cMaxSize)
        );
    }
    if (m_hash_algorithms.empty()) {
        throw OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                "At least one hash algorithm must be provided"
        );
    }
    for (auto const algorithm : m_hash_algorithms) {
        if (false == is_hash_algorithm_available(algorithm)) {
            throw OperationFailed(
                    ErrorCodeUnsupported,
                    __FILENAME__,
                    __LINE__,
                    fmt::format(
                            "Hash algorithm {} is not supported",
                            hash_algorithm_to_string(algorithm)
                    )
            );
        }
    }

    m_bit_array.resize(get_num_bytes(m_size), 0);
}

Filter::Filter(size_t size, std::vector<std::string> const& hash_algorithm_names)
        : Filter(size, resolve_hash_algorithms(hash_algorithm_names)) {}

auto Filter::get_optimal_size(double probability, int64_t items_count) -> double {
    if (items_count < 0) {
        throw OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                "Item count cannot be negative"
        );
    }
    validate_probability(probability);
    if (1.0 == probability || 0.0 == probability) {
        throw OperationFailed(
                ErrorCodeUndefined,
                __FILENAME__,
                __LINE__,
                fmt::format(
                        "Unable to calculate size for false positive probability of {}",
                        probability
                )
        );
    }

    auto const ln2 = std::log(2.0);
    return -(static_cast<double>(items_count) * std::log(probability)) / (ln2 * ln2);
}

auto Filter::get_optimal_num_hash_functions(double size, int64_t items_count) -> double {
    if (std::isnan(size) || size < 0.0) {
        throw OperationFailed(ErrorCodeBadParam, __FILENAME__, __LINE__, "Size cannot be negative");
    }
    if (items_count < 0) {
        throw OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                "Item count cannot be negative"
        );
    }
    if (0 == items_count) {
        throw OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                "Item count cannot be null"
        );
    }

    return std::max((size / static_cast<double>(items_count)) * std::log(2.0), 1.0);
}

auto Filter::to_filter_size(double size) -> size_t {
    if (std::isnan(size) || size < 1.0 || size >= static_cast<double>(cMaxSize)) {
        throw OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                fmt::format("Size {} is not a usable number of bits", size)
        );
    }
    return static_cast<size_t>(size);
}

auto Filter::get_optimum_filter(double probability, int64_t items_count) -> Filter {
    return get_optimum_filter(probability, items_count, get_random_engine());
}

auto Filter::get_optimum_filter(
        double probability,
        int64_t items_count,
        std::mt19937_64& random_engine
) -> Filter {
    auto const size = get_optimal_size(probability, items_count);
    auto const num_hash_functions = get_optimal_num_hash_functions(size, items_count);

    std::vector<HashAlgorithm> algorithms;
    for (auto const algorithm : cHashAlgorithms) {
        if (is_hash_algorithm_available(algorithm)) {
            algorithms.push_back(algorithm);
        }
    }

    auto num_algorithms = static_cast<size_t>(std::lround(num_hash_functions));
    if (num_algorithms > algorithms.size()) {
        SPDLOG_WARN(
                "Optimal number of hash functions {} exceeds the {} available algorithms.",
                num_algorithms,
                algorithms.size()
        );
        num_algorithms = algorithms.size();
    }

    std::shuffle(algorithms.begin(), algorithms.end(), random_engine);
    algorithms.resize(num_algorithms);
    return Filter{to_filter_size(size), std::move(algorithms)};
}

auto Filter::add(std::string_view item) -> Filter& {
    for (auto const bit_index : hash(item)) {
        set_bit(bit_index);
    }
    ++m_count;
    return *this;
}

auto Filter::has(std::string_view item) const -> bool {
    for (auto const bit_index : hash(item)) {
        if (false == test_bit(bit_index)) {
            return false;  // Definitely not in the set
        }
    }
    return true;  // Possibly in the set
}

auto Filter::is_full() const -> bool {
    auto const num_full_bytes = m_size / 8;
    for (size_t i = 0; i < num_full_bytes; ++i) {
        if (0xFF != m_bit_array[i]) {
            return false;
        }
    }

    auto const num_trailing_bits = m_size % 8;
    if (0 == num_trailing_bits) {
        return true;
    }
    auto const trailing_mask = static_cast<uint8_t>((1u << num_trailing_bits) - 1);
    return trailing_mask == (m_bit_array.back() & trailing_mask);
}

auto Filter::get_false_positive_probability() const -> double {
    auto const m = static_cast<double>(m_size);
    auto const n = static_cast<double>(m_count);
    auto const k = static_cast<double>(m_hash_algorithms.size());

    return std::pow(1.0 - std::exp(-k * n / m), k);
}

auto Filter::estimate_capacity(double probability) const -> double {
    validate_probability(probability);
    if (1.0 == probability) {
        return std::numeric_limits<double>::infinity();
    }
    if (0.0 == probability) {
        return 0.0;
    }

    auto const ln2 = std::log(2.0);
    return -(static_cast<double>(m_size) * ln2 * ln2) / std::log(probability);
}

auto Filter::estimate_fill_rate(double probability) const -> double {
    if (0 == m_count) {
        return 0.0;
    }
    return static_cast<double>(m_count) / estimate_capacity(probability);
}

auto Filter::distance_with(std::string_view item) const -> size_t {
    size_t distance{0};
    for (auto const bit_index : hash(item)) {
        if (false == test_bit(bit_index)) {
            ++distance;
        }
    }
    return distance;
}

auto Filter::union_with(Filter const& other) const -> Filter {
    require_compatible(other, "union");

    Filter result{m_size, m_hash_algorithms};
    for (size_t i = 0; i < m_bit_array.size(); ++i) {
        result.m_bit_array[i] = m_bit_array[i] | other.m_bit_array[i];
    }
    return result;
}

auto Filter::intersect_with(Filter const& other) const -> Filter {
    require_compatible(other, "intersection");

    Filter result{m_size, m_hash_algorithms};
    for (size_t i = 0; i < m_bit_array.size(); ++i) {
        result.m_bit_array[i] = m_bit_array[i] & other.m_bit_array[i];
    }
    return result;
}

auto Filter::test_bit(size_t bit_index) const -> bool {
    size_t const byte_index = bit_index / 8;
    size_t const bit_offset = bit_index % 8;
    return (m_bit_array[byte_index] & (1u << bit_offset)) != 0;
}

auto Filter::to_hex_string() const -> std::string {
    constexpr std::array<char, 16> cHexDigits{
            '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
    };

    std::string hex;
    hex.reserve(m_bit_array.size() * 2);
    for (auto const byte : m_bit_array) {
        hex.push_back(cHexDigits[byte >> 4]);
        hex.push_back(cHexDigits[byte & 0x0F]);
    }
    return hex;
}

auto Filter::to_json() const -> nlohmann::json {
    std::vector<std::string> hash_names;
    hash_names.reserve(m_hash_algorithms.size());
    for (auto const algorithm : m_hash_algorithms) {
        hash_names.emplace_back(hash_algorithm_to_string(algorithm));
    }

    nlohmann::json serialized_filter;
    serialized_filter["type"] = cFilterType;
    serialized_filter["size"] = m_size;
    serialized_filter["hash_algorithms"] = hash_names;
    serialized_filter["count"] = m_count;
    serialized_filter["int_size"] = cNativeWordBits;
    serialized_filter["bits"] = to_hex_string();
    return serialized_filter;
}

auto Filter::from_json(nlohmann::json const& serialized_filter) -> Filter {
    size_t size{0};
    std::vector<std::string> hash_names;
    size_t count{0};
    uint32_t int_size{0};
    std::string bits;
    try {
        if (serialized_filter.contains("type")
            && serialized_filter.at("type").get<std::string>() != cFilterType)
        {
            throw OperationFailed(
                    ErrorCodeCorrupt,
                    __FILENAME__,
                    __LINE__,
                    "Serialized object is not a bloom-filter"
            );
        }
        serialized_filter.at("size").get_to(size);
        serialized_filter.at("hash_algorithms").get_to(hash_names);
        serialized_filter.at("count").get_to(count);
        serialized_filter.at("int_size").get_to(int_size);
        serialized_filter.at("bits").get_to(bits);
    } catch (nlohmann::json::exception const& e) {
        throw OperationFailed(
                ErrorCodeCorrupt,
                __FILENAME__,
                __LINE__,
                fmt::format("Malformed serialized bloom-filter - {}", e.what())
        );
    }

    if (int_size != cNativeWordBits) {
        throw OperationFailed(
                ErrorCodeIncompatible,
                __FILENAME__,
                __LINE__,
                fmt::format(
                        "Unable to import bloom-filter from {}b architecture: current "
                        "architecture is {}b",
                        int_size,
                        cNativeWordBits
                )
        );
    }

    Filter filter{size, hash_names};
    if (bits.size() != filter.m_bit_array.size() * 2) {
        throw OperationFailed(
                ErrorCodeCorrupt,
                __FILENAME__,
                __LINE__,
                fmt::format(
                        "Bit field of {} hex characters doesn't match a size of {} bits",
                        bits.size(),
                        size
                )
        );
    }
    for (size_t i = 0; i < filter.m_bit_array.size(); ++i) {
        auto const high = hex_to_nibble(bits[i * 2]);
        auto const low = hex_to_nibble(bits[i * 2 + 1]);
        if (high < 0 || low < 0) {
            throw OperationFailed(
                    ErrorCodeCorrupt,
                    __FILENAME__,
                    __LINE__,
                    "Bit field contains a non-hexadecimal character"
            );
        }
        filter.m_bit_array[i] = static_cast<uint8_t>((high << 4) | low);
    }

    auto const num_trailing_bits = size % 8;
    if (0 != num_trailing_bits && 0 != (filter.m_bit_array.back() >> num_trailing_bits)) {
        throw OperationFailed(
                ErrorCodeCorrupt,
                __FILENAME__,
                __LINE__,
                "Bit field sets bits beyond the filter size"
        );
    }

    filter.m_count = count;
    return filter;
}

auto Filter::get_position(HashAlgorithm algorithm, std::string_view item) const -> size_t {
    std::vector<unsigned char> digest;
    if (auto const error_code = get_digest(algorithm, item, digest);
        ErrorCodeSuccess != error_code)
    {
        throw OperationFailed(
                error_code,
                __FILENAME__,
                __LINE__,
                fmt::format("Failed to compute {} digest", hash_algorithm_to_string(algorithm))
        );
    }
    return static_cast<size_t>(fold_digest(digest)) % m_size;
}

void Filter::set_bit(size_t bit_index) {
    size_t const byte_index = bit_index / 8;
    size_t const bit_offset = bit_index % 8;
    m_bit_array[byte_index] |= (1u << bit_offset);
}

void Filter::require_compatible(Filter const& other, std::string_view operation) const {
    if (other.m_hash_algorithms != m_hash_algorithms) {
        throw OperationFailed(
                ErrorCodeIncompatible,
                __FILENAME__,
                __LINE__,
                fmt::format(
                        "Cannot compute {} of bloom-filters with different sets of hash functions",
                        operation
                )
        );
    }
    if (other.m_size != m_size) {
        throw OperationFailed(
                ErrorCodeIncompatible,
                __FILENAME__,
                __LINE__,
                fmt::format("Cannot compute {} of bloom-filters with different sizes", operation)
        );
    }
}
}  // namespace fairbloom
