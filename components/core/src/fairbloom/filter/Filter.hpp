#ifndef FAIRBLOOM_FILTER_HPP
#define FAIRBLOOM_FILTER_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "../TraceableException.hpp"
#include "HashAlgorithm.hpp"

namespace fairbloom {
/**
 * A space-efficient probabilistic data structure for testing set membership.
 *
 * The filter is a fixed-size bit array and an ordered list of digest algorithms. Each algorithm
 * maps an item to one bit position: the digest of the item is folded into its CRC-32 checksum,
 * which is reduced modulo the size of the bit array. The filter guarantees no false negatives (an
 * added item is always reported as present) but may report items that were never added.
 */
class Filter {
public:
    // Types
    class OperationFailed : public TraceableException {
    public:
        // Constructors
        OperationFailed(
                ErrorCode error_code,
                char const* const filename,
                int line_number,
                std::string message
        )
                : TraceableException(error_code, filename, line_number),
                  m_message(std::move(message)) {}

        // Methods
        [[nodiscard]] auto what() const noexcept -> char const* override {
            return m_message.c_str();
        }

    private:
        std::string m_message;
    };

    /**
     * The bit positions of one item, one per hash algorithm in the filter's order. Positions are
     * computed lazily while iterating, so the sequence can be restarted at no cost other than
     * recomputing the digests. The item must outlive the sequence.
     */
    class HashSequence {
    public:
        class Iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = size_t;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = size_t;

            Iterator() = default;

            Iterator(Filter const* filter, std::string_view item, size_t hash_index)
                    : m_filter{filter},
                      m_item{item},
                      m_hash_index{hash_index} {}

            auto operator*() const -> size_t {
                return m_filter->get_position(m_filter->m_hash_algorithms[m_hash_index], m_item);
            }

            auto operator++() -> Iterator& {
                ++m_hash_index;
                return *this;
            }

            auto operator++(int) -> Iterator {
                auto copy = *this;
                ++m_hash_index;
                return copy;
            }

            auto operator==(Iterator const& rhs) const -> bool {
                return m_hash_index == rhs.m_hash_index;
            }

        private:
            Filter const* m_filter{nullptr};
            std::string_view m_item;
            size_t m_hash_index{0};
        };

        HashSequence(Filter const& filter, std::string_view item)
                : m_filter{&filter},
                  m_item{item} {}

        [[nodiscard]] auto begin() const -> Iterator { return {m_filter, m_item, 0}; }

        [[nodiscard]] auto end() const -> Iterator {
            return {m_filter, m_item, m_filter->m_hash_algorithms.size()};
        }

        [[nodiscard]] auto size() const -> size_t { return m_filter->m_hash_algorithms.size(); }

    private:
        Filter const* m_filter;
        std::string_view m_item;
    };

    // Constants
    // Bits per native word of this build, recorded in serialized filters
    static constexpr uint32_t cNativeWordBits = sizeof(size_t) * 8;

    // Constructors
    /**
     * @param size Number of bits in the filter
     * @param hash_algorithms Algorithms deriving the bit positions of an item, in order
     * @throw OperationFailed if `size` is 0 or too large, the list is empty, or an algorithm is
     * unavailable
     */
    Filter(size_t size, std::vector<HashAlgorithm> hash_algorithms);

    /**
     * @param size Number of bits in the filter
     * @param hash_algorithm_names Registry names of the algorithms, in order
     * @throw OperationFailed if `size` is 0, the list is empty, or a name isn't in the registry
     */
    Filter(size_t size, std::vector<std::string> const& hash_algorithm_names);

    // Methods
    /**
     * Calculates the filter size (in bits) that minimizes collisions for a target false positive
     * probability and capacity: -(n * ln(p)) / ln(2)^2
     * @param probability Target false positive probability
     * @param items_count Target capacity
     * @return The optimal size in bits (not rounded)
     * @throw OperationFailed with ErrorCodeBadParam if `items_count` is negative or `probability`
     * isn't in [0, 1]
     * @throw OperationFailed with ErrorCodeUndefined if `probability` is exactly 0 or 1
     */
    [[nodiscard]] static auto get_optimal_size(double probability, int64_t items_count) -> double;

    /**
     * Calculates the number of hash functions that minimizes collisions for a filter size and
     * capacity: max((m / n) * ln(2), 1)
     * @param size Filter size in bits
     * @param items_count Target capacity
     * @return The optimal number of hash functions (not rounded)
     * @throw OperationFailed with ErrorCodeBadParam if an argument is negative or `items_count` is
     * 0
     */
    [[nodiscard]] static auto get_optimal_num_hash_functions(double size, int64_t items_count)
            -> double;

    /**
     * Truncates an optimal size to a whole number of bits.
     * @param size
     * @return The size in bits
     * @throw OperationFailed with ErrorCodeBadParam if `size` is below 1 or too large for a filter
     */
    [[nodiscard]] static auto to_filter_size(double size) -> size_t;

    /**
     * Creates a filter sized for a target false positive probability and capacity, using a random
     * selection of distinct hash algorithms from the registry.
     * @param probability
     * @param items_count
     * @return The filter
     */
    [[nodiscard]] static auto get_optimum_filter(double probability, int64_t items_count) -> Filter;

    /**
     * Same as above, drawing the hash algorithms with the given random engine
     */
    [[nodiscard]] static auto
    get_optimum_filter(double probability, int64_t items_count, std::mt19937_64& random_engine)
            -> Filter;

    /**
     * @param item
     * @return The bit positions of the item, one per hash algorithm
     */
    [[nodiscard]] auto hash(std::string_view item) const -> HashSequence {
        return HashSequence{*this, item};
    }

    /**
     * Adds an item to the filter
     * @param item
     * @return The filter itself
     */
    auto add(std::string_view item) -> Filter&;

    /**
     * @param item
     * @return false if the item was definitely never added
     * @return true if the item may have been added
     */
    [[nodiscard]] auto has(std::string_view item) const -> bool;

    /**
     * @return Whether every bit of the filter is set
     */
    [[nodiscard]] auto is_full() const -> bool;

    /**
     * @return Number of add calls so far (duplicates included)
     */
    [[nodiscard]] auto count() const -> size_t { return m_count; }

    /**
     * @return The false positive probability given the current count: (1 - e^(-k * n / m))^k
     */
    [[nodiscard]] auto get_false_positive_probability() const -> double;

    /**
     * Estimates how many distinct items the filter can take before reaching a false positive
     * probability: -(m * ln(2)^2) / ln(p)
     * @param probability
     * @return The estimated capacity; infinity when `probability` is 1 and 0 when it's 0
     * @throw OperationFailed if `probability` isn't in [0, 1]
     */
    [[nodiscard]] auto estimate_capacity(double probability) const -> double;

    /**
     * @param probability
     * @return count() relative to estimate_capacity(probability), or 0 for an empty filter
     */
    [[nodiscard]] auto estimate_fill_rate(double probability) const -> double;

    /**
     * @param item
     * @return Number of the item's bit positions that are unset (0 if the item is reported present)
     */
    [[nodiscard]] auto distance_with(std::string_view item) const -> size_t;

    /**
     * @param other
     * @return A new filter with the bits set in either filter, and a count of 0
     * @throw OperationFailed with ErrorCodeIncompatible if the sizes or hash algorithm lists differ
     */
    [[nodiscard]] auto union_with(Filter const& other) const -> Filter;

    /**
     * @param other
     * @return A new filter with the bits set in both filters, and a count of 0
     * @throw OperationFailed with ErrorCodeIncompatible if the sizes or hash algorithm lists differ
     */
    [[nodiscard]] auto intersect_with(Filter const& other) const -> Filter;

    [[nodiscard]] auto test_bit(size_t bit_index) const -> bool;

    [[nodiscard]] auto get_size() const -> size_t { return m_size; }

    [[nodiscard]] auto get_hashes() const -> std::vector<HashAlgorithm> const& {
        return m_hash_algorithms;
    }

    /**
     * @return The bit array as two lowercase hex characters per byte, bit i being bit (i % 8) of
     * byte (i / 8)
     */
    [[nodiscard]] auto to_hex_string() const -> std::string;

    [[nodiscard]] auto to_json() const -> nlohmann::json;

    /**
     * @param serialized_filter
     * @return The deserialized filter
     * @throw OperationFailed with ErrorCodeIncompatible if it was produced on a system with a
     * different native word width
     * @throw OperationFailed with ErrorCodeCorrupt if the document is malformed
     */
    [[nodiscard]] static auto from_json(nlohmann::json const& serialized_filter) -> Filter;

    auto operator==(Filter const& rhs) const -> bool = default;

private:
    // Methods
    [[nodiscard]] auto get_position(HashAlgorithm algorithm, std::string_view item) const -> size_t;

    void set_bit(size_t bit_index);

    void require_compatible(Filter const& other, std::string_view operation) const;

    // Variables
    size_t m_size;
    std::vector<HashAlgorithm> m_hash_algorithms;
    size_t m_count{0};
    // Bit array stored as bytes, least significant bit first
    std::vector<uint8_t> m_bit_array;
};
}  // namespace fairbloom

#endif  // FAIRBLOOM_FILTER_HPP
