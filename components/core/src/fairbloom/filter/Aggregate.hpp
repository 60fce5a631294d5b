#ifndef FAIRBLOOM_AGGREGATE_HPP
#define FAIRBLOOM_AGGREGATE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "../TraceableException.hpp"
#include "../WeightedRoundRobin.hpp"
#include "FilterComponent.hpp"

namespace fairbloom {
struct AggregateOptions {
    // Filters whose false positive probability exceeds this threshold stop receiving items
    double false_probability_threshold{1.0};
};

/**
 * A filter made of several filter components (plain filters or nested aggregates).
 *
 * Items are distributed across the components with a weighted round-robin: the higher the false
 * positive probability of a component, the less likely it is to receive a new item. Components
 * that are full or above the configured threshold receive nothing. Lookups poll every component.
 */
class Aggregate {
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

    // Components that may contain an item, most reliable first
    using Positives = std::vector<FilterComponent const*>;

    // Constructors
    /**
     * @param options
     * @throw OperationFailed if the false probability threshold isn't in [0, 1]
     */
    explicit Aggregate(AggregateOptions options = {});

    // Methods
    /**
     * Attaches a component. Components aren't validated against each other, so filters of
     * different sizes and hash algorithms can be mixed.
     * @param component
     * @return The aggregate itself
     */
    auto attach(FilterComponent component) -> Aggregate&;

    /**
     * @return Sum of the item counts of every component
     */
    [[nodiscard]] auto count() const -> size_t;

    /**
     * Adds an item to the component picked by the weighted round-robin
     * @param item
     * @return The filter that took the item
     * @throw OperationFailed with ErrorCodeUnderflow if no component is attached
     * @throw OperationFailed with ErrorCodeOverflow if no component is eligible
     */
    auto add(std::string_view item) -> Filter&;

    /**
     * Same as add, but reports a missing or exhausted capacity through the result
     * @param item
     * @return The result
     */
    auto try_add(std::string_view item) -> AddResult;

    /**
     * @param item
     * @return The components that may contain the item, ordered by decreasing reliability
     * (1 - false positive probability). Empty if no component may contain it.
     */
    [[nodiscard]] auto has(std::string_view item) const -> Positives;

    /**
     * @return Whether every component is full
     */
    [[nodiscard]] auto is_full() const -> bool;

    /**
     * @return The highest false positive probability amongst the components
     */
    [[nodiscard]] auto get_false_positive_probability() const -> double;

    /**
     * @return The scheduling weight of every component, in [0, 100]
     */
    [[nodiscard]] auto get_weights() const -> std::vector<uint32_t>;

    [[nodiscard]] auto get_children() const -> std::vector<FilterComponent> const& {
        return m_children;
    }

    [[nodiscard]] auto get_options() const -> AggregateOptions const& { return m_options; }

    [[nodiscard]] auto get_scheduler() const -> WeightedRoundRobin const& { return m_scheduler; }

    [[nodiscard]] auto to_json() const -> nlohmann::json;

    /**
     * @param serialized_aggregate
     * @param factory Factory given to nested auto-growing aggregates
     * @return The deserialized aggregate
     * @throw OperationFailed with ErrorCodeCorrupt if the document is malformed
     */
    [[nodiscard]] static auto
    from_json(nlohmann::json const& serialized_aggregate, FilterFactory const& factory = {})
            -> Aggregate;

private:
    // Variables
    std::vector<FilterComponent> m_children;
    WeightedRoundRobin m_scheduler;
    AggregateOptions m_options;
};
}  // namespace fairbloom

#endif  // FAIRBLOOM_AGGREGATE_HPP
