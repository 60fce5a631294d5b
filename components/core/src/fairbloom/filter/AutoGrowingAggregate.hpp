#ifndef FAIRBLOOM_AUTOGROWINGAGGREGATE_HPP
#define FAIRBLOOM_AUTOGROWINGAGGREGATE_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "../FilterConfig.hpp"
#include "../TraceableException.hpp"
#include "Aggregate.hpp"
#include "FilterComponent.hpp"

namespace fairbloom {
/**
 * An aggregate that never rejects an item: whenever it has no filter, or no filter with capacity
 * left, it asks its factory for a new filter, attaches it and retries. The number of filters is
 * unbounded.
 */
class AutoGrowingAggregate {
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

    // Constructors
    /**
     * @param factory
     * @param options
     * @throw OperationFailed if the factory is empty
     */
    explicit AutoGrowingAggregate(FilterFactory factory, AggregateOptions options = {});

    /**
     * Wraps an existing aggregate
     * @param factory
     * @param aggregate
     * @throw OperationFailed if the factory is empty
     */
    AutoGrowingAggregate(FilterFactory factory, Aggregate aggregate);

    // Methods
    auto attach(FilterComponent component) -> AutoGrowingAggregate&;

    /**
     * Adds an item, growing the aggregate first if it has no capacity left
     * @param item
     * @return The filter that took the item
     * @throw OperationFailed with ErrorCodeFailure if a freshly created filter doesn't accept the
     * item
     */
    auto add(std::string_view item) -> Filter&;

    [[nodiscard]] auto has(std::string_view item) const -> Aggregate::Positives {
        return m_aggregate.has(item);
    }

    [[nodiscard]] auto is_full() const -> bool { return m_aggregate.is_full(); }

    [[nodiscard]] auto count() const -> size_t { return m_aggregate.count(); }

    [[nodiscard]] auto get_false_positive_probability() const -> double {
        return m_aggregate.get_false_positive_probability();
    }

    [[nodiscard]] auto get_children() const -> std::vector<FilterComponent> const& {
        return m_aggregate.get_children();
    }

    [[nodiscard]] auto get_aggregate() const -> Aggregate const& { return m_aggregate; }

    [[nodiscard]] auto get_factory() const -> FilterFactory const& { return m_factory; }

    [[nodiscard]] auto to_json() const -> nlohmann::json;

    /**
     * @param serialized_aggregate
     * @param factory The factory isn't serialized, so it has to be provided again
     * @return The deserialized aggregate
     */
    [[nodiscard]] static auto
    from_json(nlohmann::json const& serialized_aggregate, FilterFactory factory)
            -> AutoGrowingAggregate;

private:
    // Variables
    Aggregate m_aggregate;
    FilterFactory m_factory;
};

/**
 * @param config
 * @return A factory creating filters sized for the configured false positive rate and capacity.
 * Filters use the configured hash algorithms, or a random selection if none are configured.
 */
[[nodiscard]] auto make_optimum_filter_factory(FilterConfig const& config) -> FilterFactory;
}  // namespace fairbloom

#endif  // FAIRBLOOM_AUTOGROWINGAGGREGATE_HPP
