#ifndef FAIRBLOOM_FILTERCOMPONENT_HPP
#define FAIRBLOOM_FILTERCOMPONENT_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <nlohmann/json_fwd.hpp>

#include "../TraceableException.hpp"
#include "Filter.hpp"

namespace fairbloom {
class Aggregate;
class AutoGrowingAggregate;
class FilterComponent;

/**
 * Creates the filter an auto-growing aggregate attaches when it runs out of capacity. The
 * aggregate being grown is passed in so the new filter can be parameterized from its state.
 */
using FilterFactory = std::function<FilterComponent(AutoGrowingAggregate const&)>;

/**
 * Outcome of inserting an item into a filter component
 */
enum class AddStatus : uint8_t {
    Added = 0,
    // No filter is attached to the aggregate
    Underflow,
    // Every filter of the aggregate is full or above its false positive threshold
    Overflow,
};

class AddResult {
public:
    // Constructors
    explicit AddResult(Filter& filter) : m_status{AddStatus::Added}, m_filter{&filter} {}

    explicit AddResult(AddStatus status) : m_status{status} {}

    // Methods
    [[nodiscard]] auto get_status() const -> AddStatus { return m_status; }

    /**
     * @return Whether the item was rejected because the aggregate needs another filter
     */
    [[nodiscard]] auto needs_growth() const -> bool { return AddStatus::Added != m_status; }

    /**
     * @return The filter that took the item, or nullptr if it wasn't added
     */
    [[nodiscard]] auto get_filter() const -> Filter* { return m_filter; }

private:
    AddStatus m_status;
    Filter* m_filter{nullptr};
};

/**
 * Value type holding any filter-like object: a plain filter, an aggregate, or an auto-growing
 * aggregate. Aggregates are stored on the heap since they themselves hold filter components.
 * Copies are deep.
 */
class FilterComponent {
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

    using Variant = std::
            variant<Filter, std::unique_ptr<Aggregate>, std::unique_ptr<AutoGrowingAggregate>>;

    // Constructors
    FilterComponent(Filter filter);

    FilterComponent(Aggregate aggregate);

    FilterComponent(AutoGrowingAggregate aggregate);

    FilterComponent(FilterComponent const& other);

    auto operator=(FilterComponent const& other) -> FilterComponent&;

    FilterComponent(FilterComponent&& other) noexcept;

    auto operator=(FilterComponent&& other) noexcept -> FilterComponent&;

    ~FilterComponent();

    // Methods
    /**
     * Adds an item
     * @param item
     * @return The filter that took the item
     * @throw Aggregate::OperationFailed if an aggregate has no eligible filter
     */
    auto add(std::string_view item) -> Filter&;

    /**
     * Adds an item, reporting a lack of capacity as a result rather than an exception
     * @param item
     * @return The result
     */
    auto try_add(std::string_view item) -> AddResult;

    /**
     * @param item
     * @return Whether the item may have been added
     */
    [[nodiscard]] auto has(std::string_view item) const -> bool;

    [[nodiscard]] auto is_full() const -> bool;

    [[nodiscard]] auto count() const -> size_t;

    [[nodiscard]] auto get_false_positive_probability() const -> double;

    [[nodiscard]] auto get_if_filter() -> Filter* { return std::get_if<Filter>(&m_impl); }

    [[nodiscard]] auto get_if_filter() const -> Filter const* {
        return std::get_if<Filter>(&m_impl);
    }

    [[nodiscard]] auto get_if_aggregate() const -> Aggregate const*;

    [[nodiscard]] auto get_if_auto_growing() const -> AutoGrowingAggregate const*;

    [[nodiscard]] auto get_impl() const -> Variant const& { return m_impl; }

    [[nodiscard]] auto to_json() const -> nlohmann::json;

    /**
     * Deserializes a filter, aggregate or auto-growing aggregate, dispatching on its type
     * @param serialized_component
     * @param factory Factory given to deserialized auto-growing aggregates
     * @return The component
     * @throw OperationFailed with ErrorCodeCorrupt if the type is missing or unknown
     * @throw OperationFailed with ErrorCodeBadParam if an auto-growing aggregate is found and no
     * factory was given
     */
    [[nodiscard]] static auto
    from_json(nlohmann::json const& serialized_component, FilterFactory const& factory = {})
            -> FilterComponent;

private:
    Variant m_impl;
};
}  // namespace fairbloom

#endif  // FAIRBLOOM_FILTERCOMPONENT_HPP
