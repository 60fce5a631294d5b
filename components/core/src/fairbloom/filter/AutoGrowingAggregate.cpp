#include "AutoGrowingAggregate.hpp"

#include <cstddef>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../ErrorCode.hpp"
#include "../FilterConfig.hpp"
#include "Aggregate.hpp"
#include "Filter.hpp"
#include "FilterComponent.hpp"

namespace fairbloom {
namespace {
constexpr char cAutoGrowingType[] = "auto_growing";

void validate_factory(FilterFactory const& factory) {
    if (nullptr == factory) {
        throw AutoGrowingAggregate::OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                "Auto-growing aggregate requires a filter factory"
        );
    }
}
}  // namespace

AutoGrowingAggregate::AutoGrowingAggregate(FilterFactory factory, AggregateOptions options)
        : m_aggregate{options},
          m_factory{std::move(factory)} {
    validate_factory(m_factory);
}

AutoGrowingAggregate::AutoGrowingAggregate(FilterFactory factory, Aggregate aggregate)
        : m_aggregate{std::move(aggregate)},
          m_factory{std::move(factory)} {
    validate_factory(m_factory);
}

auto AutoGrowingAggregate::attach(FilterComponent component) -> AutoGrowingAggregate& {
    m_aggregate.attach(std::move(component));
    return *this;
}

auto AutoGrowingAggregate::add(std::string_view item) -> Filter& {
    auto result = m_aggregate.try_add(item);
    if (false == result.needs_growth()) {
        return *result.get_filter();
    }

    SPDLOG_DEBUG(
            "Growing aggregate of {} filters after {} condition.",
            m_aggregate.get_children().size(),
            AddStatus::Underflow == result.get_status() ? "underflow" : "overflow"
    );
    m_aggregate.attach(m_factory(*this));

    // A fresh filter is empty and carries the highest weight, so the round-robin reaches it within
    // one cycle unless the factory produced an ineligible filter
    auto const num_attempts = m_aggregate.get_children().size();
    for (size_t attempt = 0; attempt < num_attempts; ++attempt) {
        result = m_aggregate.try_add(item);
        if (false == result.needs_growth()) {
            return *result.get_filter();
        }
    }
    throw OperationFailed(
            ErrorCodeFailure,
            __FILENAME__,
            __LINE__,
            "Filter created by the factory cannot take any item"
    );
}

auto AutoGrowingAggregate::to_json() const -> nlohmann::json {
    auto serialized_aggregate = m_aggregate.to_json();
    serialized_aggregate["type"] = cAutoGrowingType;
    return serialized_aggregate;
}

auto AutoGrowingAggregate::from_json(
        nlohmann::json const& serialized_aggregate,
        FilterFactory factory
) -> AutoGrowingAggregate {
    auto aggregate = Aggregate::from_json(serialized_aggregate, factory);
    return AutoGrowingAggregate{std::move(factory), std::move(aggregate)};
}

auto make_optimum_filter_factory(FilterConfig const& config) -> FilterFactory {
    validate_filter_config(config);
    return [config](AutoGrowingAggregate const&) -> FilterComponent {
        if (config.hash_algorithms.empty()) {
            return Filter::get_optimum_filter(config.false_positive_rate, config.capacity);
        }
        auto const size = Filter::get_optimal_size(config.false_positive_rate, config.capacity);
        return Filter{Filter::to_filter_size(size), config.hash_algorithms};
    };
}
}  // namespace fairbloom
