#include "FilterComponent.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../ErrorCode.hpp"
#include "Aggregate.hpp"
#include "AutoGrowingAggregate.hpp"
#include "Filter.hpp"

namespace fairbloom {
namespace {
auto deref(Filter& filter) -> Filter& {
    return filter;
}

auto deref(Filter const& filter) -> Filter const& {
    return filter;
}

template <typename T>
auto deref(std::unique_ptr<T> const& ptr) -> T& {
    return *ptr;
}

auto clone(FilterComponent::Variant const& impl) -> FilterComponent::Variant {
    return std::visit(
            [](auto const& alternative) -> FilterComponent::Variant {
                using Alternative = std::decay_t<decltype(alternative)>;
                if constexpr (std::is_same_v<Alternative, Filter>) {
                    return alternative;
                } else {
                    return std::make_unique<typename Alternative::element_type>(*alternative);
                }
            },
            impl
    );
}
}  // namespace

FilterComponent::FilterComponent(Filter filter) : m_impl{std::move(filter)} {}

FilterComponent::FilterComponent(Aggregate aggregate)
        : m_impl{std::make_unique<Aggregate>(std::move(aggregate))} {}

FilterComponent::FilterComponent(AutoGrowingAggregate aggregate)
        : m_impl{std::make_unique<AutoGrowingAggregate>(std::move(aggregate))} {}

FilterComponent::FilterComponent(FilterComponent const& other) : m_impl{clone(other.m_impl)} {}

auto FilterComponent::operator=(FilterComponent const& other) -> FilterComponent& {
    if (this != &other) {
        m_impl = clone(other.m_impl);
    }
    return *this;
}

FilterComponent::FilterComponent(FilterComponent&& other) noexcept = default;

auto FilterComponent::operator=(FilterComponent&& other) noexcept -> FilterComponent& = default;

FilterComponent::~FilterComponent() = default;

auto FilterComponent::add(std::string_view item) -> Filter& {
    return std::visit(
            [&](auto& alternative) -> Filter& { return deref(alternative).add(item); },
            m_impl
    );
}

auto FilterComponent::try_add(std::string_view item) -> AddResult {
    if (auto* aggregate = std::get_if<std::unique_ptr<Aggregate>>(&m_impl)) {
        return (*aggregate)->try_add(item);
    }
    return AddResult{add(item)};
}

auto FilterComponent::has(std::string_view item) const -> bool {
    return std::visit(
            [&](auto const& alternative) -> bool {
                auto const result = deref(alternative).has(item);
                if constexpr (std::is_same_v<std::decay_t<decltype(result)>, bool>) {
                    return result;
                } else {
                    return false == result.empty();
                }
            },
            m_impl
    );
}

auto FilterComponent::is_full() const -> bool {
    return std::visit(
            [](auto const& alternative) -> bool { return deref(alternative).is_full(); },
            m_impl
    );
}

auto FilterComponent::count() const -> size_t {
    return std::visit(
            [](auto const& alternative) -> size_t { return deref(alternative).count(); },
            m_impl
    );
}

auto FilterComponent::get_false_positive_probability() const -> double {
    return std::visit(
            [](auto const& alternative) -> double {
                return deref(alternative).get_false_positive_probability();
            },
            m_impl
    );
}

auto FilterComponent::get_if_aggregate() const -> Aggregate const* {
    auto const* aggregate = std::get_if<std::unique_ptr<Aggregate>>(&m_impl);
    return nullptr == aggregate ? nullptr : aggregate->get();
}

auto FilterComponent::get_if_auto_growing() const -> AutoGrowingAggregate const* {
    auto const* aggregate = std::get_if<std::unique_ptr<AutoGrowingAggregate>>(&m_impl);
    return nullptr == aggregate ? nullptr : aggregate->get();
}

auto FilterComponent::to_json() const -> nlohmann::json {
    return std::visit(
            [](auto const& alternative) -> nlohmann::json { return deref(alternative).to_json(); },
            m_impl
    );
}

auto FilterComponent::from_json(
        nlohmann::json const& serialized_component,
        FilterFactory const& factory
) -> FilterComponent {
    std::string type;
    try {
        serialized_component.at("type").get_to(type);
    } catch (nlohmann::json::exception const& e) {
        throw OperationFailed(
                ErrorCodeCorrupt,
                __FILENAME__,
                __LINE__,
                fmt::format("Serialized filter has no type - {}", e.what())
        );
    }

    if ("filter" == type) {
        return Filter::from_json(serialized_component);
    }
    if ("aggregate" == type) {
        return Aggregate::from_json(serialized_component, factory);
    }
    if ("auto_growing" == type) {
        if (nullptr == factory) {
            throw OperationFailed(
                    ErrorCodeBadParam,
                    __FILENAME__,
                    __LINE__,
                    "A filter factory is required to load an auto-growing aggregate"
            );
        }
        return AutoGrowingAggregate::from_json(serialized_component, factory);
    }
    throw OperationFailed(
            ErrorCodeCorrupt,
            __FILENAME__,
            __LINE__,
            fmt::format("Unknown serialized filter type {}", type)
    );
}
}  // namespace fairbloom
