#include "Aggregate.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../ErrorCode.hpp"
#include "../WeightedRoundRobin.hpp"
#include "FilterComponent.hpp"

namespace fairbloom {
namespace {
constexpr char cAggregateType[] = "aggregate";
constexpr uint32_t cMaxWeight = 100;

void validate_options(AggregateOptions const& options) {
    auto const threshold = options.false_probability_threshold;
    if (std::isnan(threshold) || threshold < 0.0 || threshold > 1.0) {
        throw Aggregate::OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                fmt::format("False probability threshold {} is not in [0, 1]", threshold)
        );
    }
}
}  // namespace

Aggregate::Aggregate(AggregateOptions options) : m_options{options} {
    validate_options(m_options);
}

auto Aggregate::attach(FilterComponent component) -> Aggregate& {
    m_children.emplace_back(std::move(component));
    return *this;
}

auto Aggregate::count() const -> size_t {
    size_t count{0};
    for (auto const& child : m_children) {
        count += child.count();
    }
    return count;
}

auto Aggregate::add(std::string_view item) -> Filter& {
    auto const result = try_add(item);
    switch (result.get_status()) {
        case AddStatus::Added:
            return *result.get_filter();
        case AddStatus::Underflow:
            throw OperationFailed(
                    ErrorCodeUnderflow,
                    __FILENAME__,
                    __LINE__,
                    "No filter attached to current aggregator"
            );
        case AddStatus::Overflow:
            throw OperationFailed(
                    ErrorCodeOverflow,
                    __FILENAME__,
                    __LINE__,
                    "All attached filters are virtually full"
            );
    }
    throw OperationFailed(ErrorCodeFailure, __FILENAME__, __LINE__, "Unknown add status");
}

auto Aggregate::try_add(std::string_view item) -> AddResult {
    if (m_children.empty()) {
        return AddResult{AddStatus::Underflow};
    }

    auto const weights = get_weights();
    auto const is_eligible = std::any_of(weights.cbegin(), weights.cend(), [](uint32_t weight) {
        return weight > 0;
    });
    if (false == is_eligible) {
        return AddResult{AddStatus::Overflow};
    }

    auto const index = m_scheduler.next(weights);
    if (false == index.has_value()) {
        return AddResult{AddStatus::Overflow};
    }
    return m_children[index.value()].try_add(item);
}

auto Aggregate::has(std::string_view item) const -> Positives {
    Positives positives;
    for (auto const& child : m_children) {
        if (child.has(item)) {
            positives.push_back(&child);
        }
    }

    std::stable_sort(
            positives.begin(),
            positives.end(),
            [](FilterComponent const* lhs, FilterComponent const* rhs) {
                return lhs->get_false_positive_probability()
                       < rhs->get_false_positive_probability();
            }
    );
    return positives;
}

auto Aggregate::is_full() const -> bool {
    return std::all_of(m_children.cbegin(), m_children.cend(), [](FilterComponent const& child) {
        return child.is_full();
    });
}

auto Aggregate::get_false_positive_probability() const -> double {
    double max_probability{0.0};
    for (auto const& child : m_children) {
        max_probability = std::max(max_probability, child.get_false_positive_probability());
    }
    return max_probability;
}

auto Aggregate::get_weights() const -> std::vector<uint32_t> {
    std::vector<uint32_t> weights;
    weights.reserve(m_children.size());
    for (auto const& child : m_children) {
        auto const probability = child.get_false_positive_probability();
        auto weight = cMaxWeight - static_cast<uint32_t>(std::lround(probability * cMaxWeight));

        if (probability > m_options.false_probability_threshold || child.is_full()) {
            weight = 0;
        }
        weights.push_back(weight);
    }
    return weights;
}

auto Aggregate::to_json() const -> nlohmann::json {
    auto serialized_children = nlohmann::json::array();
    for (auto const& child : m_children) {
        serialized_children.push_back(child.to_json());
    }

    nlohmann::json serialized_aggregate;
    serialized_aggregate["type"] = cAggregateType;
    serialized_aggregate["current_index"] = m_scheduler.get_current_index();
    serialized_aggregate["current_weight"] = m_scheduler.get_current_weight();
    serialized_aggregate["options"]["false_probability_threshold"]
            = m_options.false_probability_threshold;
    serialized_aggregate["filters"] = std::move(serialized_children);
    return serialized_aggregate;
}

auto Aggregate::from_json(nlohmann::json const& serialized_aggregate, FilterFactory const& factory)
        -> Aggregate {
    int64_t current_index{-1};
    int64_t current_weight{0};
    AggregateOptions options;
    try {
        serialized_aggregate.at("current_index").get_to(current_index);
        serialized_aggregate.at("current_weight").get_to(current_weight);
        serialized_aggregate.at("options")
                .at("false_probability_threshold")
                .get_to(options.false_probability_threshold);
        if (false == serialized_aggregate.at("filters").is_array()) {
            throw OperationFailed(
                    ErrorCodeCorrupt,
                    __FILENAME__,
                    __LINE__,
                    "Serialized aggregate filters are not an array"
            );
        }
    } catch (nlohmann::json::exception const& e) {
        throw OperationFailed(
                ErrorCodeCorrupt,
                __FILENAME__,
                __LINE__,
                fmt::format("Malformed serialized aggregate - {}", e.what())
        );
    }

    auto const num_filters = static_cast<int64_t>(serialized_aggregate.at("filters").size());
    if (current_index < -1 || current_index >= num_filters) {
        throw OperationFailed(
                ErrorCodeCorrupt,
                __FILENAME__,
                __LINE__,
                fmt::format("Invalid scheduler index {} for {} filters", current_index, num_filters)
        );
    }
    if (current_weight < 0 || current_weight > static_cast<int64_t>(cMaxWeight)) {
        throw OperationFailed(
                ErrorCodeCorrupt,
                __FILENAME__,
                __LINE__,
                fmt::format("Invalid scheduler weight {}", current_weight)
        );
    }

    Aggregate aggregate{options};
    aggregate.m_scheduler = WeightedRoundRobin{current_index, current_weight};
    for (auto const& serialized_child : serialized_aggregate.at("filters")) {
        aggregate.attach(FilterComponent::from_json(serialized_child, factory));
    }
    return aggregate;
}
}  // namespace fairbloom
