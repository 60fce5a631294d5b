#include "WeightedRoundRobin.hpp"

#include <algorithm>

#include "math_utils.hpp"

namespace fairbloom {
auto WeightedRoundRobin::next(std::vector<uint32_t> const& weights) -> std::optional<size_t> {
    if (weights.empty()) {
        return std::nullopt;
    }

    auto const num_weights = static_cast<int64_t>(weights.size());
    auto const step = static_cast<int64_t>(gcd(weights));
    auto const max_weight
            = static_cast<int64_t>(*std::max_element(weights.cbegin(), weights.cend()));
    if (0 == max_weight) {
        // Nothing is eligible; a carried-over weight would otherwise never be decremented
        return std::nullopt;
    }

    while (true) {
        m_current_index = (m_current_index + 1) % num_weights;
        if (0 == m_current_index) {
            m_current_weight -= step;
            if (m_current_weight <= 0) {
                m_current_weight = max_weight;
            }
        }
        if (static_cast<int64_t>(weights[m_current_index]) >= m_current_weight) {
            return static_cast<size_t>(m_current_index);
        }
    }
}
}  // namespace fairbloom
