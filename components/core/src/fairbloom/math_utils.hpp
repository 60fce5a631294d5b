#ifndef FAIRBLOOM_MATH_UTILS_HPP
#define FAIRBLOOM_MATH_UTILS_HPP

#include <algorithm>
#include <initializer_list>
#include <numeric>
#include <type_traits>
#include <vector>

namespace fairbloom {
/**
 * Computes the greatest common divisor of a set of non-negative integers.
 *
 * Duplicates are dropped and the values are reduced in ascending order. The reduction stops as
 * soon as the running divisor reaches 1. A set containing only zeros (or no value at all) yields 0.
 * @tparam IntegerType
 * @param values
 * @return The greatest common divisor of all the values
 */
template <typename IntegerType>
[[nodiscard]] auto gcd(std::vector<IntegerType> values) -> IntegerType {
    static_assert(std::is_integral_v<IntegerType>, "gcd requires an integral type");

    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    if (values.empty()) {
        return 0;
    }

    auto divisor = values.front();
    for (auto it = values.cbegin() + 1; values.cend() != it; ++it) {
        // Only the smallest value can be zero, so `*it` is never a zero divisor
        divisor = std::gcd(divisor, *it);
        if (1 == divisor) {
            break;
        }
    }
    return divisor;
}

template <typename IntegerType>
[[nodiscard]] auto gcd(std::initializer_list<IntegerType> values) -> IntegerType {
    return gcd(std::vector<IntegerType>(values));
}
}  // namespace fairbloom

#endif  // FAIRBLOOM_MATH_UTILS_HPP
