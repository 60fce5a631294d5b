#ifndef FAIRBLOOM_WEIGHTEDROUNDROBIN_HPP
#define FAIRBLOOM_WEIGHTEDROUNDROBIN_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace fairbloom {
/**
 * Weighted round-robin selection, as done by the LVS scheduler.
 *
 * Over a scheduling window every index is selected in proportion to its weight, and selections of
 * a heavy index are interleaved with the lighter ones instead of being emitted back to back. The
 * position in the cycle persists between calls, so the same scheduler must be reused to get the
 * fairness guarantee.
 */
class WeightedRoundRobin {
public:
    // Constructors
    WeightedRoundRobin() = default;

    /**
     * Restores a scheduler from a previously saved state
     * @param current_index
     * @param current_weight
     */
    WeightedRoundRobin(int64_t current_index, int64_t current_weight)
            : m_current_index{current_index},
              m_current_weight{current_weight} {}

    // Methods
    /**
     * Selects the next index
     * @param weights
     * @return The selected index, or std::nullopt if `weights` is empty or every weight is zero
     */
    [[nodiscard]] auto next(std::vector<uint32_t> const& weights) -> std::optional<size_t>;

    [[nodiscard]] auto get_current_index() const -> int64_t { return m_current_index; }

    [[nodiscard]] auto get_current_weight() const -> int64_t { return m_current_weight; }

    auto operator==(WeightedRoundRobin const& rhs) const -> bool = default;

private:
    // Variables
    int64_t m_current_index{-1};
    int64_t m_current_weight{0};
};
}  // namespace fairbloom

#endif  // FAIRBLOOM_WEIGHTEDROUNDROBIN_HPP
