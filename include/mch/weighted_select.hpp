/**
 * @file weighted_select.hpp
 * @brief Weight-proportional draw among the candidates of one priority level.
 *
 * Candidate i is chosen with probability weight(i) / sum(weights). A weight
 * of 0 gives probability 0; callers leave such candidates out of the total
 * (and may leave them out of the list altogether).
 */

#ifndef MCH_WEIGHTED_SELECT_HPP_
#define MCH_WEIGHTED_SELECT_HPP_

#include "mch/platform.hpp"

#include <cstddef>
#include <cstdint>

#include <random>
#include <vector>

namespace mch {

/**
 * @brief Draw one index in [0, count) proportionally to weight_of(items[i]).
 *
 * @param items     Random-access container of candidates (non-empty).
 * @param total     Sum of weight_of over items, must be > 0.
 * @param weight_of Callable returning the uint32_t weight of a candidate.
 * @param rng       UniformRandomBitGenerator (e.g. std::mt19937).
 */
template <typename Container, typename WeightFn, typename Rng>
size_t WeightedIndex(const Container& items, uint64_t total,
                     WeightFn&& weight_of, Rng& rng) {
  MCH_ASSERT(total > 0U);
  MCH_ASSERT(!items.empty());

  std::uniform_int_distribution<uint64_t> dist(0U, total - 1U);
  uint64_t point = dist(rng);

  const size_t count = items.size();
  for (size_t i = 0; i < count; ++i) {
    const uint64_t w = weight_of(items[i]);
    if (point < w) return i;
    point -= w;
  }
  MCH_ASSERT_MSG(false, "weights do not add up to total");
  return count - 1U;
}

/**
 * @brief Reusable scratch list of (candidate, weight) for one selection pass.
 *
 * Owned by the registry and cleared per priority level, so a steady-state
 * receive does not allocate.
 */
template <typename Item>
class WeightedCandidates final {
 public:
  void Clear() noexcept {
    items_.clear();
    total_ = 0U;
  }

  /** @brief Record a candidate; zero-weight ones are skipped. */
  void Add(Item item, uint32_t weight) {
    if (weight == 0U) return;
    items_.push_back(Entry{item, weight});
    total_ += weight;
  }

  bool Empty() const noexcept { return items_.empty(); }
  size_t Size() const noexcept { return items_.size(); }
  uint64_t TotalWeight() const noexcept { return total_; }

  template <typename Rng>
  Item Draw(Rng& rng) const {
    size_t idx = WeightedIndex(
        items_, total_, [](const Entry& e) { return e.weight; }, rng);
    return items_[idx].item;
  }

  void Reserve(size_t n) { items_.reserve(n); }

 private:
  struct Entry {
    Item item;
    uint32_t weight;
  };

  std::vector<Entry> items_;
  uint64_t total_{0U};
};

}  // namespace mch

#endif  // MCH_WEIGHTED_SELECT_HPP_
