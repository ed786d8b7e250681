#pragma once

/** \file topk.hpp
 *  \brief Bounded selection of the K best similarity scores.
 *
 * Min-heap of size <= k keyed on (score, row): the worst kept entry sits on top and is
 * replaced by any better candidate. Equal scores prefer the lower row, and snapshot rows
 * are in ascending path order, so ties resolve by path. O(n log k).
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace lumen::search {

struct ScoredRow {
  float score;
  std::uint32_t row;
};

class TopK {
public:
  explicit TopK(std::size_t k) : k_(k) { heap_.reserve(k + 1); }

  void push(float score, std::uint32_t row) {
    if (k_ == 0) return;
    if (heap_.size() < k_) {
      heap_.push_back({score, row});
      std::push_heap(heap_.begin(), heap_.end(), worse_on_top);
    } else if (better(score, row, heap_.front())) {
      std::pop_heap(heap_.begin(), heap_.end(), worse_on_top);
      heap_.back() = {score, row};
      std::push_heap(heap_.begin(), heap_.end(), worse_on_top);
    }
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t { return heap_.size(); }

  /** \brief Best first. Leaves the selector empty. */
  auto take_sorted() -> std::vector<ScoredRow> {
    std::sort_heap(heap_.begin(), heap_.end(), worse_on_top);
    std::vector<ScoredRow> out;
    out.swap(heap_);
    return out;
  }

private:
  static bool better(float score, std::uint32_t row, const ScoredRow& than) noexcept {
    if (score != than.score) return score > than.score;
    return row < than.row;
  }

  // Heap comparator: a sorts before b when a is better, which keeps the worst on top.
  static bool worse_on_top(const ScoredRow& a, const ScoredRow& b) noexcept {
    return better(a.score, a.row, b);
  }

  std::size_t k_;
  std::vector<ScoredRow> heap_;
};

} // namespace lumen::search
