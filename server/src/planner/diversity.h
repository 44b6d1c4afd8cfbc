#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace walkplan {

// Reorders `items` so that no category occurs more than `max_consecutive`
// times in a row, when that can be done by pulling a later item of another
// category forward. Every item is kept. Returns the number of swaps made.
template <typename T, typename CategoryFn>
int EnforceCategoryDiversity(
    std::vector<T>& items, int max_consecutive, CategoryFn category_of
) {
  if (max_consecutive < 1 || items.size() < 2) {
    return 0;
  }
  int swaps = 0;
  int run = 1;
  for (size_t idx = 1; idx < items.size(); ++idx) {
    if (category_of(items[idx]) != category_of(items[idx - 1])) {
      run = 1;
      continue;
    }
    ++run;
    if (run <= max_consecutive) {
      continue;
    }
    size_t swap_idx = idx + 1;
    while (swap_idx < items.size() &&
           category_of(items[swap_idx]) == category_of(items[idx])) {
      ++swap_idx;
    }
    if (swap_idx == items.size()) {
      // Only this category is left.
      break;
    }
    std::swap(items[idx], items[swap_idx]);
    ++swaps;
    run = 1;
  }
  return swaps;
}

}  // namespace walkplan
