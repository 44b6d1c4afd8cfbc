#include "planner/diversity.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <string>

namespace walkplan {
namespace {

struct Item {
  int id;
  std::string category;
};

std::string CategoryOf(const Item& item) { return item.category; }

std::vector<std::string> Categories(const std::vector<Item>& items) {
  std::vector<std::string> result;
  for (const Item& item : items) {
    result.push_back(item.category);
  }
  return result;
}

TEST(DiversityTest, BreaksLongRuns) {
  std::vector<Item> items = {
      {1, "museum"}, {2, "museum"}, {3, "museum"}, {4, "park"}, {5, "park"}
  };
  EXPECT_EQ(EnforceCategoryDiversity(items, 2, CategoryOf), 1);
  EXPECT_EQ(
      Categories(items),
      (std::vector<std::string>{"museum", "museum", "park", "museum", "park"})
  );
}

TEST(DiversityTest, AlternatesWithMaxOne) {
  std::vector<Item> items = {
      {1, "museum"}, {2, "museum"}, {3, "museum"}, {4, "park"}, {5, "park"}
  };
  EnforceCategoryDiversity(items, 1, CategoryOf);
  EXPECT_EQ(
      Categories(items),
      (std::vector<std::string>{"museum", "park", "museum", "park", "museum"})
  );
}

TEST(DiversityTest, LeavesShortRunsAlone) {
  std::vector<Item> items = {{1, "museum"}, {2, "museum"}, {3, "park"}};
  EXPECT_EQ(EnforceCategoryDiversity(items, 2, CategoryOf), 0);
  EXPECT_EQ(items[0].id, 1);
  EXPECT_EQ(items[1].id, 2);
  EXPECT_EQ(items[2].id, 3);
}

TEST(DiversityTest, SingleCategoryIsUnchanged) {
  std::vector<Item> items = {{1, "park"}, {2, "park"}, {3, "park"}};
  EXPECT_EQ(EnforceCategoryDiversity(items, 2, CategoryOf), 0);
  EXPECT_EQ(items.size(), 3);
}

RC_GTEST_PROP(DiversityTest, KeepsEveryItemAndBoundsRuns, ()) {
  int max_consecutive = *rc::gen::inRange(1, 4);
  auto categories = *rc::gen::container<std::vector<std::string>>(
      rc::gen::elementOf(std::vector<std::string>{"museum", "park", "cafe"})
  );
  std::vector<Item> items;
  for (size_t i = 0; i < categories.size(); ++i) {
    items.push_back(Item{static_cast<int>(i), categories[i]});
  }

  std::vector<Item> balanced = items;
  EnforceCategoryDiversity(balanced, max_consecutive, CategoryOf);

  std::vector<int> ids;
  for (const Item& item : balanced) {
    ids.push_back(item.id);
  }
  std::sort(ids.begin(), ids.end());
  for (size_t i = 0; i < ids.size(); ++i) {
    RC_ASSERT(ids[i] == static_cast<int>(i));
  }

  // A run may only exceed the limit once nothing else is left to swap in.
  int run = 1;
  for (size_t i = 1; i < balanced.size(); ++i) {
    run = balanced[i].category == balanced[i - 1].category ? run + 1 : 1;
    if (run > max_consecutive) {
      for (size_t j = i; j < balanced.size(); ++j) {
        RC_ASSERT(balanced[j].category == balanced[i].category);
      }
      break;
    }
  }
}

}  // namespace
}  // namespace walkplan
