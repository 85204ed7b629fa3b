#pragma once
#include <ctime>
#include <vector>
#include "Item.hpp"

/*
  Presentation order for a review session. Items fall into four tiers,
  always concatenated in this order:

    1. URGENT_DUE   due, LEARNING or RELEARNING
    2. REGULAR_DUE  due, REVIEW or NEW
    3. NEW_NOT_DUE  not due, NEW
    4. FUTURE       not due, anything else

  Inside a tier: next_review ascending, then id ascending.
*/
enum class PriorityTier {
    URGENT_DUE = 1,
    REGULAR_DUE = 2,
    NEW_NOT_DUE = 3,
    FUTURE = 4
};

struct TierBreakdown {
    size_t urgent_due = 0;
    size_t regular_due = 0;
    size_t new_not_due = 0;
    size_t future = 0;

    size_t due() const { return urgent_due + regular_due; }
    size_t total() const { return urgent_due + regular_due + new_not_due + future; }
};

namespace SessionQueue {

    PriorityTier tierFor(const Item& item, std::time_t now);

    std::vector<Item> prioritize(std::vector<Item> items, std::time_t now);

    TierBreakdown breakdown(const std::vector<Item>& items, std::time_t now);

    // Keeps at most `limit` NEW items (the first ones in the given order);
    // other states pass through untouched.
    std::vector<Item> limitNewItems(const std::vector<Item>& items, size_t limit);

}
