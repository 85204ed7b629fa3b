#include "SessionQueue.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace SessionQueue {

PriorityTier tierFor(const Item& item, std::time_t now) {
    if (item.isDue(now)) {
        return item.isStepped() ? PriorityTier::URGENT_DUE : PriorityTier::REGULAR_DUE;
    }
    return item.state == CardState::NEW ? PriorityTier::NEW_NOT_DUE : PriorityTier::FUTURE;
}

std::vector<Item> prioritize(std::vector<Item> items, std::time_t now) {
    std::stable_sort(items.begin(), items.end(),
        [now](const Item& a, const Item& b) {
            PriorityTier ta = tierFor(a, now);
            PriorityTier tb = tierFor(b, now);
            if (ta != tb) return ta < tb;
            if (a.next_review != b.next_review) return a.next_review < b.next_review;
            return a.id < b.id;
        });

    if (spdlog::should_log(spdlog::level::debug)) {
        TierBreakdown b = breakdown(items, now);
        spdlog::debug("Card prioritization: urgentDue={} regularDue={} new={} future={} total={}",
            b.urgent_due, b.regular_due, b.new_not_due, b.future, b.total());
    }
    return items;
}

TierBreakdown breakdown(const std::vector<Item>& items, std::time_t now) {
    TierBreakdown b;
    for (const auto& it : items) {
        switch (tierFor(it, now)) {
        case PriorityTier::URGENT_DUE: b.urgent_due++; break;
        case PriorityTier::REGULAR_DUE: b.regular_due++; break;
        case PriorityTier::NEW_NOT_DUE: b.new_not_due++; break;
        case PriorityTier::FUTURE: b.future++; break;
        }
    }
    return b;
}

std::vector<Item> limitNewItems(const std::vector<Item>& items, size_t limit) {
    std::vector<Item> out;
    out.reserve(items.size());
    size_t taken = 0;
    for (const auto& it : items) {
        if (it.state == CardState::NEW) {
            if (taken >= limit) continue;
            ++taken;
        }
        out.push_back(it);
    }
    return out;
}

}
