#include "Stats.hpp"
#include "errors.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

bool sameLocalDay(std::time_t a, std::time_t b) {
    std::tm ta{};
    std::tm tb{};
    localtime_r(&a, &ta);
    localtime_r(&b, &tb);
    return ta.tm_year == tb.tm_year && ta.tm_yday == tb.tm_yday;
}

StudyStats computeStats(const std::vector<Item>& items, std::time_t now) {
    StudyStats s;
    s.total_cards = items.size();

    for (const auto& it : items) {
        if (it.isDue(now)) s.due_today++;
        // last_review is the real grading time, not the next due date
        if (it.review_count > 0 && it.last_review != 0 && sameLocalDay(it.last_review, now))
            s.reviewed_today++;

        switch (it.state) {
        case CardState::NEW: s.new_cards++; break;
        case CardState::LEARNING: s.learning_cards++; break;
        case CardState::REVIEW: s.review_cards++; break;
        case CardState::RELEARNING: s.relearning_cards++; break;
        }
    }

    if (s.total_cards > 0) {
        double pct = 100.0 * static_cast<double>(s.review_cards) / static_cast<double>(s.total_cards);
        s.mastery_percentage = static_cast<int>(std::lround(pct));
    }

    spdlog::debug("Stats: total={} due={} reviewedToday={} mastery={}%",
        s.total_cards, s.due_today, s.reviewed_today, s.mastery_percentage);
    return s;
}

StudyStats computeStats(ItemStore& store, std::time_t now) {
    std::vector<Item> items;
    if (!store.loadAll(items)) {
        spdlog::error("Failed to load items for stats");
        throw StorageError("failed to load items for stats");
    }
    return computeStats(items, now);
}
