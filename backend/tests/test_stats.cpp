// Stats projection over the collection.

#include <gtest/gtest.h>

#include "core/Stats.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

// Local noon keeps +/- a few hours on the same calendar day
std::time_t localNoon() {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 5;
    tm.tm_mday = 15;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

TEST(StatsTest, EmptyCollection) {
    StudyStats s = computeStats(std::vector<Item>{}, kT0);

    EXPECT_EQ(s.total_cards, 0u);
    EXPECT_EQ(s.due_today, 0u);
    EXPECT_EQ(s.reviewed_today, 0u);
    EXPECT_EQ(s.mastery_percentage, 0);
    EXPECT_EQ(s.current_streak, 0);
}

TEST(StatsTest, DueCountIncludesExactlyNow) {
    std::vector<Item> items = {
        makeItem("a", CardState::REVIEW, kT0, 3),
        makeItem("b", CardState::NEW, kT0 - 1),
        makeItem("c", CardState::LEARNING, kT0 + 1, 1),
    };

    EXPECT_EQ(computeStats(items, kT0).due_today, 2u);
}

TEST(StatsTest, MasteryIsRoundedShareOfReviewItems) {
    std::vector<Item> items = {
        makeItem("a", CardState::REVIEW, kT0 + kDay, 3),
        makeItem("b", CardState::NEW, kT0),
        makeItem("c", CardState::RELEARNING, kT0, 10),
    };
    StudyStats s = computeStats(items, kT0);
    EXPECT_EQ(s.mastery_percentage, 33);
    EXPECT_EQ(s.review_cards, 1u);
    EXPECT_EQ(s.relearning_cards, 1u);

    items[1].state = CardState::REVIEW;
    EXPECT_EQ(computeStats(items, kT0).mastery_percentage, 67);
}

TEST(StatsTest, ReviewedTodayUsesLastReviewTime) {
    const std::time_t now = localNoon();

    Item fresh = makeItem("fresh", CardState::NEW, now);

    Item today = makeItem("today", CardState::REVIEW, now + 3 * kDay, 3);
    today.review_count = 2;
    today.last_review = now - 2 * 60 * kMinute;

    Item yesterday = makeItem("yesterday", CardState::LEARNING, now, 10);
    yesterday.review_count = 1;
    yesterday.last_review = now - kDay;

    StudyStats s = computeStats(std::vector<Item>{ fresh, today, yesterday }, now);

    EXPECT_EQ(s.reviewed_today, 1u);
    EXPECT_EQ(s.due_today, 2u);
}

TEST(StatsTest, StoreOverloadSurfacesLoadFailure) {
    class BrokenStore : public MemoryItemStore {
    public:
        bool loadAll(std::vector<Item>&) override { return false; }
    } broken;

    EXPECT_THROW(computeStats(broken, kT0), StorageError);

    MemoryItemStore store;
    ASSERT_TRUE(store.save(makeItem("a", CardState::REVIEW, kT0, 3)));
    EXPECT_EQ(computeStats(store, kT0).total_cards, 1u);
}

}  // namespace
