// Scheduler: grading through the injected clock and config source.

#include <gtest/gtest.h>

#include "core/Scheduler.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

TEST(SchedulerTest, GradeUsesInjectedClock) {
    ManualClock clock(kT0);
    Scheduler scheduler(clock, LearningConfig::defaults());
    Item it = makeItem("a", CardState::REVIEW, kT0 - kDay, 6, 0, 2.5);

    clock.advanceMinutes(90);
    Item out = scheduler.grade(it, ReviewQuality::GOOD);

    EXPECT_DOUBLE_EQ(out.interval, 15.0);
    EXPECT_EQ(out.next_review, kT0 + 90 * kMinute + 15 * kDay);
    EXPECT_EQ(out.last_review, kT0 + 90 * kMinute);
}

TEST(SchedulerTest, GradeLeavesInputUntouched) {
    ManualClock clock(kT0);
    Scheduler scheduler(clock, LearningConfig::defaults());
    const Item it = makeItem("a", CardState::NEW, kT0);

    Item out = scheduler.grade(it, ReviewQuality::GOOD);

    EXPECT_EQ(it.state, CardState::NEW);
    EXPECT_EQ(it.review_count, 0);
    EXPECT_EQ(out.state, CardState::LEARNING);
    EXPECT_EQ(out.id, it.id);
}

TEST(SchedulerTest, ConfigIsReadAtCallTime) {
    ManualClock clock(kT0);
    LearningConfig live = LearningConfig::defaults();
    Scheduler scheduler(clock, [&live]() { return live; });
    Item it = makeItem("a", CardState::NEW, kT0);

    EXPECT_DOUBLE_EQ(scheduler.grade(it, ReviewQuality::AGAIN).interval, 1.0);

    live.learning_steps = { 3, 15 };
    EXPECT_DOUBLE_EQ(scheduler.grade(it, ReviewQuality::AGAIN).interval, 3.0);
}

TEST(SchedulerTest, InvalidConfigSourceFallsBackToDefaults) {
    ManualClock clock(kT0);
    LearningConfig broken = LearningConfig::defaults();
    broken.learning_steps.clear();
    Scheduler scheduler(clock, [broken]() { return broken; });

    EXPECT_EQ(scheduler.config(), LearningConfig::defaults());

    Item out = scheduler.grade(makeItem("a", CardState::NEW, kT0), ReviewQuality::AGAIN);
    EXPECT_DOUBLE_EQ(out.interval, 1.0);
}

TEST(SchedulerTest, RejectsUnknownGrade) {
    ManualClock clock(kT0);
    Scheduler scheduler(clock, LearningConfig::defaults());
    Item it = makeItem("a", CardState::REVIEW, kT0, 6);

    EXPECT_THROW(scheduler.grade(it, static_cast<ReviewQuality>(0)), InvalidGradeError);
    EXPECT_THROW(scheduler.grade(it, static_cast<ReviewQuality>(5)), InvalidGradeError);
    EXPECT_EQ(it.review_count, 0);
}

TEST(SchedulerTest, ExplicitConfigIsValidatedBeforeGrading) {
    ManualClock clock(kT0);
    Scheduler scheduler(clock, LearningConfig::defaults());
    Item it = makeItem("a", CardState::NEW, kT0);

    LearningConfig noSteps;
    noSteps.learning_steps.clear();
    EXPECT_THROW(scheduler.grade(it, ReviewQuality::AGAIN, noSteps, kT0), InvalidConfigError);

    LearningConfig noRelearn;
    noRelearn.relearning_steps.clear();
    Item review = makeItem("b", CardState::REVIEW, kT0, 5);
    EXPECT_THROW(scheduler.grade(review, ReviewQuality::AGAIN, noRelearn, kT0), InvalidConfigError);

    Item out = scheduler.grade(it, ReviewQuality::GOOD, LearningConfig::defaults(), kT0 + kDay);
    EXPECT_EQ(out.last_review, kT0 + kDay);
}

TEST(SchedulerTest, FullLifecycleThroughAllStates) {
    ManualClock clock(kT0);
    Scheduler scheduler(clock, LearningConfig::defaults());
    Item it = makeItem("a", CardState::NEW, kT0);

    it = scheduler.grade(it, ReviewQuality::GOOD);   // step 1, 10 min
    EXPECT_EQ(it.state, CardState::LEARNING);
    it = scheduler.grade(it, ReviewQuality::GOOD);   // step 2, 30 min
    EXPECT_EQ(it.current_step, 2);
    it = scheduler.grade(it, ReviewQuality::GOOD);   // graduate
    EXPECT_EQ(it.state, CardState::REVIEW);
    EXPECT_DOUBLE_EQ(it.interval, 1.0);

    it = scheduler.grade(it, ReviewQuality::AGAIN);
    EXPECT_EQ(it.state, CardState::RELEARNING);
    EXPECT_EQ(it.lapses, 1);

    it = scheduler.grade(it, ReviewQuality::HARD);
    EXPECT_EQ(it.state, CardState::REVIEW);
    EXPECT_EQ(it.review_count, 5);
}

TEST(QualityTest, ParsesNamesAndDigits) {
    ReviewQuality q;
    ASSERT_TRUE(parseQuality("again", q));
    EXPECT_EQ(q, ReviewQuality::AGAIN);
    ASSERT_TRUE(parseQuality("4", q));
    EXPECT_EQ(q, ReviewQuality::EASY);
    ASSERT_TRUE(parseQuality("  Good\r", q));
    EXPECT_EQ(q, ReviewQuality::GOOD);
    EXPECT_FALSE(parseQuality("medium", q));
    EXPECT_FALSE(parseQuality("0", q));
    EXPECT_FALSE(parseQuality("5", q));
    EXPECT_FALSE(parseQuality("   ", q));
    EXPECT_FALSE(isValidQuality(static_cast<ReviewQuality>(9)));
    EXPECT_STREQ(qualityName(ReviewQuality::HARD), "hard");
}

}  // namespace
