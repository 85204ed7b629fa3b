#pragma once
#include <ctime>
#include <string>
#include "Item.hpp"
#include "LearningConfig.hpp"

enum class ReviewQuality {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

bool isValidQuality(ReviewQuality q);
const char* qualityName(ReviewQuality q);
// Grade name or digit 1-4, case-insensitive, surrounding blanks ignored
bool parseQuality(const std::string& input, ReviewQuality& out);

/*
  Pure scheduling arithmetic. Nothing here touches storage, clocks or logs
  beyond debug traces; `now` is always passed in.

  Learning phase (NEW / LEARNING) walks the learning_steps ladder in minutes.
  Review phase (REVIEW / RELEARNING) uses SM-2 in days; AGAIN drops into
  RELEARNING on relearning_steps[0] minutes.
*/
namespace IntervalCalculator {

    constexpr double kEaseFloor = 1.3;
    constexpr double kEaseLearningCap = 5.0;
    constexpr double kEaseBonus = 0.15;
    constexpr double kHardEasePenalty = 0.15;
    constexpr double kLapseEasePenalty = 0.2;
    constexpr double kHardMultiplier = 1.2;
    constexpr double kEasyMultiplier = 1.3;
    constexpr double kMaxIntervalDays = 36500.0;   // About a century

    struct Sm2Result {
        double interval; // Days
        double ease;
    };

    // AGAIN is handled by the relearning branch and passes through unchanged.
    Sm2Result sm2Review(double interval_days, double ease, ReviewQuality q);

    // Returns a copy of `item` after one grading event at `now`. Requires a
    // valid quality and a config that passes LearningConfig::validate().
    Item computeNext(const Item& item, ReviewQuality q, const LearningConfig& cfg, std::time_t now);

    // Offsets saturate at kMaxIntervalDays so the result never wraps.
    std::time_t addMinutes(std::time_t t, double minutes);
    // Whole days only; the fraction of `days` is dropped.
    std::time_t addDays(std::time_t t, double days);

}
