#include "IntervalCalculator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>

bool isValidQuality(ReviewQuality q) {
    switch (q) {
    case ReviewQuality::AGAIN:
    case ReviewQuality::HARD:
    case ReviewQuality::GOOD:
    case ReviewQuality::EASY:
        return true;
    }
    return false;
}

const char* qualityName(ReviewQuality q) {
    switch (q) {
    case ReviewQuality::AGAIN: return "again";
    case ReviewQuality::HARD: return "hard";
    case ReviewQuality::GOOD: return "good";
    case ReviewQuality::EASY: return "easy";
    }
    return "invalid";
}

bool parseQuality(const std::string& input, ReviewQuality& out) {
    size_t b = input.find_first_not_of(" \t\r");
    size_t e = input.find_last_not_of(" \t\r");
    std::string name = b == std::string::npos ? std::string() : input.substr(b, e - b + 1);
    std::transform(name.begin(), name.end(), name.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "again" || name == "1") out = ReviewQuality::AGAIN;
    else if (name == "hard" || name == "2") out = ReviewQuality::HARD;
    else if (name == "good" || name == "3") out = ReviewQuality::GOOD;
    else if (name == "easy" || name == "4") out = ReviewQuality::EASY;
    else return false;
    return true;
}

namespace IntervalCalculator {

// Clamped before the cast so the conversion and the multiply stay in range
static std::time_t offsetSeconds(double units, double maxUnits, std::time_t unitSeconds) {
    if (!(units > 0.0)) return 0;
    double whole = std::trunc(std::min(units, maxUnits));
    return static_cast<std::time_t>(whole) * unitSeconds;
}

std::time_t addMinutes(std::time_t t, double minutes) {
    return t + offsetSeconds(minutes, kMaxIntervalDays * 24 * 60, 60);
}

std::time_t addDays(std::time_t t, double days) {
    return t + offsetSeconds(days, kMaxIntervalDays, 24 * 60 * 60);
}

Sm2Result sm2Review(double interval, double ease, ReviewQuality q) {
    Sm2Result r{ interval, ease };

    switch (q) {
    case ReviewQuality::HARD:
        r.interval = std::max(1.0, interval * kHardMultiplier);
        r.ease = std::max(kEaseFloor, ease - kHardEasePenalty);
        break;
    case ReviewQuality::GOOD:
        r.interval = interval * ease;
        break;
    case ReviewQuality::EASY:
        r.interval = interval * ease * kEasyMultiplier;
        r.ease = ease + kEaseBonus;
        break;
    default:
        break;
    }

    r.interval = std::min(kMaxIntervalDays, std::max(1.0, r.interval));
    return r;
}

/* -------------------------
   Learning phase
   -------------------------
   NEW and LEARNING share the learning_steps ladder. GOOD past the last step
   or EASY from anywhere graduates into REVIEW with a day interval.
*/
static void applyLearning(Item& out, ReviewQuality q, const LearningConfig& cfg, std::time_t now) {
    const auto& steps = cfg.learning_steps;
    const int last = static_cast<int>(steps.size()) - 1;

    switch (q) {
    case ReviewQuality::AGAIN:
        out.current_step = 0;
        out.state = CardState::LEARNING;
        out.interval = steps[0];
        out.next_review = addMinutes(now, out.interval);
        break;

    case ReviewQuality::HARD: {
        // Repeat the current step; an index past the ladder repeats the last one
        int step = std::max(0, out.current_step);
        out.state = CardState::LEARNING;
        out.interval = steps[std::min(step, last)];
        out.next_review = addMinutes(now, out.interval);
        break;
    }

    case ReviewQuality::GOOD: {
        int next = out.current_step + 1;
        if (next > last) {
            out.state = CardState::REVIEW;
            out.current_step = 0;
            out.interval = cfg.graduating_interval;
            out.next_review = addDays(now, out.interval);
        }
        else {
            out.state = CardState::LEARNING;
            out.current_step = next;
            out.interval = steps[next];
            out.next_review = addMinutes(now, out.interval);
        }
        break;
    }

    case ReviewQuality::EASY:
        out.state = CardState::REVIEW;
        out.current_step = 0;
        out.interval = cfg.easy_interval;
        out.next_review = addDays(now, out.interval);
        out.ease = std::min(out.ease + kEaseBonus, kEaseLearningCap);
        break;
    }
}

/* -------------------------
   Review phase
   -------------------------
   AGAIN is a lapse. Anything else returns the item to REVIEW via SM-2,
   including out of RELEARNING, where the step magnitude is the SM-2 base.
*/
static void applyReview(Item& out, ReviewQuality q, const LearningConfig& cfg, std::time_t now) {
    if (q == ReviewQuality::AGAIN) {
        out.state = CardState::RELEARNING;
        out.current_step = 0;
        out.lapses += 1;
        out.interval = cfg.relearning_steps[0];
        out.next_review = addMinutes(now, out.interval);
        out.ease = std::max(kEaseFloor, out.ease - kLapseEasePenalty);
        return;
    }

    Sm2Result r = sm2Review(out.interval, out.ease, q);
    out.state = CardState::REVIEW;
    out.current_step = 0;
    out.interval = r.interval;
    out.ease = r.ease;
    out.next_review = addDays(now, r.interval);
}

Item computeNext(const Item& item, ReviewQuality q, const LearningConfig& cfg, std::time_t now) {
    Item out = item;

    if (item.state == CardState::NEW || item.state == CardState::LEARNING) {
        applyLearning(out, q, cfg, now);
    }
    else {
        applyReview(out, q, cfg, now);
    }

    out.review_count += 1;
    out.last_review = now;

    spdlog::debug("computeNext: id={} {} -> {} step={} interval={:.3f} ease={:.2f} lapses={}",
        item.id, cardStateName(item.state), cardStateName(out.state),
        out.current_step, out.interval, out.ease, out.lapses);

    return out;
}

}
