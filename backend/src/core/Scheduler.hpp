#pragma once
#include <functional>
#include <ctime>
#include <spdlog/spdlog.h>
#include "Item.hpp"
#include "Clock.hpp"
#include "LearningConfig.hpp"
#include "IntervalCalculator.hpp"

/*
  Item state machine:

      NEW --(any)--> LEARNING --(GOOD at last step | EASY)--> REVIEW
      NEW --(GOOD at last step | EASY)--> REVIEW
      REVIEW --(AGAIN)--> RELEARNING --(HARD | GOOD | EASY)--> REVIEW
      RELEARNING --(AGAIN)--> RELEARNING

  NEW is never re-entered. The scheduler keeps no per-item state: the
  configuration is fetched from the injected source on every call.
*/
class Scheduler {
public:
    using ConfigSource = std::function<LearningConfig()>;

    Scheduler(const Clock& clock, ConfigSource configSource);
    Scheduler(const Clock& clock, const LearningConfig& fixedConfig);

    // Returns the graded copy; the caller persists it.
    // Throws InvalidGradeError for a quality outside AGAIN..EASY.
    Item grade(const Item& item, ReviewQuality quality) const;

    // Explicit config and time. Also throws InvalidConfigError if `config`
    // fails validation.
    Item grade(const Item& item, ReviewQuality quality,
        const LearningConfig& config, std::time_t now) const;

    // Current config, already validated (defaults if the source is invalid)
    LearningConfig config() const;

private:
    const Clock& clock;
    ConfigSource configSource;
};
