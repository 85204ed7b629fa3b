#include "Scheduler.hpp"
#include "errors.hpp"
#include <string>

Scheduler::Scheduler(const Clock& c, ConfigSource source)
    : clock(c), configSource(std::move(source))
{
    spdlog::info("Scheduler (learning steps + SM-2) initialized.");
}

Scheduler::Scheduler(const Clock& c, const LearningConfig& fixedConfig)
    : Scheduler(c, [fixedConfig]() { return fixedConfig; })
{
}

LearningConfig Scheduler::config() const {
    LearningConfig cfg = configSource ? configSource() : LearningConfig::defaults();
    if (!cfg.isValid()) {
        spdlog::warn("Scheduler: invalid learning config supplied; using defaults");
        return LearningConfig::defaults();
    }
    return cfg;
}

Item Scheduler::grade(const Item& item, ReviewQuality q) const {
    return grade(item, q, config(), clock.now());
}

Item Scheduler::grade(const Item& item, ReviewQuality q,
    const LearningConfig& cfg, std::time_t now) const
{
    if (!isValidQuality(q)) {
        spdlog::error("Rejecting grade {} for item {}", static_cast<int>(q), item.id);
        throw InvalidGradeError("invalid review quality: " + std::to_string(static_cast<int>(q)));
    }

    try {
        cfg.validate();
    }
    catch (const InvalidConfigError& e) {
        spdlog::error("Rejecting grade for item {}: {}", item.id, e.what());
        throw;
    }

    spdlog::info("Review Item {} | state={} q={}", item.id, cardStateName(item.state), qualityName(q));

    Item updated = IntervalCalculator::computeNext(item, q, cfg, now);

    if (updated.lapses > item.lapses) {
        spdlog::warn("Item '{}' lapsed. lapses={}, ease={:.2f}", item.id, updated.lapses, updated.ease);
    }
    else if (item.state != CardState::REVIEW && updated.state == CardState::REVIEW) {
        spdlog::info("Item '{}' graduated to review: interval={} days", item.id, updated.interval);
    }

    return updated;
}
