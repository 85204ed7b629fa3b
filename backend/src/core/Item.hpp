#pragma once
#include <string>
#include <ctime>
#include <chrono>
#include <spdlog/spdlog.h>

enum class CardState {
    NEW = 0,
    LEARNING = 1,
    REVIEW = 2,
    RELEARNING = 3
};

// Unit of Item::interval. It is never stored on its own: the state decides it.
enum class IntervalUnit {
    NONE,
    MINUTES,
    DAYS
};

IntervalUnit intervalUnitFor(CardState state);
const char* cardStateName(CardState state);
bool parseCardState(const std::string& name, CardState& out);

class Item {
public:
    Item() = default;
    Item(const std::string& front, const std::string& back, std::time_t now);

    // Basic fields
    std::string id;          // Auto-generated, immutable
    std::string front;
    std::string back;

    // Scheduler state
    CardState state = CardState::NEW;
    int current_step = 0;         // Index into learning or relearning steps
    double interval = 0.0;        // Minutes while LEARNING/RELEARNING, days while REVIEW
    double ease = 2.5;
    int lapses = 0;
    int review_count = 0;
    std::time_t next_review = 0;  // Seconds since epoch
    std::time_t created_at = 0;
    std::time_t last_review = 0;  // 0 until first graded

    bool isDue(std::time_t now) const { return next_review <= now; }
    bool isStepped() const {
        return state == CardState::LEARNING || state == CardState::RELEARNING;
    }
    IntervalUnit intervalUnit() const { return intervalUnitFor(state); }

    // Utility
    static std::string generateID();
};
