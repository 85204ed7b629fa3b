#include "Item.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

Item::Item(const std::string& f, const std::string& b, std::time_t now)
    : front(f), back(b)
{
    id = generateID();
    created_at = now;
    next_review = now; // New cards are immediately available
    spdlog::info("Created Item: ID={}, Front={}", id, front);
}

IntervalUnit intervalUnitFor(CardState state) {
    switch (state) {
    case CardState::LEARNING:
    case CardState::RELEARNING:
        return IntervalUnit::MINUTES;
    case CardState::REVIEW:
        return IntervalUnit::DAYS;
    default:
        return IntervalUnit::NONE;
    }
}

const char* cardStateName(CardState state) {
    switch (state) {
    case CardState::NEW: return "new";
    case CardState::LEARNING: return "learning";
    case CardState::REVIEW: return "review";
    case CardState::RELEARNING: return "relearning";
    }
    return "unknown";
}

bool parseCardState(const std::string& name, CardState& out) {
    if (name == "new") out = CardState::NEW;
    else if (name == "learning") out = CardState::LEARNING;
    else if (name == "review") out = CardState::REVIEW;
    else if (name == "relearning") out = CardState::RELEARNING;
    else return false;
    return true;
}

// Simple unique ID generator (timestamp + random bits)
std::string Item::generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    std::random_device rd;
    std::mt19937_64 eng(rd());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}
