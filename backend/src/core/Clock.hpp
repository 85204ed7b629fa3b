#pragma once
#include <ctime>

// Source of "now" for scheduling. Everything above this works in whole
// seconds since epoch so tests can pin time.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::time_t now() const = 0;
};

class SystemClock : public Clock {
public:
    std::time_t now() const override { return std::time(nullptr); }
};

class ManualClock : public Clock {
public:
    explicit ManualClock(std::time_t start = 0) : current(start) {}

    std::time_t now() const override { return current; }

    void set(std::time_t t) { current = t; }
    void advanceSeconds(std::time_t s) { current += s; }
    void advanceMinutes(int m) { current += static_cast<std::time_t>(m) * 60; }
    void advanceDays(int d) { current += static_cast<std::time_t>(d) * 24 * 60 * 60; }

private:
    std::time_t current;
};
