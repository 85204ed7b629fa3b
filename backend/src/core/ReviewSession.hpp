#pragma once
#include <ctime>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "Item.hpp"
#include "Clock.hpp"
#include "Scheduler.hpp"
#include "SessionQueue.hpp"
#include "TaskTimer.hpp"
#include "../storage/ItemStore.hpp"

enum class SessionMode {
    DUE_ONLY,
    ALL
};

struct SessionOptions {
    std::time_t poll_period_seconds = 30;
    // Cap NEW items at LearningConfig::new_cards_per_day
    bool limit_new_cards = false;
};

/*
  One review session over the store.

  The queue is re-ordered after every answer from fresh store state, and a
  poll registered on the TaskTimer splices in items that became due while
  the session runs (e.g. a relearning step elapsing). The poll is armed only
  while the queue is non-empty and is cancelled by end(), by exhausting the
  queue, by a restart, and by destruction.

  Not reentrant: answer() and the poll must be called from one thread.
*/
class ReviewSession {
public:
    ReviewSession(ItemStore& store, const Scheduler& scheduler, const Clock& clock,
        TaskTimer& timer, SessionOptions options = SessionOptions());
    ~ReviewSession();

    ReviewSession(const ReviewSession&) = delete;
    ReviewSession& operator=(const ReviewSession&) = delete;

    // Throws StorageError if the item set cannot be loaded. Any running
    // session on this object is ended first.
    void start(SessionMode mode);

    // nullptr once the queue is exhausted
    const Item* current() const;

    // Grades, persists and re-orders. Returns false if there is no current
    // item. Throws InvalidGradeError (nothing changes) or StorageError (the
    // queue is left as it was).
    bool answer(ReviewQuality quality);

    // Splices due items not already queued in right after the current
    // position. Store failures are logged, never thrown. Returns how many
    // items were added.
    size_t checkForNewlyDue();

    void end();

    bool isActive() const { return active; }
    bool isPolling() const { return poll_task != TaskTimer::kNoTask; }
    SessionMode mode() const { return session_mode; }
    size_t position() const { return pos; }
    size_t remaining() const { return queue.size(); }
    size_t answeredCount() const { return answered; }
    const std::vector<Item>& items() const { return queue; }

private:
    void armPolling();
    void stopPolling();
    bool containsId(const std::string& id) const;
    std::vector<Item> applyNewLimit(const std::vector<Item>& candidates);

    ItemStore& store;
    const Scheduler& scheduler;
    const Clock& clock;
    TaskTimer& timer;
    SessionOptions options;

    SessionMode session_mode = SessionMode::DUE_ONLY;
    std::vector<Item> queue;
    size_t pos = 0;
    size_t answered = 0;
    size_t new_introduced = 0;
    bool active = false;
    TaskTimer::TaskId poll_task = TaskTimer::kNoTask;
};
