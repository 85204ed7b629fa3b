#include "ReviewSession.hpp"
#include "errors.hpp"
#include <algorithm>

static const char* modeName(SessionMode m) {
    return m == SessionMode::ALL ? "all" : "due";
}

ReviewSession::ReviewSession(ItemStore& s, const Scheduler& sch, const Clock& c,
    TaskTimer& t, SessionOptions opts)
    : store(s), scheduler(sch), clock(c), timer(t), options(opts)
{
}

ReviewSession::~ReviewSession() {
    end();
}

void ReviewSession::start(SessionMode m) {
    if (active) end();

    std::time_t now = clock.now();
    std::vector<Item> loaded;
    bool ok = m == SessionMode::DUE_ONLY ? store.loadDue(now, loaded) : store.loadAll(loaded);
    if (!ok) {
        spdlog::error("Failed to load items for {} session", modeName(m));
        throw StorageError("failed to load items for review session");
    }

    session_mode = m;
    new_introduced = 0;
    answered = 0;
    queue = applyNewLimit(SessionQueue::prioritize(std::move(loaded), now));
    pos = 0;
    active = true;

    TierBreakdown b = SessionQueue::breakdown(queue, now);
    spdlog::info("Started {} session: {} items (due={} new={} future={})",
        modeName(m), queue.size(), b.due(), b.new_not_due, b.future);

    if (!queue.empty()) armPolling();
}

const Item* ReviewSession::current() const {
    if (!active || pos >= queue.size()) return nullptr;
    return &queue[pos];
}

bool ReviewSession::answer(ReviewQuality q) {
    if (!active || pos >= queue.size()) {
        spdlog::debug("answer() called with no current item");
        return false;
    }

    Item graded = scheduler.grade(queue[pos], q);
    if (!store.save(graded)) {
        spdlog::error("Failed to persist graded item {}", graded.id);
        throw StorageError("failed to save item " + graded.id);
    }
    ++answered;

    const size_t previous = pos;
    queue.erase(queue.begin() + static_cast<std::ptrdiff_t>(previous));

    // Re-read what is left so within-session state changes are picked up
    std::vector<Item> fresh;
    fresh.reserve(queue.size());
    for (const auto& it : queue) {
        Item current_state;
        if (store.get(it.id, current_state)) {
            fresh.push_back(std::move(current_state));
        }
        else {
            spdlog::warn("Item {} disappeared from the store; dropping it from the session", it.id);
        }
    }

    queue = SessionQueue::prioritize(std::move(fresh), clock.now());
    pos = previous < queue.size() ? previous : 0;

    spdlog::debug("Reprioritization after review: remaining={} position={}", queue.size(), pos);

    if (queue.empty()) {
        spdlog::info("Session complete: {} answers", answered);
        stopPolling();
    }
    return true;
}

size_t ReviewSession::checkForNewlyDue() {
    if (!active) return 0;

    std::time_t now = clock.now();
    std::vector<Item> due;
    try {
        if (!store.loadDue(now, due)) {
            spdlog::warn("Failed to check for newly due items; will retry on next poll");
            return 0;
        }
    }
    catch (const StorageError& e) {
        spdlog::warn("Failed to check for newly due items: {}", e.what());
        return 0;
    }

    std::vector<Item> added;
    for (auto& it : due) {
        if (!containsId(it.id)) added.push_back(std::move(it));
    }
    if (added.empty()) return 0;

    added = applyNewLimit(SessionQueue::prioritize(std::move(added), now));
    if (added.empty()) return 0;

    size_t at = queue.empty() ? 0 : pos + 1;
    queue.insert(queue.begin() + static_cast<std::ptrdiff_t>(at), added.begin(), added.end());

    spdlog::info("Found {} newly due items during session; queue now {}", added.size(), queue.size());
    return added.size();
}

void ReviewSession::end() {
    stopPolling();
    if (!active) return;

    spdlog::info("Ended {} session: answered={} left={}", modeName(session_mode), answered, queue.size());
    active = false;
    queue.clear();
    pos = 0;
}

void ReviewSession::armPolling() {
    stopPolling();
    poll_task = timer.schedule(clock.now(), options.poll_period_seconds,
        [this](std::time_t) { checkForNewlyDue(); });
}

void ReviewSession::stopPolling() {
    if (poll_task == TaskTimer::kNoTask) return;
    timer.cancel(poll_task);
    poll_task = TaskTimer::kNoTask;
}

bool ReviewSession::containsId(const std::string& id) const {
    return std::any_of(queue.begin(), queue.end(),
        [&id](const Item& it) { return it.id == id; });
}

std::vector<Item> ReviewSession::applyNewLimit(const std::vector<Item>& candidates) {
    size_t newCount = static_cast<size_t>(std::count_if(candidates.begin(), candidates.end(),
        [](const Item& it) { return it.state == CardState::NEW; }));

    if (!options.limit_new_cards) {
        new_introduced += newCount;
        return candidates;
    }

    size_t cap = static_cast<size_t>(std::max(0, scheduler.config().new_cards_per_day));
    size_t allowance = cap > new_introduced ? cap - new_introduced : 0;
    std::vector<Item> out = SessionQueue::limitNewItems(candidates, allowance);
    new_introduced += std::min(newCount, allowance);
    if (newCount > allowance) {
        spdlog::debug("New card limit {} reached; held back {} new items", cap, newCount - allowance);
    }
    return out;
}
