#pragma once
#include <ctime>
#include <vector>
#include "Item.hpp"
#include "../storage/ItemStore.hpp"

struct StudyStats {
    size_t total_cards = 0;
    size_t due_today = 0;
    size_t reviewed_today = 0;
    int mastery_percentage = 0;
    int current_streak = 0;      // Not tracked yet, always 0

    // Per-state counts for the dashboard
    size_t new_cards = 0;
    size_t learning_cards = 0;
    size_t review_cards = 0;
    size_t relearning_cards = 0;
};

// Read-only projection over the whole collection at `now`.
StudyStats computeStats(const std::vector<Item>& items, std::time_t now);
// Throws StorageError if the collection cannot be loaded.
StudyStats computeStats(ItemStore& store, std::time_t now);

// Same local calendar day
bool sameLocalDay(std::time_t a, std::time_t b);
