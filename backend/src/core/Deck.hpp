#pragma once
#include <string>
#include <vector>
#include "Item.hpp"
#include "Clock.hpp"
#include "../storage/ItemStore.hpp"

// Card management on top of the store. Scheduling fields are never touched
// here; they only change through Scheduler::grade.
class Deck {
public:
    Deck(ItemStore& store, const Clock& clock);

    // Throws std::invalid_argument for empty front or back, StorageError if
    // the save fails.
    Item addCard(const std::string& front, const std::string& back);

    // Throws ItemNotFoundError, std::invalid_argument or StorageError.
    Item editCard(const std::string& id, const std::string& front, const std::string& back);

    // Throws ItemNotFoundError when the id is unknown.
    void deleteCard(const std::string& id);

    // Case-insensitive substring match on front or back. Throws StorageError.
    std::vector<Item> search(const std::string& query);

    // Throws StorageError.
    std::vector<Item> all();

private:
    ItemStore& store;
    const Clock& clock;
};
