#include "Deck.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <spdlog/spdlog.h>

static std::string trimmed(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    return s;
}

static std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Deck::Deck(ItemStore& s, const Clock& c)
    : store(s), clock(c)
{
}

Item Deck::addCard(const std::string& front, const std::string& back) {
    std::string f = trimmed(front);
    std::string b = trimmed(back);
    if (f.empty() || b.empty())
        throw std::invalid_argument("front and back are required");

    Item it(f, b, clock.now());
    if (!store.save(it))
        throw StorageError("failed to save new item " + it.id);
    return it;
}

Item Deck::editCard(const std::string& id, const std::string& front, const std::string& back) {
    std::string f = trimmed(front);
    std::string b = trimmed(back);
    if (f.empty() || b.empty())
        throw std::invalid_argument("front and back are required");

    Item it;
    if (!store.get(id, it)) throw ItemNotFoundError(id);

    it.front = f;
    it.back = b;
    if (!store.save(it))
        throw StorageError("failed to save item " + id);

    spdlog::info("Item ID={} text updated", id);
    return it;
}

void Deck::deleteCard(const std::string& id) {
    Item it;
    if (!store.get(id, it)) throw ItemNotFoundError(id);
    if (!store.remove(id))
        throw StorageError("failed to delete item " + id);
    spdlog::info("Item ID={} deleted", id);
}

std::vector<Item> Deck::search(const std::string& query) {
    std::string q = lowered(trimmed(query));
    std::vector<Item> items = all();
    if (q.empty()) return items;

    std::vector<Item> out;
    for (auto& it : items) {
        if (lowered(it.front).find(q) != std::string::npos ||
            lowered(it.back).find(q) != std::string::npos)
            out.push_back(std::move(it));
    }
    spdlog::debug("search '{}': {} matches", q, out.size());
    return out;
}

std::vector<Item> Deck::all() {
    std::vector<Item> items;
    if (!store.loadAll(items))
        throw StorageError("failed to load items");
    return items;
}
