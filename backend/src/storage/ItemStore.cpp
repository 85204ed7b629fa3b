#include "ItemStore.hpp"
#include <spdlog/spdlog.h>

bool ItemStore::loadDue(std::time_t now, std::vector<Item>& out) {
    std::vector<Item> all;
    if (!loadAll(all)) return false;

    out.clear();
    for (auto& it : all) {
        if (it.isDue(now)) out.push_back(std::move(it));
    }
    spdlog::debug("loadDue: {} of {} items due", out.size(), all.size());
    return true;
}

MemoryItemStore::MemoryItemStore(const std::vector<Item>& initial) {
    for (const auto& it : initial) items[it.id] = it;
}

bool MemoryItemStore::loadAll(std::vector<Item>& out) {
    out.clear();
    out.reserve(items.size());
    for (const auto& p : items) out.push_back(p.second);
    return true;
}

bool MemoryItemStore::get(const std::string& id, Item& out) {
    auto it = items.find(id);
    if (it == items.end()) return false;
    out = it->second;
    return true;
}

bool MemoryItemStore::save(const Item& item) {
    if (item.id.empty()) {
        spdlog::error("Refusing to save item without id");
        return false;
    }
    items[item.id] = item;
    return true;
}

bool MemoryItemStore::remove(const std::string& id) {
    return items.erase(id) > 0;
}

bool MemoryItemStore::loadConfig(LearningConfig& out) {
    out = config;
    return true;
}

bool MemoryItemStore::saveConfig(const LearningConfig& cfg) {
    if (!cfg.isValid()) {
        spdlog::error("Refusing to save invalid learning config");
        return false;
    }
    config = cfg;
    return true;
}
