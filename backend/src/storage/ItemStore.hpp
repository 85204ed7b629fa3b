#pragma once
#include <ctime>
#include <map>
#include <string>
#include <vector>
#include "../core/Item.hpp"
#include "../core/LearningConfig.hpp"

// Record store the engine reads and writes items through. Every method
// reports failure with `false` and logs why; callers that must surface the
// failure turn it into StorageError.
class ItemStore {
public:
    virtual ~ItemStore() = default;

    virtual bool loadAll(std::vector<Item>& out) = 0;
    virtual bool loadDue(std::time_t now, std::vector<Item>& out);
    // false when no item has this id
    virtual bool get(const std::string& id, Item& out) = 0;
    virtual bool save(const Item& item) = 0;
    virtual bool remove(const std::string& id) = 0;

    virtual bool loadConfig(LearningConfig& out) = 0;
    virtual bool saveConfig(const LearningConfig& cfg) = 0;
};

class MemoryItemStore : public ItemStore {
public:
    MemoryItemStore() = default;
    explicit MemoryItemStore(const std::vector<Item>& initial);

    bool loadAll(std::vector<Item>& out) override;
    bool get(const std::string& id, Item& out) override;
    bool save(const Item& item) override;
    bool remove(const std::string& id) override;

    bool loadConfig(LearningConfig& out) override;
    bool saveConfig(const LearningConfig& cfg) override;

    size_t size() const { return items.size(); }
    void clear() { items.clear(); }

private:
    std::map<std::string, Item> items;
    LearningConfig config;
};
