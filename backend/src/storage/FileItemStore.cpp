#include "FileItemStore.hpp"
#include "Storage.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

FileItemStore::FileItemStore(const std::string& file)
    : filename(file)
{
    spdlog::info("FileItemStore initialized with data file '{}'", filename);
}

bool FileItemStore::open(const std::string& passphrase) {
    std::vector<unsigned char> salt;
    bool exists = false;
    if (!Storage::readSalt(filename, salt, exists)) return false;
    if (!exists) {
        spdlog::info("No data file at '{}'; a new one will be created", filename);
        salt = Vault::newSalt();
    }

    if (!vault.unlock(passphrase, salt)) return false;

    if (!Storage::loadItems(items, config, filename, vault)) {
        vault.lock();
        return false;
    }
    return true;
}

void FileItemStore::close() {
    vault.lock();
    items.clear();
    config = LearningConfig::defaults();
}

bool FileItemStore::persist() {
    if (!vault.isUnlocked()) {
        spdlog::error("FileItemStore '{}' is not open", filename);
        return false;
    }
    return Storage::saveItems(items, config, filename, vault);
}

bool FileItemStore::loadAll(std::vector<Item>& out) {
    if (!vault.isUnlocked()) {
        spdlog::error("FileItemStore '{}' is not open", filename);
        return false;
    }
    out = items;
    return true;
}

bool FileItemStore::get(const std::string& id, Item& out) {
    auto it = std::find_if(items.begin(), items.end(),
        [&id](const Item& i) { return i.id == id; });
    if (it == items.end()) return false;
    out = *it;
    return true;
}

bool FileItemStore::save(const Item& item) {
    if (item.id.empty()) {
        spdlog::error("Refusing to save item without id");
        return false;
    }

    auto it = std::find_if(items.begin(), items.end(),
        [&item](const Item& i) { return i.id == item.id; });

    if (it != items.end()) {
        Item previous = *it;
        *it = item;
        if (!persist()) {
            *it = previous;
            return false;
        }
        return true;
    }

    items.push_back(item);
    if (!persist()) {
        items.pop_back();
        return false;
    }
    return true;
}

bool FileItemStore::remove(const std::string& id) {
    auto it = std::find_if(items.begin(), items.end(),
        [&id](const Item& i) { return i.id == id; });
    if (it == items.end()) return false;

    size_t index = static_cast<size_t>(it - items.begin());
    Item removed = *it;
    items.erase(it);
    if (!persist()) {
        items.insert(items.begin() + static_cast<std::ptrdiff_t>(index), removed);
        return false;
    }
    return true;
}

bool FileItemStore::loadConfig(LearningConfig& out) {
    out = config;
    return true;
}

bool FileItemStore::saveConfig(const LearningConfig& cfg) {
    if (!cfg.isValid()) {
        spdlog::error("Refusing to save invalid learning config");
        return false;
    }
    LearningConfig previous = config;
    config = cfg;
    if (!persist()) {
        config = previous;
        return false;
    }
    return true;
}
