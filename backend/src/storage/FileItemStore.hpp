#pragma once
#include <string>
#include <vector>
#include "ItemStore.hpp"
#include "Vault.hpp"

// ItemStore backed by the encrypted data file. The whole collection is kept
// in memory; every mutation rewrites the file and is rolled back in memory
// if the write fails.
class FileItemStore : public ItemStore {
public:
    explicit FileItemStore(const std::string& filename);

    // Derives the key (new salt for a new file) and loads the file.
    // false on wrong passphrase, corrupt file or key derivation failure.
    bool open(const std::string& passphrase);
    void close();
    bool isOpen() const { return vault.isUnlocked(); }

    bool loadAll(std::vector<Item>& out) override;
    bool get(const std::string& id, Item& out) override;
    bool save(const Item& item) override;
    bool remove(const std::string& id) override;

    bool loadConfig(LearningConfig& out) override;
    bool saveConfig(const LearningConfig& cfg) override;

    const std::string& path() const { return filename; }

private:
    bool persist();

    std::string filename;
    Vault vault;
    std::vector<Item> items; // file order
    LearningConfig config;
};
