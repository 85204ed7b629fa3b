#pragma once
#include <vector>
#include <string>
#include "../core/Item.hpp"
#include "../core/LearningConfig.hpp"
#include "Vault.hpp"

// Storage handles the encrypted data file holding the learning config and
// every item.
//
// File layout:
//   Header: 8 bytes ASCII "RTNDAT1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (passphrase key derivation)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// The plain text body is line based: a [config] section of key:value lines,
// then an [items] section with one field per line and "---" after each item.
// Text fields escape backslash and newline.
//
// save/load require an unlocked Vault. If it is locked they return false.

class Storage {
public:
    static std::string serializePlain(const std::vector<Item>& items, const LearningConfig& cfg);
    static bool parsePlain(const std::string& plain, std::vector<Item>& items, LearningConfig& cfg);

    // Reads the salt from an existing file. `exists` is false (and the call
    // succeeds) when there is no file yet.
    static bool readSalt(const std::string& filename, std::vector<unsigned char>& salt, bool& exists);

    static bool saveItems(const std::vector<Item>& items, const LearningConfig& cfg,
        const std::string& filename, const Vault& vault);
    // A missing file loads as an empty collection with the default config.
    static bool loadItems(std::vector<Item>& items, LearningConfig& cfg,
        const std::string& filename, const Vault& vault);

    static std::string escapeText(const std::string& s);
    static std::string unescapeText(const std::string& s);
};
