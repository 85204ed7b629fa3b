#pragma once

#include <string>
#include <vector>

// Holds the symmetric key for the encrypted data file, derived from the
// user's passphrase and the salt stored in the file header. The key is
// wiped on lock() and on destruction.
class Vault {
public:
    Vault() = default;
    ~Vault();

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    // Fresh random salt for a data file that does not exist yet.
    static std::vector<unsigned char> newSalt();
    static size_t saltSize();

    // returns true on success, false on failure (bad salt, out of memory)
    bool unlock(const std::string& passphrase, const std::vector<unsigned char>& salt);
    void lock();

    bool isUnlocked() const { return !key_bytes.empty(); }
    const std::vector<unsigned char>& key() const { return key_bytes; }
    const std::vector<unsigned char>& salt() const { return salt_bytes; }

private:
    std::vector<unsigned char> key_bytes;
    std::vector<unsigned char> salt_bytes;
};
