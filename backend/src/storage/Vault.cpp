#include "Vault.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>

// constants for key derivation / pwhash
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;      // recommended salt size

Vault::~Vault() {
    lock();
}

size_t Vault::saltSize() {
    return SALT_BYTES;
}

std::vector<unsigned char> Vault::newSalt() {
    std::vector<unsigned char> salt(SALT_BYTES);
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

bool Vault::unlock(const std::string& passphrase, const std::vector<unsigned char>& salt) {
    spdlog::debug("Deriving data key (not logging passphrase or salt)");

    if (salt.size() != SALT_BYTES) {
        spdlog::error("Cannot derive data key: salt length {} (expected {})", salt.size(), SALT_BYTES);
        return false;
    }

    lock();
    key_bytes.assign(ENC_KEY_BYTES, 0);

    if (crypto_pwhash(key_bytes.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during data key derivation");
        key_bytes.clear();
        return false;
    }

    salt_bytes = salt;
    spdlog::debug("Data key derived successfully");
    return true;
}

void Vault::lock() {
    if (!key_bytes.empty()) {
        spdlog::debug("Clearing data key from memory");
        sodium_memzero(key_bytes.data(), key_bytes.size());
        key_bytes.clear();
    }
}
