#include "Storage.hpp"
#include "../core/IntervalCalculator.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <limits>
#include <cmath>
#include <cstring>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "RTNDAT1\n";
static const char CONFIG_SECTION[] = "[config]";
static const char ITEMS_SECTION[] = "[items]";
static const char ITEM_END[] = "---";

std::string Storage::escapeText(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else out += c;
    }
    return out;
}

std::string Storage::unescapeText(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char n = s[++i];
            if (n == 'n') out += '\n';
            else if (n == 'r') out += '\r';
            else out += n;
        }
        else {
            out += s[i];
        }
    }
    return out;
}

std::string Storage::serializePlain(const std::vector<Item>& items, const LearningConfig& cfg) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);

    oss << CONFIG_SECTION << "\n" << cfg.serialize();
    oss << ITEMS_SECTION << "\n";

    for (const auto& it : items) {
        oss << it.id << "\n"
            << escapeText(it.front) << "\n"
            << escapeText(it.back) << "\n"
            << cardStateName(it.state) << "\n"
            << it.current_step << "\n"
            << it.interval << "\n"
            << it.ease << "\n"
            << it.lapses << "\n"
            << it.review_count << "\n"
            << static_cast<long long>(it.next_review) << "\n"
            << static_cast<long long>(it.created_at) << "\n"
            << static_cast<long long>(it.last_review) << "\n"
            << ITEM_END << "\n";
    }

    return oss.str();
}

// One item is exactly this many lines, terminator included
static constexpr size_t ITEM_LINES = 13;

static bool parseItemLines(const std::vector<std::string>& f, Item& it) {
    try {
        it.id = f[0];
        it.front = Storage::unescapeText(f[1]);
        it.back = Storage::unescapeText(f[2]);
        if (!parseCardState(f[3], it.state)) {
            spdlog::error("Unknown card state '{}' for item {}", f[3], f[0]);
            return false;
        }
        it.current_step = std::stoi(f[4]);
        it.interval = std::stod(f[5]);
        it.ease = std::stod(f[6]);
        it.lapses = std::stoi(f[7]);
        it.review_count = std::stoi(f[8]);
        it.next_review = static_cast<std::time_t>(std::stoll(f[9]));
        it.created_at = static_cast<std::time_t>(std::stoll(f[10]));
        it.last_review = static_cast<std::time_t>(std::stoll(f[11]));
    }
    catch (const std::exception& e) {
        spdlog::error("Malformed item record '{}': {}", f[0], e.what());
        return false;
    }

    if (it.id.empty() || f[12] != ITEM_END) {
        spdlog::error("Malformed item record near '{}'", f[0]);
        return false;
    }

    // Scheduling fields the calculator indexes or multiplies with
    if (it.current_step < 0 || it.lapses < 0 || it.review_count < 0 ||
        !std::isfinite(it.interval) || it.interval < 0.0 ||
        !std::isfinite(it.ease) || it.ease < IntervalCalculator::kEaseFloor)
    {
        spdlog::error("Out of range scheduling fields in item {} (step={} interval={} ease={})",
            it.id, it.current_step, it.interval, it.ease);
        return false;
    }
    return true;
}

bool Storage::parsePlain(const std::string& plain, std::vector<Item>& items, LearningConfig& cfg) {
    std::istringstream iss(plain);
    std::string line;
    items.clear();

    if (!std::getline(iss, line) || line != CONFIG_SECTION) {
        spdlog::error("Data body does not start with {}", CONFIG_SECTION);
        return false;
    }

    std::string cfgText;
    bool sawItems = false;
    while (std::getline(iss, line)) {
        if (line == ITEMS_SECTION) { sawItems = true; break; }
        cfgText += line + "\n";
    }
    if (!sawItems) {
        spdlog::error("Data body has no {} section", ITEMS_SECTION);
        return false;
    }
    cfg = LearningConfig::deserialize(cfgText);

    std::vector<std::string> fields;
    while (std::getline(iss, line)) {
        fields.push_back(line);
        if (fields.size() < ITEM_LINES) continue;

        Item it;
        if (!parseItemLines(fields, it)) return false;
        items.push_back(std::move(it));
        fields.clear();
    }

    if (!fields.empty()) {
        spdlog::error("Truncated item record ({} trailing lines)", fields.size());
        return false;
    }
    return true;
}

bool Storage::readSalt(const std::string& filename, std::vector<unsigned char>& salt, bool& exists) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        exists = false;
        return true;
    }
    exists = true;

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header in '{}'", filename);
        return false;
    }

    salt.assign(crypto_pwhash_SALTBYTES, 0);
    in.read(reinterpret_cast<char*>(salt.data()), salt.size());
    if (static_cast<size_t>(in.gcount()) != salt.size()) {
        spdlog::error("Failed to read salt from '{}'", filename);
        return false;
    }
    return true;
}

bool Storage::saveItems(const std::vector<Item>& items, const LearningConfig& cfg,
    const std::string& filename, const Vault& vault)
{
    spdlog::info("Saving {} encrypted items to '{}'", items.size(), filename);
    const auto& key = vault.key();
    if (key.size() != crypto_secretbox_KEYBYTES || vault.salt().size() != crypto_pwhash_SALTBYTES) {
        spdlog::error("Vault is locked; cannot save");
        return false;
    }

    std::string plain = serializePlain(items, cfg);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        return false;
    }
    sodium_memzero(&plain[0], plain.size());

    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for encrypted write", filename);
        return false;
    }

    out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.write(reinterpret_cast<const char*>(vault.salt().data()), vault.salt().size());
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    out.flush();
    if (!out) {
        spdlog::error("Write to '{}' failed", filename);
        return false;
    }
    return true;
}

bool Storage::loadItems(std::vector<Item>& items, LearningConfig& cfg,
    const std::string& filename, const Vault& vault)
{
    spdlog::info("Loading encrypted items from '{}'", filename);
    items.clear();

    const auto& key = vault.key();
    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Vault is locked; cannot load");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Item file '{}' not found; treating as empty", filename);
        cfg = LearningConfig::defaults();
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    // Salt was consumed by the Vault already
    in.seekg(static_cast<std::streamoff>(crypto_pwhash_SALTBYTES), std::ios::cur);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupted file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    sodium_memzero(plain.data(), plain.size());
    bool ok = parsePlain(plain_str, items, cfg);
    sodium_memzero(&plain_str[0], plain_str.size());
    if (!ok) {
        items.clear();
        return false;
    }

    spdlog::info("Loaded {} items", items.size());
    return true;
}
