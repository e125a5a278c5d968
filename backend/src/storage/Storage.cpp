#include "Storage.hpp"
#include "../core/Scheduler.hpp"
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "SRPROG1\n";
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES;
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

// Keep each field on one line
static std::string escapeField(const std::string& s) {
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

static std::string unescapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char n = s[++i];
            if (n == 'n') out += '\n';
            else if (n == 'r') out += '\r';
            else out += n;
        }
        else out += s[i];
    }
    return out;
}

bool Storage::saveCards(const std::vector<Card>& cards, const std::string& filename) {
    spdlog::info("Saving {} cards to '{}'", cards.size(), filename);
    std::ofstream out(filename, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing card data", filename);
        return false;
    }

    out.precision(17);
    for (const auto& c : cards) {
        out << c.id << "\n"
            << c.created_seq << "\n"
            << sourceName(c.source) << "\n"
            << c.base_difficulty << "\n"
            << escapeField(c.scope) << "\n"
            << escapeField(c.prompt) << "\n"
            << escapeField(c.answer) << "\n"
            << (c.explanation ? 1 : 0) << "\n"
            << escapeField(c.explanation.value_or("")) << "\n"
            << "---\n";
    }
    return static_cast<bool>(out);
}

bool Storage::loadCards(std::vector<Card>& cards, const std::string& filename) {
    spdlog::info("Loading cards from '{}'", filename);
    cards.clear();

    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("Card file '{}' not found; treating as empty", filename);
        return true;
    }

    std::unordered_set<CardId> seen;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;

        Card c;
        std::string seq, source, difficulty, scope, has_expl, expl, sep;
        if (!std::getline(in, seq) || !std::getline(in, source) || !std::getline(in, difficulty)
            || !std::getline(in, scope) || !std::getline(in, c.prompt) || !std::getline(in, c.answer)
            || !std::getline(in, has_expl) || !std::getline(in, expl) || !std::getline(in, sep))
        {
            spdlog::error("Truncated card record in '{}'", filename);
            return false;
        }

        try {
            c.id = std::stoull(line);
            c.created_seq = std::stoull(seq);
            c.base_difficulty = std::stod(difficulty);
        }
        catch (const std::logic_error&) {
            spdlog::error("Malformed card record in '{}'", filename);
            return false;
        }

        if (!parseSource(source, c.source) || sep != "---") {
            spdlog::error("Malformed card record {} in '{}'", c.id, filename);
            return false;
        }

        c.scope = unescapeField(scope);
        c.prompt = unescapeField(c.prompt);
        c.answer = unescapeField(c.answer);
        if (has_expl == "1") c.explanation = unescapeField(expl);

        if (!seen.insert(c.id).second) {
            spdlog::error("Duplicate card id {} in '{}'", c.id, filename);
            cards.clear();
            return false;
        }
        cards.push_back(c);
    }

    spdlog::info("Loaded {} cards", cards.size());
    return true;
}

static std::string serializeProgressPlain(const std::vector<Progress>& records) {
    std::ostringstream oss;
    oss.precision(17);

    for (const auto& p : records) {
        oss << p.key.learner_id << " "
            << p.key.card_id << " "
            << p.stability << " "
            << p.difficulty << " "
            << (p.last_review_at ? static_cast<long long>(*p.last_review_at) : -1LL) << " "
            << (p.next_due_at ? static_cast<long long>(*p.next_due_at) : -1LL) << " "
            << p.repetitions << " "
            << p.lapses << " "
            << statusName(p.status) << " "
            << p.version << "\n";
    }

    return oss.str();
}

static bool parsePlainToProgress(const std::string& plain, std::vector<Progress>& records) {
    std::istringstream iss(plain);
    std::string line;
    records.clear();

    while (std::getline(iss, line)) {
        if (line.empty()) continue;
        std::istringstream ls(line);

        Progress p;
        long long last = -1, next = -1;
        std::string status;
        if (!(ls >> p.key.learner_id >> p.key.card_id >> p.stability >> p.difficulty
                 >> last >> next >> p.repetitions >> p.lapses >> status >> p.version))
        {
            spdlog::error("Malformed progress line");
            return false;
        }
        if (!parseStatus(status, p.status)) {
            spdlog::error("Unknown progress status '{}'", status);
            return false;
        }
        if (last >= 0) p.last_review_at = static_cast<std::time_t>(last);
        if (next >= 0) p.next_due_at = static_cast<std::time_t>(next);

        if (!Scheduler::checkInvariants(p)) {
            spdlog::error("Progress learner={} card={} violates invariants; refusing to load",
                p.key.learner_id, p.key.card_id);
            return false;
        }

        records.push_back(p);
    }

    return true;
}

bool Storage::saveProgress(const std::vector<Progress>& records, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Saving {} encrypted progress records to '{}'", records.size(), filename);
    if (key.size() != ENC_KEY_BYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::string plain = serializeProgressPlain(records);
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
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    return static_cast<bool>(out);
}

bool Storage::loadProgress(std::vector<Progress>& records, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Loading encrypted progress from '{}'", filename);
    records.clear();

    if (key.size() != ENC_KEY_BYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Progress file '{}' not found; treating as empty", filename);
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

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

    unsigned long long clen = ciphertext.size();
    unsigned long long plen = clen - crypto_secretbox_MACBYTES;
    std::vector<unsigned char> plain(plen);

    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), clen, nonce, key.data()) != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupted file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<const char*>(plain.data()), plain.size());
    sodium_memzero(plain.data(), plain.size());

    if (!parsePlainToProgress(plain_str, records)) {
        records.clear();
        return false;
    }

    spdlog::info("Loaded {} progress records", records.size());
    return true;
}

bool Storage::deriveKey(const std::string& passphrase, const std::string& salt_hex, std::vector<unsigned char>& key) {
    spdlog::debug("Deriving storage key (not logging passphrase or salt)");

    if (salt_hex.empty()) {
        spdlog::error("Cannot derive key: salt is empty");
        return false;
    }

    std::vector<unsigned char> salt(SALT_BYTES);
    size_t bin_len = 0;
    if (sodium_hex2bin(salt.data(), salt.size(),
        salt_hex.c_str(), salt_hex.size(),
        nullptr, &bin_len, nullptr) != 0 || bin_len != SALT_BYTES)
    {
        spdlog::error("Failed to decode hex salt");
        return false;
    }

    key.assign(ENC_KEY_BYTES, 0);

    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation");
        key.clear();
        return false;
    }

    spdlog::debug("Storage key derived successfully");
    return true;
}

std::string Storage::generateSaltHex() {
    unsigned char salt[SALT_BYTES];
    randombytes_buf(salt, SALT_BYTES);

    std::string hex(2 * SALT_BYTES + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), salt, SALT_BYTES);
    hex.pop_back();
    return hex;
}
