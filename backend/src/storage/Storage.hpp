#pragma once
#include <string>
#include <vector>
#include "../core/Card.hpp"
#include "../core/Progress.hpp"

// Storage handles the card catalogue file and the encrypted progress file.
//
// Cards (text): one field per line, backslash-escaped, records end with "---".
// Progress (encrypted binary):
//   Header: 8 bytes ASCII "SRPROG1\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// saveProgress/loadProgress require a derived key of crypto_secretbox_KEYBYTES;
// any other key size returns false. Call sodium_init() before use.

class Storage {
public:
    // CARDS (text)
    static bool saveCards(const std::vector<Card>& cards, const std::string& filename);
    static bool loadCards(std::vector<Card>& cards, const std::string& filename);

    // PROGRESS (encrypted)
    static bool saveProgress(const std::vector<Progress>& records, const std::string& filename, const std::vector<unsigned char>& key);
    static bool loadProgress(std::vector<Progress>& records, const std::string& filename, const std::vector<unsigned char>& key);

    // Key derivation: Argon2id over passphrase + hex salt
    static bool deriveKey(const std::string& passphrase, const std::string& salt_hex, std::vector<unsigned char>& key);
    static std::string generateSaltHex();
};
