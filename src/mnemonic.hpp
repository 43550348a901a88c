#pragma once

#include <string>
#include <vector>
#include "secure_memory.hpp"

namespace coldspend {

class Mnemonic {
public:
    // Splits a mnemonic on whitespace and checks it has 24 words from the BIP39 English
    // list whose last word carries the checksum
    // Throws SpendError(InvalidMnemonic) otherwise
    static std::vector<std::string> words(const std::string& mnemonic);

    // BIP39 seed: PBKDF2-HMAC-SHA512(words joined by single spaces, "mnemonic" + passphrase, 2048), 64 bytes
    static SecureBytes to_seed(const std::string& mnemonic, const std::string& passphrase = "");

private:
    Mnemonic() = delete;
};

} // namespace coldspend
