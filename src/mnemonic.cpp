#include "mnemonic.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "mnemonic_words.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <array>
#include <optional>
#include <sstream>
#include <string_view>

namespace coldspend {

namespace {

std::optional<uint16_t> word_index(const std::string& word) {
    auto it = std::lower_bound(MNEMONIC_WORDS.begin(), MNEMONIC_WORDS.end(), std::string_view(word));
    if (it == MNEMONIC_WORDS.end() || *it != word) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(it - MNEMONIC_WORDS.begin());
}

// 24 words carry 256 bits of entropy followed by the first 8 bits of its sha256
void check_checksum(const std::vector<uint16_t>& indices) {
    std::array<uint8_t, 33> packed{};
    size_t bit = 0;
    for (uint16_t value : indices) {
        for (int i = 10; i >= 0; --i, ++bit) {
            if ((value >> i) & 1) {
                packed[bit / 8] |= static_cast<uint8_t>(0x80 >> (bit % 8));
            }
        }
    }

    auto hash = HashUtils::sha256(std::span<const uint8_t>(packed.data(), 32));
    bool valid = hash[0] == packed[32];
    OPENSSL_cleanse(packed.data(), packed.size());
    OPENSSL_cleanse(hash.data(), hash.size());
    if (!valid) {
        throw SpendError(SpendError::ErrorType::InvalidMnemonic, "Mnemonic checksum word does not match");
    }
}

} // namespace

std::vector<std::string> Mnemonic::words(const std::string& mnemonic) {
    std::istringstream stream(mnemonic);
    std::vector<std::string> result;
    std::vector<uint16_t> indices;
    std::string word;
    while (stream >> word) {
        if (!std::all_of(word.begin(), word.end(), [](char c) { return c >= 'a' && c <= 'z'; })) {
            throw SpendError(SpendError::ErrorType::InvalidMnemonic,
                "Mnemonic words must be lowercase ASCII letters");
        }
        auto index = word_index(word);
        if (!index) {
            throw SpendError(SpendError::ErrorType::InvalidMnemonic,
                "Word " + std::to_string(result.size() + 1) + " is not in the BIP39 English word list");
        }
        indices.push_back(*index);
        result.push_back(std::move(word));
    }

    if (result.size() != MNEMONIC_WORD_COUNT) {
        throw SpendError(SpendError::ErrorType::InvalidMnemonic,
            "Expected " + std::to_string(MNEMONIC_WORD_COUNT) + " words, got " + std::to_string(result.size()));
    }
    check_checksum(indices);
    std::fill(indices.begin(), indices.end(), 0);
    return result;
}

SecureBytes Mnemonic::to_seed(const std::string& mnemonic, const std::string& passphrase) {
    auto list = words(mnemonic);

    std::string normalized;
    for (const auto& word : list) {
        if (!normalized.empty()) {
            normalized += ' ';
        }
        normalized += word;
    }

    auto seed = HashUtils::pbkdf2_sha512(normalized, "mnemonic" + passphrase, MNEMONIC_PBKDF2_ROUNDS, SEED_SIZE);
    SecureBytes secure(seed);

    OPENSSL_cleanse(seed.data(), seed.size());
    OPENSSL_cleanse(normalized.data(), normalized.size());
    for (auto& word : list) {
        OPENSSL_cleanse(word.data(), word.size());
    }
    return secure;
}

} // namespace coldspend
