#pragma once

#include <array>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <openssl/sha.h>

namespace coldspend {

using Bytes32 = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

// HashUtils wraps the OpenSSL digests used for coin ids, puzzle hashes,
// announcements and key derivation
class HashUtils {
public:
    // Computes the SHA256 hash of input data
    static Bytes32 sha256(std::span<const uint8_t> data);

    // Computes SHA256 over the concatenation of several byte ranges
    static Bytes32 sha256(std::initializer_list<std::span<const uint8_t>> parts);

    // Computes HMAC-SHA512 of data keyed by key
    // Returns the 64-byte MAC, whose halves are used as key material and chain code
    static std::array<uint8_t, SHA512_DIGEST_LENGTH> hmac_sha512(std::span<const uint8_t> key,
                                                                  std::span<const uint8_t> data);

    // PBKDF2-HMAC-SHA512, as used by BIP39 to stretch a mnemonic into a seed
    static std::vector<uint8_t> pbkdf2_sha512(const std::string& password, const std::string& salt,
                                              int rounds, size_t out_len);

private:
    // Private constructor to prevent instantiation
    HashUtils() = delete;
};

} // namespace coldspend
