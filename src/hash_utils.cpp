#include "hash_utils.hpp"
#include "error.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace coldspend {

// Computes the SHA256 hash of input data
// Used for coin ids, puzzle hashes, solution digests and announcement ids.
Bytes32 HashUtils::sha256(std::span<const uint8_t> data) {
    Bytes32 hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

// The parts are fed to one context in order, which is equivalent to hashing
// their concatenation without building it first.
Bytes32 HashUtils::sha256(std::initializer_list<std::span<const uint8_t>> parts) {
    Bytes32 hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    for (const auto& part : parts) {
        SHA256_Update(&sha256, part.data(), part.size());
    }
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

std::array<uint8_t, SHA512_DIGEST_LENGTH> HashUtils::hmac_sha512(std::span<const uint8_t> key,
                                                                  std::span<const uint8_t> data) {
    std::array<uint8_t, SHA512_DIGEST_LENGTH> mac;
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), mac.data(), &mac_len) ||
        mac_len != SHA512_DIGEST_LENGTH) {
        throw SpendError(SpendError::ErrorType::DerivationError, "HMAC-SHA512 failed");
    }
    return mac;
}

// Stretches a password with PBKDF2-HMAC-SHA512
// BIP39 uses 2048 rounds, a salt of "mnemonic" + passphrase and a 64-byte output.
std::vector<uint8_t> HashUtils::pbkdf2_sha512(const std::string& password, const std::string& salt,
                                              int rounds, size_t out_len) {
    std::vector<uint8_t> out(out_len);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()), rounds, EVP_sha512(),
                          static_cast<int>(out.size()), out.data()) != 1) {
        throw SpendError(SpendError::ErrorType::InvalidMnemonic, "PBKDF2 seed stretching failed");
    }
    return out;
}

} // namespace coldspend
