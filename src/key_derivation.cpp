#include "key_derivation.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <cstring>
#include <vector>

namespace coldspend {

namespace {

std::array<uint8_t, 4> index_be(uint32_t index) {
    return std::array<uint8_t, 4>{
        static_cast<uint8_t>((index >> 24) & 0xff),
        static_cast<uint8_t>((index >> 16) & 0xff),
        static_cast<uint8_t>((index >> 8) & 0xff),
        static_cast<uint8_t>(index & 0xff)
    };
}

// Interprets the left half of an HMAC result as a scalar mod r
bls::PrivateKey tweak_from(const std::array<uint8_t, 64>& hmac_result) {
    std::vector<uint8_t> il(hmac_result.begin(), hmac_result.begin() + 32);
    auto tweak = bls::PrivateKey::FromByteVector(il, true);
    OPENSSL_cleanse(il.data(), il.size());
    if (tweak.IsZero()) {
        throw SpendError(SpendError::ErrorType::DerivationError, "Derived scalar is zero");
    }
    return tweak;
}

ChainCode chain_code_from(const std::array<uint8_t, 64>& hmac_result) {
    ChainCode chain_code;
    std::copy_n(hmac_result.begin() + 32, 32, chain_code.begin());
    return chain_code;
}

// HMAC input for an unhardened step: data = parent public key || index
std::vector<uint8_t> unhardened_data(const bls::G1Element& parent, uint32_t index) {
    auto data = parent.Serialize();
    auto be = index_be(index);
    data.insert(data.end(), be.begin(), be.end());
    return data;
}

} // namespace

ExtendedPublicKey::ExtendedPublicKey(const bls::G1Element& key, const ChainCode& chain_code, KeyPath path)
    : key_(key), chain_code_(chain_code), path_(std::move(path)) {}

// Unhardened public derivation:
// 1. I = HMAC-SHA512(chain code, parent public key || index)
// 2. child public key = parent public key + IL * G
// 3. child chain code = IR
//
// The private side adds IL to the parent scalar, so both sides land on the same point.
// Hardened steps hash the parent private key and cannot be computed here.
ExtendedPublicKey ExtendedPublicKey::derive_child(uint32_t index, bool hardened) const {
    if (hardened) {
        throw SpendError(SpendError::ErrorType::HardenedRequiresPrivateKey,
            "Hardened child " + std::to_string(index) + "' of " + path_.to_string() +
            " cannot be derived from a public key");
    }

    auto data = unhardened_data(key_, index);
    auto hmac_result = HashUtils::hmac_sha512(chain_code_, data);
    auto tweak = tweak_from(hmac_result);

    ExtendedPublicKey child(key_ + tweak.GetG1Element(), chain_code_from(hmac_result), path_.child(index, false));
    OPENSSL_cleanse(hmac_result.data(), hmac_result.size());
    return child;
}

ExtendedPublicKey ExtendedPublicKey::derive_path(const KeyPath& relative) const {
    ExtendedPublicKey current = *this;
    for (const auto& step : relative.steps()) {
        current = current.derive_child(step.index, step.hardened);
    }
    return current;
}

ExtendedPrivateKey::ExtendedPrivateKey(bls::PrivateKey key, const ChainCode& chain_code, KeyPath path)
    : key_(std::move(key)), chain_code_(chain_code), path_(std::move(path)) {}

ExtendedPrivateKey::~ExtendedPrivateKey() {
    OPENSSL_cleanse(chain_code_.data(), chain_code_.size());
}

ExtendedPrivateKey ExtendedPrivateKey::from_seed(std::span<const uint8_t> seed) {
    if (seed.size() < 32) {
        throw SpendError(SpendError::ErrorType::DerivationError, "Seed must be at least 32 bytes");
    }

    std::span<const uint8_t> hmac_key(reinterpret_cast<const uint8_t*>(MASTER_HMAC_KEY),
                                      std::strlen(MASTER_HMAC_KEY));
    auto hmac_result = HashUtils::hmac_sha512(hmac_key, seed);
    ExtendedPrivateKey master(tweak_from(hmac_result), chain_code_from(hmac_result), KeyPath{});
    OPENSSL_cleanse(hmac_result.data(), hmac_result.size());
    return master;
}

// Private child derivation.
//
// There are two types of derivation:
// - Unhardened: data = parent public key (48 bytes) || index, reproducible by the public side
// - Hardened: data = 0x00 || parent private key (32 bytes) || index, needs the private key
//
// In both cases I = HMAC-SHA512(chain code, data), child key = parent key + IL (mod r)
// and the child chain code is IR. The two data layouts have different lengths, so an
// index derived hardened never collides with the same index derived unhardened.
ExtendedPrivateKey ExtendedPrivateKey::derive_child(uint32_t index, bool hardened) const {
    std::vector<uint8_t> data;
    if (hardened) {
        data.reserve(1 + PRIVATE_KEY_SIZE + 4);
        data.push_back(0x00);
        auto secret_bytes = key_.Serialize();
        data.insert(data.end(), secret_bytes.begin(), secret_bytes.end());
        OPENSSL_cleanse(secret_bytes.data(), secret_bytes.size());
        auto be = index_be(index);
        data.insert(data.end(), be.begin(), be.end());
    } else {
        data = unhardened_data(key_.GetG1Element(), index);
    }

    auto hmac_result = HashUtils::hmac_sha512(chain_code_, data);
    OPENSSL_cleanse(data.data(), data.size());

    auto child_key = bls::PrivateKey::Aggregate({key_, tweak_from(hmac_result)});
    ExtendedPrivateKey child(std::move(child_key), chain_code_from(hmac_result), path_.child(index, hardened));
    OPENSSL_cleanse(hmac_result.data(), hmac_result.size());
    return child;
}

ExtendedPrivateKey ExtendedPrivateKey::derive_path(const KeyPath& relative) const {
    if (relative.empty()) {
        return ExtendedPrivateKey(key_, chain_code_, path_);
    }
    auto current = derive_child(relative.steps()[0].index, relative.steps()[0].hardened);
    for (size_t i = 1; i < relative.steps().size(); ++i) {
        current = current.derive_child(relative.steps()[i].index, relative.steps()[i].hardened);
    }
    return current;
}

ExtendedPublicKey ExtendedPrivateKey::public_key() const {
    return ExtendedPublicKey(key_.GetG1Element(), chain_code_, path_);
}

} // namespace coldspend
