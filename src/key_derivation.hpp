#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <bls.hpp>
#include "consts.hpp"
#include "key_path.hpp"

namespace coldspend {

using ChainCode = std::array<uint8_t, CHAIN_CODE_SIZE>;

// Public half of an extended key: a G1 public key, its chain code and the path it was derived at.
// This type cannot hold a private scalar, so it is the only key type the online machine uses.
class ExtendedPublicKey {
public:
    ExtendedPublicKey(const bls::G1Element& key, const ChainCode& chain_code, KeyPath path);

    // Derives an unhardened child public key
    // Throws SpendError(HardenedRequiresPrivateKey) when hardened is requested
    ExtendedPublicKey derive_child(uint32_t index, bool hardened = false) const;

    // Applies every step of a relative path
    ExtendedPublicKey derive_path(const KeyPath& relative) const;

    const bls::G1Element& key() const { return key_; }
    const ChainCode& chain_code() const { return chain_code_; }
    const KeyPath& path() const { return path_; }
    uint32_t fingerprint() const { return key_.GetFingerprint(); }

private:
    bls::G1Element key_;
    ChainCode chain_code_;
    KeyPath path_;
};

// Private extended key, used only inside the offline signer.
// The BLS private key wipes its scalar on destruction; the chain code is wiped here.
class ExtendedPrivateKey {
public:
    // Master key from seed: I = HMAC-SHA512("BLS HD seed", seed), key = IL mod r, chain code = IR
    static ExtendedPrivateKey from_seed(std::span<const uint8_t> seed);

    ExtendedPrivateKey(ExtendedPrivateKey&&) = default;
    ExtendedPrivateKey& operator=(ExtendedPrivateKey&&) = default;
    ExtendedPrivateKey(const ExtendedPrivateKey&) = delete;
    ExtendedPrivateKey& operator=(const ExtendedPrivateKey&) = delete;
    ~ExtendedPrivateKey();

    // Derives a child key, hardened or unhardened
    ExtendedPrivateKey derive_child(uint32_t index, bool hardened) const;

    // Applies every step of a relative path
    ExtendedPrivateKey derive_path(const KeyPath& relative) const;

    // Drops the private scalar
    ExtendedPublicKey public_key() const;

    const bls::PrivateKey& secret() const { return key_; }
    const KeyPath& path() const { return path_; }

private:
    ExtendedPrivateKey(bls::PrivateKey key, const ChainCode& chain_code, KeyPath path);

    bls::PrivateKey key_;
    ChainCode chain_code_;
    KeyPath path_;
};

} // namespace coldspend
