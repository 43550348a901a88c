/**
 * @file key_export.hpp
 * @brief Public key material handed from the offline machine to the online one
 *
 * The export carries the account extended public key (m/12381'/8444'/2'), from which
 * every unhardened address key can be derived, and the public keys of any hardened
 * address keys, which the online machine cannot derive on its own.
 *
 * File layout:
 *   {"network": "xch", "path": "m/12381'/8444'/2'", "public_key": "0x..", "chain_code": "0x..",
 *    "hardened_children": [{"index": 0, "public_key": "0x.."}]}
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <bls.hpp>
#include "key_derivation.hpp"

namespace coldspend {

struct HardenedChild {
    uint32_t index;
    bls::G1Element public_key;
};

class KeyExport {
public:
    KeyExport(std::string network, ExtendedPublicKey account, std::vector<HardenedChild> hardened_children = {});

    // Builds an export from the master key: the account key plus hardened_count hardened address keys
    static KeyExport from_master(const ExtendedPrivateKey& master, const std::string& network,
                                 uint32_t hardened_count = 0);

    // Key for the unhardened address at index
    ExtendedPublicKey address_key(uint32_t index) const;

    // Key for the hardened address at index, if the export carries it
    std::optional<bls::G1Element> hardened_key(uint32_t index) const;

    const std::string& network() const { return network_; }
    const ExtendedPublicKey& account() const { return account_; }
    const std::vector<HardenedChild>& hardened_children() const { return hardened_children_; }

    std::string encode() const;

    // Throws SpendError(InvalidEncoding) for malformed files and public keys
    static KeyExport decode(const std::string& text);

    void save(const std::string& path) const;
    static KeyExport load(const std::string& path);

private:
    std::string network_;
    ExtendedPublicKey account_;
    std::vector<HardenedChild> hardened_children_;
};

} // namespace coldspend
