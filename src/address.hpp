#pragma once

#include <string>
#include <bls.hpp>
#include "hash_utils.hpp"

namespace coldspend {

struct DecodedAddress {
    Bytes32 puzzle_hash;
    std::string prefix;

    bool operator==(const DecodedAddress&) const = default;
};

// Maps wallet public keys to puzzle hashes and puzzle hashes to bech32m addresses
class AddressCodec {
public:
    // Puzzle hash of the standard puzzle locked to public_key
    static Bytes32 puzzle_hash(const bls::G1Element& public_key);

    static std::string encode_address(const Bytes32& puzzle_hash, const std::string& prefix);

    // Decodes an address of any built-in network
    // Throws SpendError(InvalidChecksum) for a corrupt address and
    // SpendError(UnknownPrefix) for a prefix no built-in network uses
    static DecodedAddress decode_address(const std::string& address);

    // Decodes an address that must carry expected_prefix
    // Throws SpendError(UnknownPrefix) when the prefix differs
    static Bytes32 decode_address(const std::string& address, const std::string& expected_prefix);

private:
    AddressCodec() = delete;
    static DecodedAddress decode_any(const std::string& address);
};

} // namespace coldspend
