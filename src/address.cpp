#include "address.hpp"
#include "bech32.hpp"
#include "error.hpp"
#include "network.hpp"
#include "puzzle.hpp"
#include <algorithm>

namespace coldspend {

Bytes32 AddressCodec::puzzle_hash(const bls::G1Element& public_key) {
    return StandardPuzzle::puzzle_hash_for_pk(public_key);
}

std::string AddressCodec::encode_address(const Bytes32& puzzle_hash, const std::string& prefix) {
    return Bech32m::encode(prefix, puzzle_hash);
}

DecodedAddress AddressCodec::decode_any(const std::string& address) {
    auto decoded = Bech32m::decode(address);
    if (decoded.data.size() != 32) {
        throw SpendError(SpendError::ErrorType::InvalidChecksum,
            "Address '" + address + "' does not carry a 32-byte puzzle hash");
    }

    DecodedAddress result;
    std::copy(decoded.data.begin(), decoded.data.end(), result.puzzle_hash.begin());
    result.prefix = decoded.hrp;
    return result;
}

DecodedAddress AddressCodec::decode_address(const std::string& address) {
    auto result = decode_any(address);
    auto known = NetworkParams::known_prefixes();
    if (std::find(known.begin(), known.end(), result.prefix) == known.end()) {
        throw SpendError(SpendError::ErrorType::UnknownPrefix, "Unknown address prefix '" + result.prefix + "'");
    }
    return result;
}

Bytes32 AddressCodec::decode_address(const std::string& address, const std::string& expected_prefix) {
    auto result = decode_any(address);
    if (result.prefix != expected_prefix) {
        throw SpendError(SpendError::ErrorType::UnknownPrefix,
            "Address prefix '" + result.prefix + "' does not match network prefix '" + expected_prefix + "'");
    }
    return result.puzzle_hash;
}

} // namespace coldspend
