#pragma once

#include <array>
#include <cstdint>
#include "address.hpp"
#include "coin_selector.hpp"
#include "key_export.hpp"
#include "network.hpp"
#include "offline_signer.hpp"
#include "secure_memory.hpp"

namespace coldspend::test_support {

inline SecureBytes fixed_seed(uint8_t fill = 0x2a) {
    std::array<uint8_t, SEED_SIZE> seed;
    for (size_t i = 0; i < seed.size(); ++i) {
        seed[i] = static_cast<uint8_t>(fill + i);
    }
    return SecureBytes(seed);
}

inline Bytes32 filled(uint8_t value) {
    Bytes32 out;
    out.fill(value);
    return out;
}

// A testnet wallet from a fixed seed, with its public export as the online machine sees it
struct TestWallet {
    NetworkParams network = NetworkParams::testnet();
    OfflineSigner signer{fixed_seed(), network};
    KeyExport keys = signer.export_keys(2);

    // Unspent coin at the unhardened address index, created by a made-up parent
    SpendableCoin coin(uint32_t index, uint64_t amount, uint64_t timestamp, uint8_t parent = 0x01) const {
        auto key = keys.address_key(index);
        CoinRecord record{
            .coin = Coin{filled(parent), AddressCodec::puzzle_hash(key.key()), amount},
            .confirmed_block_index = static_cast<uint32_t>(timestamp),
            .timestamp = timestamp
        };
        return SpendableCoin{record, key.key(), key.path()};
    }

    Bytes32 address(uint32_t index) const {
        return AddressCodec::puzzle_hash(keys.address_key(index).key());
    }
};

} // namespace coldspend::test_support
