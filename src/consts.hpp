#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace coldspend {

    // Condition opcodes emitted by puzzle evaluation
    constexpr uint8_t AGG_SIG_ME = 50;
    constexpr uint8_t CREATE_COIN = 51;
    constexpr uint8_t RESERVE_FEE = 52;
    constexpr uint8_t CREATE_COIN_ANNOUNCEMENT = 60;
    constexpr uint8_t ASSERT_COIN_ANNOUNCEMENT = 61;

    // Sizes of serialized key material and hashes
    constexpr size_t HASH_SIZE = 32;
    constexpr size_t PUBLIC_KEY_SIZE = 48;   // compressed G1 element
    constexpr size_t SIGNATURE_SIZE = 96;    // compressed G2 element
    constexpr size_t PRIVATE_KEY_SIZE = 32;
    constexpr size_t CHAIN_CODE_SIZE = 32;
    constexpr size_t SEED_SIZE = 64;

    // Standard puzzle reveal: tag followed by the synthetic public key
    constexpr std::array<uint8_t, 4> STANDARD_PUZZLE_TAG = {0x63, 0x73, 0x70, 0x01};

    // Hash of the default hidden puzzle, mixed into every synthetic key
    constexpr std::array<uint8_t, 32> DEFAULT_HIDDEN_PUZZLE_HASH = {
        0x71, 0x1d, 0x6c, 0x4e, 0x32, 0xc9, 0x2e, 0x53, 0x17, 0x9b, 0x19, 0x94, 0x84, 0xcf, 0x8c, 0x89,
        0x75, 0x42, 0xbc, 0x57, 0xf2, 0xb2, 0x25, 0x82, 0x79, 0x9f, 0x9d, 0x65, 0x7e, 0xec, 0x46, 0x99
    };

    // Key used to turn a seed into the master extended key
    constexpr const char* MASTER_HMAC_KEY = "BLS HD seed";

    // Wallet key path policy: m/12381'/8444'/2'/index
    constexpr uint32_t PURPOSE_INDEX = 12381;
    constexpr uint32_t COIN_TYPE_INDEX = 8444;
    constexpr uint32_t WALLET_ACCOUNT_INDEX = 2;

    // Cost model
    constexpr uint64_t COST_PER_BYTE = 12000;
    constexpr uint64_t CREATE_COIN_COST = 1800000;
    constexpr uint64_t AGG_SIG_COST = 1200000;
    constexpr uint64_t STANDARD_PUZZLE_EXECUTION_COST = 500000;
    constexpr uint64_t DEFAULT_MAX_BLOCK_COST = 11000000000ULL;

    // BIP39 seed stretching
    constexpr size_t MNEMONIC_WORD_COUNT = 24;
    constexpr int MNEMONIC_PBKDF2_ROUNDS = 2048;

} // namespace coldspend
