#pragma once

#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>
#include "hash_utils.hpp"

namespace coldspend {

struct Coin {
    Bytes32 parent_coin_info;   // Id of the coin whose spend created this one
    Bytes32 puzzle_hash;        // Commitment to the puzzle that locks this coin
    uint64_t amount;            // Value in mojos

    // Coin id: sha256(parent_coin_info || puzzle_hash || amount as minimal signed big-endian bytes)
    Bytes32 id() const;

    bool operator==(const Coin&) const = default;
};

// A coin as reported by the full node
struct CoinRecord {
    Coin coin;
    uint32_t confirmed_block_index = 0;
    uint32_t spent_block_index = 0;
    bool spent = false;
    bool coinbase = false;
    uint64_t timestamp = 0;

    bool operator==(const CoinRecord&) const = default;
};

// A coin together with the puzzle that hashes to its puzzle hash and the solution to run it with
struct CoinSpend {
    Coin coin;
    std::vector<uint8_t> puzzle_reveal;
    std::vector<uint8_t> solution;

    bool operator==(const CoinSpend&) const = default;
};

// Minimal two's complement big-endian encoding of an amount: 0 is empty, 128 is 0x0080
std::vector<uint8_t> amount_bytes(uint64_t amount);

// A coin can be spent once per bundle
// Throws SpendError(DuplicateCoin) when two coins share an id
void require_distinct(const std::vector<Coin>& coins);

void to_json(nlohmann::json& j, const Coin& c);
void from_json(const nlohmann::json& j, Coin& c);

void to_json(nlohmann::json& j, const CoinRecord& r);
void from_json(const nlohmann::json& j, CoinRecord& r);

void to_json(nlohmann::json& j, const CoinSpend& s);
void from_json(const nlohmann::json& j, CoinSpend& s);

} // namespace coldspend
