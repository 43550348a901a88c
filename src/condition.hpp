#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include "consts.hpp"
#include "hash_utils.hpp"

namespace coldspend {

// Creates a new coin with the given puzzle hash and amount
struct CreateCoin {
    Bytes32 puzzle_hash;
    uint64_t amount;
    bool operator==(const CreateCoin&) const = default;
};

// Declares the exact fee the bundle leaves for the farmer
struct ReserveFee {
    uint64_t amount;
    bool operator==(const ReserveFee&) const = default;
};

// Announces a message bound to the spending coin's id
struct CreateCoinAnnouncement {
    std::vector<uint8_t> message;
    bool operator==(const CreateCoinAnnouncement&) const = default;
};

// Fails the whole bundle unless sha256(coin id || message) was announced by another spend in it
struct AssertCoinAnnouncement {
    Bytes32 announcement_id;
    bool operator==(const AssertCoinAnnouncement&) const = default;
};

// Requires a signature by public_key over message || coin id || additional data.
// Only the puzzle emits this; solutions may not carry it.
struct AggSigMe {
    std::array<uint8_t, PUBLIC_KEY_SIZE> public_key;
    std::vector<uint8_t> message;
    bool operator==(const AggSigMe&) const = default;
};

using Condition = std::variant<CreateCoin, ReserveFee, CreateCoinAnnouncement, AssertCoinAnnouncement, AggSigMe>;

class Conditions {
public:
    static uint8_t opcode(const Condition& condition);

    // Cost charged for a condition on top of the per-byte and execution costs
    static uint64_t cost(const Condition& condition);

    // Serializes a condition list as a solution:
    // [u16 count] then per condition [u8 opcode][u8 argc] and per argument [u16 length][bytes]
    static std::vector<uint8_t> encode(const std::vector<Condition>& conditions);

    // Parses a solution back into conditions
    // Throws SpendError(InvalidEncoding) for truncated input, trailing bytes, unknown or
    // malformed conditions, non-canonical amounts and AGG_SIG_ME
    static std::vector<Condition> decode(std::span<const uint8_t> solution);

    // sha256(coin id || message)
    static Bytes32 announcement_id(const Bytes32& coin_id, std::span<const uint8_t> message);

private:
    Conditions() = delete;
};

} // namespace coldspend
