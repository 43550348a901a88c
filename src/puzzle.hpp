#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include <bls.hpp>
#include "condition.hpp"
#include "hash_utils.hpp"

namespace coldspend {

// Conditions a puzzle produced for a solution, and what running it cost
struct PuzzleOutput {
    std::vector<Condition> conditions;
    uint64_t cost;
};

// The standard puzzle every wallet coin is locked with.
//
// Puzzle evaluation is opaque to this project; the standard puzzle is modelled as:
// - reveal = STANDARD_PUZZLE_TAG || synthetic public key (48 bytes)
// - puzzle hash = sha256(reveal)
// - running it with a solution yields the solution's conditions plus
//   AGG_SIG_ME(synthetic public key, sha256(solution))
//
// The synthetic key hides a second spending path (the hidden puzzle) behind the
// wallet key: synthetic = key + sha256(key || hidden puzzle hash) * G.
class StandardPuzzle {
public:
    static bls::G1Element synthetic_public_key(const bls::G1Element& public_key);
    static bls::PrivateKey synthetic_secret_key(const bls::PrivateKey& secret_key);

    // Puzzle reveal for a wallet public key (the synthetic key is applied here)
    static std::vector<uint8_t> puzzle_for_pk(const bls::G1Element& public_key);

    // Puzzle reveal for a key that is already synthetic
    static std::vector<uint8_t> puzzle_for_synthetic_pk(const bls::G1Element& synthetic_key);

    static Bytes32 puzzle_hash(std::span<const uint8_t> puzzle_reveal);
    static Bytes32 puzzle_hash_for_pk(const bls::G1Element& public_key);

    // Runs the puzzle against a solution
    // Throws SpendError(InvalidPuzzleReveal) for a reveal that is not a standard puzzle
    // and SpendError(InvalidEncoding) for a malformed solution
    static PuzzleOutput run(std::span<const uint8_t> puzzle_reveal, std::span<const uint8_t> solution);

    // Message a signer commits to for an AGG_SIG_ME condition: message || coin id || additional data
    static std::vector<uint8_t> signing_message(const AggSigMe& condition, const Bytes32& coin_id,
                                                const Bytes32& additional_data);

private:
    StandardPuzzle() = delete;
};

} // namespace coldspend
