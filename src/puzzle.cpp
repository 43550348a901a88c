#include "puzzle.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <algorithm>

namespace coldspend {

namespace {

// offset = sha256(public key || hidden puzzle hash) mod r
bls::PrivateKey synthetic_offset(const bls::G1Element& public_key) {
    auto pk_bytes = public_key.Serialize();
    auto digest = HashUtils::sha256({pk_bytes, DEFAULT_HIDDEN_PUZZLE_HASH});
    return bls::PrivateKey::FromByteVector(std::vector<uint8_t>(digest.begin(), digest.end()), true);
}

} // namespace

bls::G1Element StandardPuzzle::synthetic_public_key(const bls::G1Element& public_key) {
    return public_key + synthetic_offset(public_key).GetG1Element();
}

bls::PrivateKey StandardPuzzle::synthetic_secret_key(const bls::PrivateKey& secret_key) {
    return bls::PrivateKey::Aggregate({secret_key, synthetic_offset(secret_key.GetG1Element())});
}

// Build the standard puzzle reveal for an already synthetic key
//
// Reveal structure (52 bytes total):
// - [4 bytes] : STANDARD_PUZZLE_TAG
// - [48 bytes]: compressed synthetic public key
std::vector<uint8_t> StandardPuzzle::puzzle_for_synthetic_pk(const bls::G1Element& synthetic_key) {
    auto key_bytes = synthetic_key.Serialize();

    std::vector<uint8_t> reveal;
    reveal.reserve(STANDARD_PUZZLE_TAG.size() + PUBLIC_KEY_SIZE);
    reveal.insert(reveal.end(), STANDARD_PUZZLE_TAG.begin(), STANDARD_PUZZLE_TAG.end());
    reveal.insert(reveal.end(), key_bytes.begin(), key_bytes.end());
    return reveal;
}

std::vector<uint8_t> StandardPuzzle::puzzle_for_pk(const bls::G1Element& public_key) {
    return puzzle_for_synthetic_pk(synthetic_public_key(public_key));
}

Bytes32 StandardPuzzle::puzzle_hash(std::span<const uint8_t> puzzle_reveal) {
    return HashUtils::sha256(puzzle_reveal);
}

Bytes32 StandardPuzzle::puzzle_hash_for_pk(const bls::G1Element& public_key) {
    return puzzle_hash(puzzle_for_pk(public_key));
}

// Cost of one run:
//   execution cost + COST_PER_BYTE * (reveal + solution bytes) + sum of condition costs
// The implicit AGG_SIG_ME is charged like any other condition.
PuzzleOutput StandardPuzzle::run(std::span<const uint8_t> puzzle_reveal, std::span<const uint8_t> solution) {
    if (puzzle_reveal.size() != STANDARD_PUZZLE_TAG.size() + PUBLIC_KEY_SIZE ||
        !std::equal(STANDARD_PUZZLE_TAG.begin(), STANDARD_PUZZLE_TAG.end(), puzzle_reveal.begin())) {
        throw SpendError(SpendError::ErrorType::InvalidPuzzleReveal, "Puzzle reveal is not a standard puzzle");
    }

    PuzzleOutput output;
    output.conditions = Conditions::decode(solution);

    AggSigMe agg_sig;
    std::copy(puzzle_reveal.begin() + STANDARD_PUZZLE_TAG.size(), puzzle_reveal.end(), agg_sig.public_key.begin());
    auto solution_hash = HashUtils::sha256(solution);
    agg_sig.message.assign(solution_hash.begin(), solution_hash.end());
    output.conditions.push_back(std::move(agg_sig));

    output.cost = STANDARD_PUZZLE_EXECUTION_COST + COST_PER_BYTE * (puzzle_reveal.size() + solution.size());
    for (const auto& condition : output.conditions) {
        output.cost += Conditions::cost(condition);
    }
    return output;
}

std::vector<uint8_t> StandardPuzzle::signing_message(const AggSigMe& condition, const Bytes32& coin_id,
                                                     const Bytes32& additional_data) {
    std::vector<uint8_t> message = condition.message;
    message.insert(message.end(), coin_id.begin(), coin_id.end());
    message.insert(message.end(), additional_data.begin(), additional_data.end());
    return message;
}

} // namespace coldspend
