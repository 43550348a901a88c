#pragma once

#include <cstdint>
#include <vector>
#include <bls.hpp>

namespace coldspend {

// Combines per-coin BLS signatures into the single bundle signature
class SignatureAggregator {
public:
    // Point addition over all signatures; the empty list gives the identity element
    static bls::G2Element aggregate(const std::vector<bls::G2Element>& signatures);

    // As aggregate, but an empty list is a degenerate bundle
    // Throws SpendError(AggregationDegenerate)
    static bls::G2Element aggregate_nonempty(const std::vector<bls::G2Element>& signatures);

    // Checks an aggregate signature against (public key, message) pairs under the augmented scheme
    static bool verify(const std::vector<bls::G1Element>& public_keys,
                       const std::vector<std::vector<uint8_t>>& messages,
                       const bls::G2Element& signature);

private:
    SignatureAggregator() = delete;
};

} // namespace coldspend
