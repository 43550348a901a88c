#pragma once

#include <cstdint>
#include <vector>
#include "coin.hpp"
#include "network.hpp"
#include "spend_bundle.hpp"

namespace coldspend {

// What an accepted bundle does to the coin set
struct BundleSummary {
    std::vector<Coin> removals;
    std::vector<Coin> additions;
    uint64_t fee = 0;    // the reserved fee
    uint64_t cost = 0;
};

// Checks a signed bundle the way the ledger would accept it
class BundleVerifier {
public:
    explicit BundleVerifier(NetworkParams network);

    /**
     * Checks, in order: the bundle is not empty, every reveal matches its coin, every
     * solution evaluates, the spends are bound to the lead spend, exactly one fee is
     * reserved and covered, the cost is in budget, and the aggregated signature verifies.
     *
     * Throws:
     * SpendError(AggregationDegenerate) for an empty bundle
     * SpendError(DuplicateCoin) if a coin is spent twice
     * SpendError(InvalidPuzzleReveal) or SpendError(InvalidEncoding) for a spend that does not evaluate
     * SpendError(BindingBroken) if spends were removed, added or reordered
     * SpendError(FeeMismatch) if the fee is not reserved once or not covered by inputs minus outputs
     * SpendError(CostExceeded) if the bundle is over the maximum block cost
     * SpendError(InvalidSignature) if the signature is missing or does not verify
     */
    BundleSummary verify(const SpendBundle& bundle) const;

private:
    NetworkParams network_;
};

} // namespace coldspend
