/**
 * @file bundle_builder.hpp
 * @brief Builds unsigned spend bundles on the online machine
 *
 * Bundle layout:
 * - the first (lead) spend creates every output coin and the change coin, reserves the
 *   fee and announces sha256 of all spent coin ids in bundle order
 * - every other spend asserts the lead's announcement, so none of them is valid without
 *   the lead and the lead is not valid with a different set of spends
 *
 * The builder never sees a private key. Each spend's signing request records the path
 * the offline signer must derive and the exact message it must sign.
 */

#pragma once

#include <cstdint>
#include <vector>
#include "coin_selector.hpp"
#include "network.hpp"
#include "spend_bundle.hpp"

namespace coldspend {

class UnsignedBundleBuilder {
public:
    explicit UnsignedBundleBuilder(NetworkParams network);

    /**
     * Build an unsigned bundle spending exactly the given coins, in the given order
     *
     * Throws:
     * SpendError(AggregationDegenerate) if coins is empty
     * SpendError(InvalidPuzzleReveal) if a coin's key does not produce its puzzle hash
     * SpendError(DuplicateCoin) if a coin appears twice
     * SpendError(InsufficientFunds) if the coins do not cover outputs plus fee
     * SpendError(CostExceeded) if the bundle is over the network's maximum block cost
     */
    BundleEnvelope build(const std::vector<SpendableCoin>& coins, const std::vector<Payment>& outputs,
                         uint64_t fee, const Bytes32& change_puzzle_hash) const;

    // Selects coins oldest first from candidates, then builds
    BundleEnvelope create(std::vector<SpendableCoin> candidates, const std::vector<Payment>& outputs,
                          uint64_t fee, const Bytes32& change_puzzle_hash) const;

    // Message announced by the lead spend: sha256 of the coin ids in bundle order
    static Bytes32 announcement_message(const std::vector<Coin>& coins);

    const NetworkParams& network() const { return network_; }

private:
    NetworkParams network_;
};

} // namespace coldspend
