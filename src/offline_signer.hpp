/**
 * @file offline_signer.hpp
 * @brief Signs unsigned spend bundles on the offline machine
 *
 * The signer holds the master seed and nothing else. For every coin spend it
 * re-derives the private key at the path the online machine recorded, checks that
 * the key really locks the coin and that the message it is asked to sign is the
 * message the puzzle will demand, then signs. The per-coin signatures are
 * aggregated into the bundle's single signature.
 *
 * Nothing the online machine wrote is trusted: reveals, messages, fee and cost are
 * all recomputed from the coin spends before any key is derived.
 */

#pragma once

#include <string>
#include "key_export.hpp"
#include "network.hpp"
#include "secure_memory.hpp"
#include "spend_bundle.hpp"

namespace coldspend {

class OfflineSigner {
public:
    OfflineSigner(SecureBytes seed, NetworkParams network);

    // Throws SpendError(InvalidMnemonic) for a mnemonic that is not 24 BIP39 words with a valid checksum
    static OfflineSigner from_mnemonic(const std::string& mnemonic, NetworkParams network,
                                       const std::string& passphrase = "");

    /**
     * Sign an unsigned bundle and return it with the aggregated signature attached
     *
     * Throws:
     * SpendError(ConfigError) if the bundle is for another network
     * SpendError(AggregationDegenerate) if the bundle has no coin spends
     * SpendError(PartialBundle) if a spend has no signing request or the request names another coin
     * SpendError(DuplicateCoin) if a coin is spent twice
     * SpendError(InvalidPuzzleReveal) if a reveal does not hash to its coin's puzzle hash
     * SpendError(SigningMessageMismatch) if a requested message is not the one the puzzle demands
     * SpendError(FeeMismatch) if the bundle does not reserve exactly the declared fee, or inputs
     *   minus outputs is anything other than that fee
     * SpendError(CostExceeded) if the bundle is over the maximum block cost
     * SpendError(KeyPathMismatch) if the key derived at a path does not lock its coin
     * SpendError(InvalidSignature) if the aggregate does not verify
     */
    BundleEnvelope sign(const BundleEnvelope& unsigned_bundle) const;

    // Public key material for the online machine
    KeyExport export_keys(uint32_t hardened_count = 0) const;

    const NetworkParams& network() const { return network_; }

private:
    SecureBytes seed_;
    NetworkParams network_;
};

} // namespace coldspend
