/**
 * @file spend_bundle.hpp
 * @brief Spend bundles and the document exchanged between the online and offline machines
 *
 * The online machine writes an unsigned BundleEnvelope; the offline machine reads it,
 * attaches the aggregated signature and writes it back. The JSON layout is:
 *
 *   {
 *     "coin_spends": [ {"coin": {...}, "puzzle_reveal": "0x..", "solution": "0x.."} ],
 *     "aggregated_signature": "0x.." | null,
 *     "metadata": {
 *       "fee": 100, "network": "txch", "cost": 123,
 *       "signing": [ {"coin_id": "0x..", "path": "m/12381'/8444'/2'/0",
 *                     "public_key": "0x..", "message": "0x.."} ]
 *     }
 *   }
 *
 * Keys are written sorted, so encoding a decoded document reproduces it byte for byte.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <bls.hpp>
#include <nlohmann/json.hpp>
#include "coin.hpp"
#include "consts.hpp"
#include "key_path.hpp"

namespace coldspend {

struct SpendBundle {
    std::vector<CoinSpend> coin_spends;
    std::optional<bls::G2Element> aggregated_signature;   // absent until signed

    // Coins created by the bundle's CREATE_COIN conditions
    std::vector<Coin> additions() const;

    // Coins the bundle spends
    std::vector<Coin> removals() const;

    // Sum of removals minus sum of additions
    // Throws SpendError(FeeMismatch) when the bundle creates more than it spends
    uint64_t fees() const;

    bool operator==(const SpendBundle&) const = default;
};

// What the offline signer needs to know about one coin spend
struct SigningRequest {
    Bytes32 coin_id;
    KeyPath path;                                          // where the owning key was derived
    std::array<uint8_t, PUBLIC_KEY_SIZE> public_key;       // synthetic key the puzzle checks
    std::vector<uint8_t> message;                          // AGG_SIG_ME message to sign

    bool operator==(const SigningRequest&) const = default;
};

struct BundleMetadata {
    uint64_t fee = 0;
    std::string network;                  // address prefix of the network the bundle is for
    uint64_t cost = 0;
    std::vector<SigningRequest> signing;  // one per coin spend, in spend order

    bool operator==(const BundleMetadata&) const = default;
};

struct BundleEnvelope {
    SpendBundle bundle;
    BundleMetadata metadata;

    bool is_signed() const { return bundle.aggregated_signature.has_value(); }

    std::string encode() const;

    // Throws SpendError(InvalidEncoding) for malformed documents
    static BundleEnvelope decode(const std::string& text);

    void save(const std::string& path) const;
    static BundleEnvelope load(const std::string& path);

    bool operator==(const BundleEnvelope&) const = default;
};

// Body of a push_tx request: {"spend_bundle": {"coin_spends": [...], "aggregated_signature": "0x.."}}
nlohmann::json push_tx_request(const SpendBundle& bundle);

void to_json(nlohmann::json& j, const SigningRequest& r);
void from_json(const nlohmann::json& j, SigningRequest& r);

void to_json(nlohmann::json& j, const BundleMetadata& m);
void from_json(const nlohmann::json& j, BundleMetadata& m);

void to_json(nlohmann::json& j, const SpendBundle& b);
void from_json(const nlohmann::json& j, SpendBundle& b);

} // namespace coldspend
