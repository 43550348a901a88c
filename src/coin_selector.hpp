#pragma once

#include <cstdint>
#include <vector>
#include <bls.hpp>
#include "coin.hpp"
#include "key_export.hpp"
#include "key_path.hpp"
#include "node_client.hpp"

namespace coldspend {

// An unspent coin together with the key that locks it
struct SpendableCoin {
    CoinRecord record;
    bls::G1Element public_key;   // wallet key, before the synthetic offset
    KeyPath path;
};

// Destination of one output
struct Payment {
    Bytes32 puzzle_hash;
    uint64_t amount;
};

struct Selection {
    std::vector<SpendableCoin> coins;   // in spend order
    uint64_t total = 0;                 // sum of the selected amounts
    uint64_t required = 0;              // sum of outputs plus fee
};

class CoinSelector {
public:
    // Sum of outputs plus fee
    // Throws SpendError(AmountOverflow) when it does not fit in 64 bits
    static uint64_t required_amount(const std::vector<Payment>& outputs, uint64_t fee);

    // Oldest-first greedy selection: coins are taken by timestamp, then confirmed block
    // index, then coin id, until the total covers outputs plus fee. Spent records are skipped.
    // Throws SpendError(InsufficientFunds) when the unspent coins do not cover it and
    // SpendError(DuplicateCoin) when a candidate is listed twice
    static Selection select(std::vector<SpendableCoin> candidates, const std::vector<Payment>& outputs,
                            uint64_t fee);

private:
    CoinSelector() = delete;
};

struct ScanResult {
    std::vector<SpendableCoin> coins;   // unspent coins locked by any scanned address
    uint32_t next_unused_index = 0;     // lowest unhardened index with no coin history
    uint32_t scanned = 0;               // unhardened indices examined
};

// Finds the wallet's coins by deriving address batches from a key export and asking the node
// for coin records. Scanning stops after the first batch without any coin history.
class AddressScanner {
public:
    AddressScanner(FullNode& node, const KeyExport& keys, uint32_t batch_size = 1000);

    // Throws SpendError(NodeError) when the node is not synced
    ScanResult scan();

private:
    FullNode& node_;
    const KeyExport& keys_;
    uint32_t batch_size_;
};

} // namespace coldspend
