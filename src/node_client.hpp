/**
 * Full node interface
 *
 * The core never talks to the network. Coin discovery and broadcast go through the
 * FullNode interface; ChiaCliNode implements it by running the node's RPC command line
 * tool and parsing its JSON output. Tests substitute an in-memory node.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "coin.hpp"
#include "spend_bundle.hpp"

namespace coldspend {

struct BlockchainState {
    uint32_t peak_height = 0;
    bool synced = false;
};

// Outcome of handing a bundle to the node
struct PushResult {
    bool accepted = false;
    std::string status;   // node status on acceptance, rejection reason otherwise
};

class FullNode {
public:
    virtual ~FullNode() = default;

    // Coin records locked by any of the given puzzle hashes
    virtual std::vector<CoinRecord> get_coin_records_by_puzzle_hashes(const std::vector<Bytes32>& puzzle_hashes,
                                                                      bool include_spent) = 0;

    virtual BlockchainState get_blockchain_state() = 0;

    virtual PushResult push_tx(const SpendBundle& bundle) = 0;

    bool is_synced() { return get_blockchain_state().synced; }

    // Hands a bundle to the node and returns the status it reports
    // Throws SpendError(NodeError) when the node rejects the bundle
    std::string submit(const SpendBundle& bundle);
};

/**
 * FullNode backed by the node's RPC command line tool.
 *
 * Each call runs "<command> <endpoint> '<request json>'" through a pipe and parses
 * the JSON it prints.
 *
 * Throws:
 * SpendError(NodeError) when the command cannot be run, exits with an error and no
 * JSON output, or prints something that is not a node response
 */
class ChiaCliNode : public FullNode {
public:
    explicit ChiaCliNode(std::string command);

    std::vector<CoinRecord> get_coin_records_by_puzzle_hashes(const std::vector<Bytes32>& puzzle_hashes,
                                                              bool include_spent) override;
    BlockchainState get_blockchain_state() override;
    PushResult push_tx(const SpendBundle& bundle) override;

    // Runs one RPC endpoint and returns the parsed response
    nlohmann::json execute(const std::string& endpoint, const nlohmann::json& request) const;

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

} // namespace coldspend
