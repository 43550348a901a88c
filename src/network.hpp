#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "hash_utils.hpp"

namespace coldspend {

// Parameters that differ between networks
struct NetworkParams {
    std::string name;              // "mainnet" or "testnet"
    std::string address_prefix;    // bech32m human-readable part
    Bytes32 additional_data;       // appended to every AGG_SIG_ME message
    uint64_t max_block_cost;       // bundles above this cost are rejected
    std::string node_command;      // command prefix for the full node RPC

    static NetworkParams mainnet();
    static NetworkParams testnet();

    // Built-in network by name
    // Throws SpendError(ConfigError) for an unknown name
    static NetworkParams by_name(const std::string& name);

    // Built-in network whose address prefix is prefix, if any
    static std::optional<NetworkParams> by_prefix(const std::string& prefix);

    // Prefixes of every built-in network
    static std::vector<std::string> known_prefixes();

    // Starts from the built-in network named by the file's "network" field (default mainnet,
    // or base_name when given) and applies any of "address_prefix", "additional_data",
    // "max_block_cost" and "node_command" found in the JSON file
    // Throws SpendError(ConfigError) when the file is unreadable or malformed
    static NetworkParams load(const std::string& path, const std::optional<std::string>& base_name = std::nullopt);
};

} // namespace coldspend
