#include "network.hpp"
#include "address.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace coldspend {

using json = nlohmann::json;

NetworkParams NetworkParams::mainnet() {
    return NetworkParams{
        .name = "mainnet",
        .address_prefix = "xch",
        .additional_data = HexUtils::decode_fixed<32>("ccd5bb71183532bff220ba46c268991a3ff07eb358e8255a65c30a2dce0e5fbb"),
        .max_block_cost = DEFAULT_MAX_BLOCK_COST,
        .node_command = "chia rpc full_node"
    };
}

NetworkParams NetworkParams::testnet() {
    return NetworkParams{
        .name = "testnet",
        .address_prefix = "txch",
        .additional_data = HexUtils::decode_fixed<32>("ae83525ba8d1dd3f09b277de18ca3e43fc0af20d20c4b3e92ef2a48bd291ccb2"),
        .max_block_cost = DEFAULT_MAX_BLOCK_COST,
        .node_command = "chia rpc full_node"
    };
}

NetworkParams NetworkParams::by_name(const std::string& name) {
    if (name == "mainnet") {
        return mainnet();
    }
    if (name == "testnet") {
        return testnet();
    }
    throw SpendError(SpendError::ErrorType::ConfigError, "Unknown network: " + name);
}

std::optional<NetworkParams> NetworkParams::by_prefix(const std::string& prefix) {
    for (auto params : {mainnet(), testnet()}) {
        if (params.address_prefix == prefix) {
            return params;
        }
    }
    return std::nullopt;
}

std::vector<std::string> NetworkParams::known_prefixes() {
    return {mainnet().address_prefix, testnet().address_prefix};
}

NetworkParams NetworkParams::load(const std::string& path, const std::optional<std::string>& base_name) {
    std::ifstream file(path);
    if (!file) {
        throw SpendError(SpendError::ErrorType::ConfigError, "Failed to open config file " + path);
    }

    try {
        json j = json::parse(file);

        auto params = by_name(base_name.value_or(j.value("network", std::string("mainnet"))));
        if (j.contains("address_prefix")) {
            params.address_prefix = j.at("address_prefix").get<std::string>();
            // the prefix must yield addresses that decode
            AddressCodec::encode_address(Bytes32{}, params.address_prefix);
        }
        if (j.contains("additional_data")) {
            params.additional_data = HexUtils::decode_fixed<32>(j.at("additional_data").get<std::string>());
        }
        if (j.contains("max_block_cost")) {
            params.max_block_cost = j.at("max_block_cost").get<uint64_t>();
        }
        if (j.contains("node_command")) {
            params.node_command = j.at("node_command").get<std::string>();
        }
        return params;
    } catch (const json::exception& e) {
        throw SpendError(SpendError::ErrorType::ConfigError,
            "Failed to parse config file " + path + ": " + e.what());
    } catch (const SpendError& e) {
        if (e.type() == SpendError::ErrorType::ConfigError) {
            throw;
        }
        throw SpendError(SpendError::ErrorType::ConfigError, "Invalid value in config file " + path + ": " + e.what());
    }
}

} // namespace coldspend
