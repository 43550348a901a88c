#include "node_client.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include <array>
#include <cstdio>
#include <memory>
#include <sys/wait.h>

namespace coldspend {

using json = nlohmann::json;

namespace {

// Wraps text in single quotes for the shell
std::string shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// Message the node attached to an unsuccessful response
std::string error_of(const json& response) {
    if (response.contains("error") && response["error"].is_string()) {
        return response["error"].get<std::string>();
    }
    return response.dump();
}

void require_success(const std::string& endpoint, const json& response) {
    if (!response.value("success", false)) {
        throw SpendError(SpendError::ErrorType::NodeError, endpoint + " failed: " + error_of(response));
    }
}

} // namespace

std::string FullNode::submit(const SpendBundle& bundle) {
    auto result = push_tx(bundle);
    if (!result.accepted) {
        throw SpendError(SpendError::ErrorType::NodeError, "Bundle rejected: " + result.status);
    }
    return result.status;
}

ChiaCliNode::ChiaCliNode(std::string command) : command_(std::move(command)) {}

json ChiaCliNode::execute(const std::string& endpoint, const json& request) const {
    std::string full_cmd = command_ + " " + endpoint + " " + shell_quote(request.dump()) + " 2>&1";

    std::unique_ptr<FILE, decltype(&pclose)> pipe(
        popen(full_cmd.c_str(), "r"),
        pclose
    );

    if (!pipe) {
        throw SpendError(SpendError::ErrorType::NodeError,
            "Failed to execute '" + command_ + "'. Make sure it is installed and in your PATH.");
    }

    std::string result;
    std::array<char, 128> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    int status = pclose(pipe.release());
    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    // Rejections come back as JSON with a non-zero exit code; anything else non-zero is a failure to run
    json parsed = json::parse(result, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        if (exit_code != 0) {
            throw SpendError(SpendError::ErrorType::NodeError,
                endpoint + " exited with code " + std::to_string(exit_code) + ". Output: " + result);
        }
        throw SpendError(SpendError::ErrorType::NodeError, endpoint + " returned a non-JSON response: " + result);
    }
    return parsed;
}

std::vector<CoinRecord> ChiaCliNode::get_coin_records_by_puzzle_hashes(const std::vector<Bytes32>& puzzle_hashes,
                                                                       bool include_spent) {
    json hashes = json::array();
    for (const auto& puzzle_hash : puzzle_hashes) {
        hashes.push_back(HexUtils::encode_prefixed(puzzle_hash));
    }

    json response = execute("get_coin_records_by_puzzle_hashes",
        {{"puzzle_hashes", hashes}, {"include_spent_coins", include_spent}});
    require_success("get_coin_records_by_puzzle_hashes", response);

    try {
        return response.at("coin_records").get<std::vector<CoinRecord>>();
    } catch (const json::exception& e) {
        throw SpendError(SpendError::ErrorType::NodeError,
            std::string("Failed to parse coin records: ") + e.what());
    } catch (const SpendError& e) {
        throw SpendError(SpendError::ErrorType::NodeError,
            std::string("Failed to parse coin records: ") + e.what());
    }
}

BlockchainState ChiaCliNode::get_blockchain_state() {
    json response = execute("get_blockchain_state", json::object());
    require_success("get_blockchain_state", response);

    try {
        const auto& state = response.at("blockchain_state");
        BlockchainState result;
        result.synced = state.at("sync").at("synced").get<bool>();
        if (state.contains("peak") && state["peak"].is_object()) {
            result.peak_height = state["peak"].value("height", 0u);
        }
        return result;
    } catch (const json::exception& e) {
        throw SpendError(SpendError::ErrorType::NodeError,
            std::string("Failed to parse blockchain state: ") + e.what());
    }
}

PushResult ChiaCliNode::push_tx(const SpendBundle& bundle) {
    json response = execute("push_tx", push_tx_request(bundle));

    if (response.value("success", false)) {
        return PushResult{.accepted = true, .status = response.value("status", std::string("SUCCESS"))};
    }
    return PushResult{.accepted = false, .status = error_of(response)};
}

} // namespace coldspend
