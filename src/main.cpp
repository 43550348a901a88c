// coldspend: air-gapped spend bundle tool
//
// The online machine only ever sees public key material:
//   address      print receive addresses derived from a key export
//   create       scan the full node for coins and build an unsigned bundle
//   verify       check a signed bundle the way the ledger would
//   push         broadcast a signed bundle through the full node
//
// The offline machine holds the mnemonic:
//   export-keys  write the public key export the online machine works from
//   sign         sign an unsigned bundle
//
// Bundles and key exports move between the machines as JSON files.

#include "address.hpp"
#include "bundle_builder.hpp"
#include "bundle_verifier.hpp"
#include "coin_selector.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "key_export.hpp"
#include "network.hpp"
#include "node_client.hpp"
#include "offline_signer.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace coldspend;

namespace {

constexpr auto USAGE =
    "usage: coldspend [--config <file>] [--network mainnet|testnet] <command> [args]\n"
    "\n"
    "commands:\n"
    "  address <export.json> <index>... [--hardened]\n"
    "  export-keys <mnemonic-file> <out.json> [--hardened <count>]\n"
    "  create <export.json> <out.json> --to <address> <amount> [--to <address> <amount>...] --fee <mojos>\n"
    "         [--scan-batch <count>]\n"
    "  sign <mnemonic-file> <in.json> <out.json>\n"
    "  verify <signed.json>\n"
    "  push <signed.json>\n";

uint64_t parse_u64(const std::string& text, const std::string& what) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw std::invalid_argument("Invalid " + what + ": " + text);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " out of range: " + text);
    }
}

uint32_t parse_u32(const std::string& text, const std::string& what) {
    auto value = parse_u64(text, what);
    if (value > UINT32_MAX) {
        throw std::invalid_argument(what + " out of range: " + text);
    }
    return static_cast<uint32_t>(value);
}

// Reads a mnemonic file, keeping only its first line
std::string read_mnemonic(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open mnemonic file: " + path);
    }
    std::string mnemonic;
    std::getline(file, mnemonic);
    return mnemonic;
}

void wipe(std::string& secret) {
    OPENSSL_cleanse(secret.data(), secret.size());
    secret.clear();
}

KeyExport load_keys(const std::string& path, const NetworkParams& network) {
    auto keys = KeyExport::load(path);
    if (keys.network() != network.address_prefix) {
        throw SpendError(SpendError::ErrorType::ConfigError,
            "Key export is for network '" + keys.network() + "', not '" + network.address_prefix + "'");
    }
    return keys;
}

void print_coins(const std::string& title, const std::vector<Coin>& coins, const std::string& prefix) {
    std::cout << title << std::endl;
    for (const auto& coin : coins) {
        std::cout << "   " << AddressCodec::encode_address(coin.puzzle_hash, prefix) << " " << coin.amount << std::endl;
    }
}

int cmd_address(const std::vector<std::string>& args, const NetworkParams& network) {
    bool hardened = std::find(args.begin(), args.end(), "--hardened") != args.end();
    std::vector<std::string> positional;
    std::copy_if(args.begin(), args.end(), std::back_inserter(positional),
                 [](const std::string& a) { return a != "--hardened"; });
    if (positional.size() < 2) {
        std::cerr << USAGE;
        return 1;
    }

    auto keys = load_keys(positional[0], network);
    for (size_t i = 1; i < positional.size(); ++i) {
        auto index = parse_u32(positional[i], "derivation index");
        bls::G1Element public_key;
        if (hardened) {
            auto key = keys.hardened_key(index);
            if (!key) {
                throw SpendError(SpendError::ErrorType::HardenedRequiresPrivateKey,
                    "Hardened address " + std::to_string(index) + " is not in the key export; "
                    "re-export with --hardened on the offline machine");
            }
            public_key = *key;
        } else {
            public_key = keys.address_key(index).key();
        }
        std::cout << KeyPath::wallet_address(index, hardened).to_string() << " "
                  << AddressCodec::encode_address(AddressCodec::puzzle_hash(public_key), network.address_prefix)
                  << std::endl;
    }
    return 0;
}

int cmd_export_keys(const std::vector<std::string>& args, const NetworkParams& network) {
    if (args.size() != 2 && !(args.size() == 4 && args[2] == "--hardened")) {
        std::cerr << USAGE;
        return 1;
    }
    uint32_t hardened = args.size() == 4 ? parse_u32(args[3], "hardened count") : 0;

    auto mnemonic = read_mnemonic(args[0]);
    auto signer = OfflineSigner::from_mnemonic(mnemonic, network);
    wipe(mnemonic);

    auto keys = signer.export_keys(hardened);
    keys.save(args[1]);

    std::cout << "Account public key: " << HexUtils::encode(keys.account().key().Serialize()) << std::endl;
    std::cout << "Fingerprint: " << keys.account().fingerprint() << std::endl;
    std::cout << "Wrote key export to " << args[1] << std::endl;
    return 0;
}

int cmd_create(const std::vector<std::string>& args, const NetworkParams& network) {
    if (args.size() < 2) {
        std::cerr << USAGE;
        return 1;
    }

    std::vector<Payment> outputs;
    std::optional<uint64_t> fee;
    uint32_t batch = 1000;
    for (size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--to" && i + 2 < args.size()) {
            outputs.push_back(Payment{
                AddressCodec::decode_address(args[i + 1], network.address_prefix),
                parse_u64(args[i + 2], "amount")
            });
            i += 2;
        } else if (args[i] == "--fee" && i + 1 < args.size()) {
            fee = parse_u64(args[++i], "fee");
        } else if (args[i] == "--scan-batch" && i + 1 < args.size()) {
            batch = parse_u32(args[++i], "scan batch");
        } else {
            std::cerr << "Unexpected argument: " << args[i] << std::endl << USAGE;
            return 1;
        }
    }
    if (outputs.empty() || !fee) {
        std::cerr << USAGE;
        return 1;
    }

    auto keys = load_keys(args[0], network);
    ChiaCliNode node(network.node_command);
    AddressScanner scanner(node, keys, batch);
    auto scan = scanner.scan();

    std::cout << "Scanned " << scan.scanned << " addresses, found " << scan.coins.size() << " unspent coins" << std::endl;

    auto change_key = keys.address_key(scan.next_unused_index);
    UnsignedBundleBuilder builder(network);
    auto envelope = builder.create(std::move(scan.coins), outputs, *fee,
                                   AddressCodec::puzzle_hash(change_key.key()));
    envelope.save(args[1]);

    std::cout << "Created unsigned bundle spending " << envelope.bundle.coin_spends.size()
              << " coins with fee " << envelope.bundle.fees() << " and cost " << envelope.metadata.cost << std::endl;
    print_coins("Outputs:", envelope.bundle.additions(), network.address_prefix);
    std::cout << "Wrote unsigned bundle to " << args[1] << std::endl;
    return 0;
}

int cmd_sign(const std::vector<std::string>& args, const NetworkParams& network) {
    if (args.size() != 3) {
        std::cerr << USAGE;
        return 1;
    }

    auto envelope = BundleEnvelope::load(args[1]);

    auto mnemonic = read_mnemonic(args[0]);
    auto signer = OfflineSigner::from_mnemonic(mnemonic, network);
    wipe(mnemonic);

    auto signed_bundle = signer.sign(envelope);
    signed_bundle.save(args[2]);

    std::cout << "Signed " << signed_bundle.bundle.coin_spends.size() << " coin spends with fee "
              << signed_bundle.metadata.fee << std::endl;
    print_coins("Outputs:", signed_bundle.bundle.additions(), network.address_prefix);
    std::cout << "Wrote signed bundle to " << args[2] << std::endl;
    return 0;
}

int cmd_verify(const std::vector<std::string>& args, const NetworkParams& network) {
    if (args.size() != 1) {
        std::cerr << USAGE;
        return 1;
    }

    auto envelope = BundleEnvelope::load(args[0]);
    auto summary = BundleVerifier(network).verify(envelope.bundle);

    std::cout << "Bundle is valid" << std::endl;
    std::cout << "Fee: " << summary.fee << std::endl;
    std::cout << "Cost: " << summary.cost << std::endl;
    print_coins("Spends:", summary.removals, network.address_prefix);
    print_coins("Creates:", summary.additions, network.address_prefix);
    return 0;
}

int cmd_push(const std::vector<std::string>& args, const NetworkParams& network) {
    if (args.size() != 1) {
        std::cerr << USAGE;
        return 1;
    }

    auto envelope = BundleEnvelope::load(args[0]);
    BundleVerifier(network).verify(envelope.bundle);

    ChiaCliNode node(network.node_command);
    std::cout << "Bundle accepted: " << node.submit(envelope.bundle) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        std::optional<std::string> config_path;
        std::optional<std::string> network_name;
        size_t pos = 0;
        while (pos < args.size() && args[pos].starts_with("--")) {
            if (args[pos] == "--config" && pos + 1 < args.size()) {
                config_path = args[pos + 1];
            } else if (args[pos] == "--network" && pos + 1 < args.size()) {
                network_name = args[pos + 1];
            } else {
                std::cerr << USAGE;
                return 1;
            }
            pos += 2;
        }
        if (pos >= args.size()) {
            std::cerr << USAGE;
            return 1;
        }

        auto network = config_path ? NetworkParams::load(*config_path, network_name)
                                   : NetworkParams::by_name(network_name.value_or("mainnet"));

        std::string command = args[pos];
        std::vector<std::string> rest(args.begin() + pos + 1, args.end());

        if (command == "address") return cmd_address(rest, network);
        if (command == "export-keys") return cmd_export_keys(rest, network);
        if (command == "create") return cmd_create(rest, network);
        if (command == "sign") return cmd_sign(rest, network);
        if (command == "verify") return cmd_verify(rest, network);
        if (command == "push") return cmd_push(rest, network);

        std::cerr << "Unknown command: " << command << std::endl << USAGE;
        return 1;
    } catch (const std::exception& e) {
        // Central error handling for all exceptions
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
