#include "offline_signer.hpp"
#include "cost.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "key_derivation.hpp"
#include "mnemonic.hpp"
#include "puzzle.hpp"
#include "signature_aggregator.hpp"
#include <algorithm>
#include <optional>

namespace coldspend {

namespace {

// What the puzzle demands for one spend, recomputed from the spend itself
struct CheckedSpend {
    Bytes32 coin_id;
    std::vector<uint8_t> message;
};

void add_amount(uint64_t& sum, uint64_t amount) {
    if (amount > UINT64_MAX - sum) {
        throw SpendError(SpendError::ErrorType::AmountOverflow, "Amount sum overflows 64 bits");
    }
    sum += amount;
}

} // namespace

OfflineSigner::OfflineSigner(SecureBytes seed, NetworkParams network)
    : seed_(std::move(seed)), network_(std::move(network)) {}

OfflineSigner OfflineSigner::from_mnemonic(const std::string& mnemonic, NetworkParams network,
                                           const std::string& passphrase) {
    return OfflineSigner(Mnemonic::to_seed(mnemonic, passphrase), std::move(network));
}

KeyExport OfflineSigner::export_keys(uint32_t hardened_count) const {
    auto master = ExtendedPrivateKey::from_seed(seed_.view());
    return KeyExport::from_master(master, network_.address_prefix, hardened_count);
}

BundleEnvelope OfflineSigner::sign(const BundleEnvelope& unsigned_bundle) const {
    const auto& spends = unsigned_bundle.bundle.coin_spends;
    const auto& requests = unsigned_bundle.metadata.signing;

    if (unsigned_bundle.metadata.network != network_.address_prefix) {
        throw SpendError(SpendError::ErrorType::ConfigError,
            "Bundle is for network '" + unsigned_bundle.metadata.network + "', signer is configured for '" +
            network_.address_prefix + "'");
    }
    if (spends.empty()) {
        throw SpendError(SpendError::ErrorType::AggregationDegenerate, "Bundle has no coin spends");
    }
    if (spends.size() != requests.size()) {
        throw SpendError(SpendError::ErrorType::PartialBundle,
            "Bundle has " + std::to_string(spends.size()) + " coin spends but " +
            std::to_string(requests.size()) + " signing requests");
    }

    require_distinct(unsigned_bundle.bundle.removals());

    // Pass 1: recompute everything the signatures will commit to
    std::vector<CheckedSpend> checked;
    checked.reserve(spends.size());
    uint64_t total_cost = 0;
    uint64_t inputs = 0;
    uint64_t outputs = 0;
    std::vector<uint64_t> reserved;

    for (size_t i = 0; i < spends.size(); ++i) {
        const auto& spend = spends[i];
        const auto& request = requests[i];
        auto coin_id = spend.coin.id();

        if (request.coin_id != coin_id) {
            throw SpendError(SpendError::ErrorType::PartialBundle,
                "Signing request " + std::to_string(i) + " is for coin " + HexUtils::encode_prefixed(request.coin_id) +
                ", spend is for " + HexUtils::encode_prefixed(coin_id));
        }
        if (StandardPuzzle::puzzle_hash(spend.puzzle_reveal) != spend.coin.puzzle_hash) {
            throw SpendError(SpendError::ErrorType::InvalidPuzzleReveal,
                "Puzzle reveal does not match the puzzle hash of coin " + HexUtils::encode_prefixed(coin_id));
        }

        auto output = StandardPuzzle::run(spend.puzzle_reveal, spend.solution);
        total_cost += output.cost;
        add_amount(inputs, spend.coin.amount);

        std::optional<CheckedSpend> demand;
        for (const auto& condition : output.conditions) {
            if (const auto* create = std::get_if<CreateCoin>(&condition)) {
                add_amount(outputs, create->amount);
            } else if (const auto* fee = std::get_if<ReserveFee>(&condition)) {
                reserved.push_back(fee->amount);
            } else if (const auto* agg_sig = std::get_if<AggSigMe>(&condition)) {
                if (agg_sig->public_key != request.public_key) {
                    throw SpendError(SpendError::ErrorType::SigningMessageMismatch,
                        "Signing request for coin " + HexUtils::encode_prefixed(coin_id) +
                        " names a key the puzzle does not check");
                }
                demand = CheckedSpend{coin_id,
                    StandardPuzzle::signing_message(*agg_sig, coin_id, network_.additional_data)};
            }
        }

        if (!demand || demand->message != request.message) {
            throw SpendError(SpendError::ErrorType::SigningMessageMismatch,
                "Message to sign for coin " + HexUtils::encode_prefixed(coin_id) +
                " differs from the message its puzzle requires");
        }
        checked.push_back(std::move(*demand));
    }

    if (reserved.size() != 1 || reserved.front() != unsigned_bundle.metadata.fee) {
        throw SpendError(SpendError::ErrorType::FeeMismatch,
            "Bundle must reserve exactly the declared fee of " + std::to_string(unsigned_bundle.metadata.fee));
    }
    // Anything left over beyond the declared fee would also go to the farmer
    if (outputs > inputs || inputs - outputs != unsigned_bundle.metadata.fee) {
        throw SpendError(SpendError::ErrorType::FeeMismatch,
            "Inputs " + std::to_string(inputs) + " minus outputs " + std::to_string(outputs) +
            " is not the declared fee of " + std::to_string(unsigned_bundle.metadata.fee));
    }
    CostValidator::validate(total_cost, network_.max_block_cost);

    // Pass 2: derive each key, confirm it locks the coin, sign
    auto master = ExtendedPrivateKey::from_seed(seed_.view());
    auto account = master.derive_path(KeyPath::wallet_account());

    std::vector<bls::G2Element> signatures;
    std::vector<bls::G1Element> public_keys;
    std::vector<std::vector<uint8_t>> messages;

    for (size_t i = 0; i < spends.size(); ++i) {
        const auto& path = requests[i].path;
        const ExtendedPrivateKey& base = path.starts_with(account.path()) ? account : master;

        std::optional<ExtendedPrivateKey> key;
        key.emplace(base.derive_path(path.relative_to(base.path())));
        auto synthetic = StandardPuzzle::synthetic_secret_key(key->secret());
        key.reset();

        auto synthetic_pk = synthetic.GetG1Element();
        if (StandardPuzzle::puzzle_hash(StandardPuzzle::puzzle_for_synthetic_pk(synthetic_pk)) !=
            spends[i].coin.puzzle_hash) {
            throw SpendError(SpendError::ErrorType::KeyPathMismatch,
                "Key at " + path.to_string() + " does not lock coin " + HexUtils::encode_prefixed(checked[i].coin_id));
        }

        signatures.push_back(bls::AugSchemeMPL().Sign(synthetic, checked[i].message));
        public_keys.push_back(synthetic_pk);
        messages.push_back(checked[i].message);
    }

    auto aggregate = SignatureAggregator::aggregate_nonempty(signatures);
    if (!SignatureAggregator::verify(public_keys, messages, aggregate)) {
        throw SpendError(SpendError::ErrorType::InvalidSignature, "Aggregated signature failed verification");
    }

    BundleEnvelope signed_bundle = unsigned_bundle;
    signed_bundle.bundle.aggregated_signature = aggregate;
    return signed_bundle;
}

} // namespace coldspend
