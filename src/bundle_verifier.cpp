#include "bundle_verifier.hpp"
#include "bundle_builder.hpp"
#include "cost.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "puzzle.hpp"
#include "signature_aggregator.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace coldspend {

namespace {

struct EvaluatedSpend {
    Bytes32 coin_id;
    PuzzleOutput output;
};

template <typename T>
std::vector<const T*> conditions_of(const PuzzleOutput& output) {
    std::vector<const T*> found;
    for (const auto& condition : output.conditions) {
        if (const auto* c = std::get_if<T>(&condition)) {
            found.push_back(c);
        }
    }
    return found;
}

void check_binding(const std::vector<EvaluatedSpend>& evaluated, const Bytes32& digest) {
    const auto& lead = evaluated.front();
    auto lead_announcements = conditions_of<CreateCoinAnnouncement>(lead.output);
    if (lead_announcements.size() != 1 ||
        !std::equal(digest.begin(), digest.end(),
                    lead_announcements.front()->message.begin(), lead_announcements.front()->message.end())) {
        throw SpendError(SpendError::ErrorType::BindingBroken,
            "First spend does not announce the coin ids of this bundle");
    }

    std::set<Bytes32> announced;
    for (const auto& spend : evaluated) {
        for (const auto* announcement : conditions_of<CreateCoinAnnouncement>(spend.output)) {
            announced.insert(Conditions::announcement_id(spend.coin_id, announcement->message));
        }
    }

    auto expected = Conditions::announcement_id(lead.coin_id, digest);
    for (size_t i = 0; i < evaluated.size(); ++i) {
        auto asserts = conditions_of<AssertCoinAnnouncement>(evaluated[i].output);
        for (const auto* assertion : asserts) {
            if (!announced.contains(assertion->announcement_id)) {
                throw SpendError(SpendError::ErrorType::BindingBroken,
                    "Spend of coin " + HexUtils::encode_prefixed(evaluated[i].coin_id) +
                    " asserts an announcement no spend in the bundle makes");
            }
        }
        if (i > 0 && std::none_of(asserts.begin(), asserts.end(),
                                  [&](const AssertCoinAnnouncement* a) { return a->announcement_id == expected; })) {
            throw SpendError(SpendError::ErrorType::BindingBroken,
                "Spend of coin " + HexUtils::encode_prefixed(evaluated[i].coin_id) +
                " is not bound to the first spend");
        }
    }
}

} // namespace

BundleVerifier::BundleVerifier(NetworkParams network) : network_(std::move(network)) {}

BundleSummary BundleVerifier::verify(const SpendBundle& bundle) const {
    if (bundle.coin_spends.empty()) {
        throw SpendError(SpendError::ErrorType::AggregationDegenerate, "Bundle has no coin spends");
    }
    require_distinct(bundle.removals());

    BundleSummary summary;
    std::vector<EvaluatedSpend> evaluated;
    for (const auto& spend : bundle.coin_spends) {
        auto coin_id = spend.coin.id();
        if (StandardPuzzle::puzzle_hash(spend.puzzle_reveal) != spend.coin.puzzle_hash) {
            throw SpendError(SpendError::ErrorType::InvalidPuzzleReveal,
                "Puzzle reveal does not match the puzzle hash of coin " + HexUtils::encode_prefixed(coin_id));
        }
        evaluated.push_back(EvaluatedSpend{coin_id, StandardPuzzle::run(spend.puzzle_reveal, spend.solution)});
        summary.cost += evaluated.back().output.cost;
    }

    check_binding(evaluated, UnsignedBundleBuilder::announcement_message(bundle.removals()));

    std::vector<uint64_t> reserved;
    for (const auto& spend : evaluated) {
        for (const auto* fee : conditions_of<ReserveFee>(spend.output)) {
            reserved.push_back(fee->amount);
        }
    }
    if (reserved.size() != 1) {
        throw SpendError(SpendError::ErrorType::FeeMismatch,
            "Bundle reserves a fee " + std::to_string(reserved.size()) + " times, expected once");
    }
    summary.fee = reserved.front();
    auto available = bundle.fees();
    if (available < summary.fee) {
        throw SpendError(SpendError::ErrorType::FeeMismatch,
            "Inputs minus outputs is " + std::to_string(available) + ", less than the reserved fee " +
            std::to_string(summary.fee));
    }

    CostValidator::validate(summary.cost, network_.max_block_cost);

    if (!bundle.aggregated_signature) {
        throw SpendError(SpendError::ErrorType::InvalidSignature, "Bundle is not signed");
    }

    std::vector<bls::G1Element> public_keys;
    std::vector<std::vector<uint8_t>> messages;
    for (const auto& spend : evaluated) {
        for (const auto* agg_sig : conditions_of<AggSigMe>(spend.output)) {
            try {
                public_keys.push_back(bls::G1Element::FromByteVector(
                    std::vector<uint8_t>(agg_sig->public_key.begin(), agg_sig->public_key.end())));
            } catch (const std::invalid_argument& e) {
                throw SpendError(SpendError::ErrorType::InvalidSignature,
                    std::string("Puzzle checks a key that is not a G1 point: ") + e.what());
            }
            messages.push_back(StandardPuzzle::signing_message(*agg_sig, spend.coin_id, network_.additional_data));
        }
    }

    if (!SignatureAggregator::verify(public_keys, messages, *bundle.aggregated_signature)) {
        throw SpendError(SpendError::ErrorType::InvalidSignature, "Aggregated signature does not verify");
    }

    summary.removals = bundle.removals();
    summary.additions = bundle.additions();
    return summary;
}

} // namespace coldspend
