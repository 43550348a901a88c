#include "bundle_builder.hpp"
#include "cost.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "puzzle.hpp"
#include <algorithm>

namespace coldspend {

UnsignedBundleBuilder::UnsignedBundleBuilder(NetworkParams network) : network_(std::move(network)) {}

Bytes32 UnsignedBundleBuilder::announcement_message(const std::vector<Coin>& coins) {
    std::vector<uint8_t> ids;
    ids.reserve(coins.size() * HASH_SIZE);
    for (const auto& coin : coins) {
        auto id = coin.id();
        ids.insert(ids.end(), id.begin(), id.end());
    }
    return HashUtils::sha256(ids);
}

BundleEnvelope UnsignedBundleBuilder::build(const std::vector<SpendableCoin>& coins,
                                            const std::vector<Payment>& outputs,
                                            uint64_t fee, const Bytes32& change_puzzle_hash) const {
    if (coins.empty()) {
        throw SpendError(SpendError::ErrorType::AggregationDegenerate, "Cannot build a bundle with no coin spends");
    }

    uint64_t required = CoinSelector::required_amount(outputs, fee);
    uint64_t total = 0;
    std::vector<Coin> spent;
    std::vector<std::vector<uint8_t>> reveals;
    spent.reserve(coins.size());
    reveals.reserve(coins.size());

    for (const auto& candidate : coins) {
        const auto& coin = candidate.record.coin;
        auto reveal = StandardPuzzle::puzzle_for_pk(candidate.public_key);
        if (StandardPuzzle::puzzle_hash(reveal) != coin.puzzle_hash) {
            throw SpendError(SpendError::ErrorType::InvalidPuzzleReveal,
                "Key at " + candidate.path.to_string() + " does not lock coin " +
                HexUtils::encode_prefixed(coin.id()));
        }
        if (coin.amount > UINT64_MAX - total) {
            throw SpendError(SpendError::ErrorType::AmountOverflow, "Sum of selected coins overflows 64 bits");
        }
        total += coin.amount;
        spent.push_back(coin);
        reveals.push_back(std::move(reveal));
    }

    require_distinct(spent);
    if (total < required) {
        throw SpendError(SpendError::ErrorType::InsufficientFunds,
            "Not enough coins, total value " + std::to_string(total) + ", need " + std::to_string(required));
    }

    // Lead spend: outputs, change, fee and the announcement binding every spend to it
    auto message = announcement_message(spent);
    std::vector<Condition> lead;
    for (const auto& output : outputs) {
        lead.push_back(CreateCoin{output.puzzle_hash, output.amount});
    }
    if (total > required) {
        lead.push_back(CreateCoin{change_puzzle_hash, total - required});
    }
    lead.push_back(ReserveFee{fee});
    lead.push_back(CreateCoinAnnouncement{std::vector<uint8_t>(message.begin(), message.end())});

    auto lead_solution = Conditions::encode(lead);
    std::vector<Condition> follower{AssertCoinAnnouncement{Conditions::announcement_id(spent.front().id(), message)}};
    auto follower_solution = Conditions::encode(follower);

    BundleEnvelope envelope;
    envelope.metadata.fee = fee;
    envelope.metadata.network = network_.address_prefix;

    for (size_t i = 0; i < coins.size(); ++i) {
        CoinSpend spend{
            .coin = spent[i],
            .puzzle_reveal = std::move(reveals[i]),
            .solution = i == 0 ? lead_solution : follower_solution
        };

        auto output = StandardPuzzle::run(spend.puzzle_reveal, spend.solution);
        auto agg_sig = std::find_if(output.conditions.begin(), output.conditions.end(),
            [](const Condition& c) { return std::holds_alternative<AggSigMe>(c); });
        const auto& condition = std::get<AggSigMe>(*agg_sig);

        envelope.metadata.cost += output.cost;
        envelope.metadata.signing.push_back(SigningRequest{
            .coin_id = spend.coin.id(),
            .path = coins[i].path,
            .public_key = condition.public_key,
            .message = StandardPuzzle::signing_message(condition, spend.coin.id(), network_.additional_data)
        });
        envelope.bundle.coin_spends.push_back(std::move(spend));
    }

    CostValidator::validate(envelope.metadata.cost, network_.max_block_cost);
    return envelope;
}

BundleEnvelope UnsignedBundleBuilder::create(std::vector<SpendableCoin> candidates, const std::vector<Payment>& outputs,
                                             uint64_t fee, const Bytes32& change_puzzle_hash) const {
    auto selection = CoinSelector::select(std::move(candidates), outputs, fee);
    return build(selection.coins, outputs, fee, change_puzzle_hash);
}

} // namespace coldspend
