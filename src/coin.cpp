#include "coin.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include <set>

namespace coldspend {

using json = nlohmann::json;

std::vector<uint8_t> amount_bytes(uint64_t amount) {
    std::vector<uint8_t> out;
    while (amount > 0) {
        out.insert(out.begin(), static_cast<uint8_t>(amount & 0xff));
        amount >>= 8;
    }
    // A set high bit would read back as negative
    if (!out.empty() && (out.front() & 0x80)) {
        out.insert(out.begin(), 0x00);
    }
    return out;
}

Bytes32 Coin::id() const {
    auto amount_be = amount_bytes(amount);
    return HashUtils::sha256({parent_coin_info, puzzle_hash, amount_be});
}

void require_distinct(const std::vector<Coin>& coins) {
    std::set<Bytes32> seen;
    for (const auto& coin : coins) {
        auto id = coin.id();
        if (!seen.insert(id).second) {
            throw SpendError(SpendError::ErrorType::DuplicateCoin,
                "Coin " + HexUtils::encode_prefixed(id) + " is spent more than once");
        }
    }
}

void to_json(json& j, const Coin& c) {
    j = json{
        {"parent_coin_info", HexUtils::encode_prefixed(c.parent_coin_info)},
        {"puzzle_hash", HexUtils::encode_prefixed(c.puzzle_hash)},
        {"amount", c.amount}
    };
}

void from_json(const json& j, Coin& c) {
    c.parent_coin_info = HexUtils::decode_fixed<32>(j.at("parent_coin_info").get<std::string>());
    c.puzzle_hash = HexUtils::decode_fixed<32>(j.at("puzzle_hash").get<std::string>());
    c.amount = j.at("amount").get<uint64_t>();
}

// Field names follow the full node's coin record JSON
void to_json(json& j, const CoinRecord& r) {
    j = json{
        {"coin", r.coin},
        {"confirmed_block_index", r.confirmed_block_index},
        {"spent_block_index", r.spent_block_index},
        {"spent", r.spent},
        {"coinbase", r.coinbase},
        {"timestamp", r.timestamp}
    };
}

void from_json(const json& j, CoinRecord& r) {
    j.at("coin").get_to(r.coin);
    r.confirmed_block_index = j.value("confirmed_block_index", 0u);
    r.spent_block_index = j.value("spent_block_index", 0u);
    r.spent = j.value("spent", false);
    r.coinbase = j.value("coinbase", false);
    r.timestamp = j.value("timestamp", uint64_t{0});
}

void to_json(json& j, const CoinSpend& s) {
    j = json{
        {"coin", s.coin},
        {"puzzle_reveal", HexUtils::encode_prefixed(s.puzzle_reveal)},
        {"solution", HexUtils::encode_prefixed(s.solution)}
    };
}

void from_json(const json& j, CoinSpend& s) {
    j.at("coin").get_to(s.coin);
    s.puzzle_reveal = HexUtils::decode(j.at("puzzle_reveal").get<std::string>());
    s.solution = HexUtils::decode(j.at("solution").get<std::string>());
}

} // namespace coldspend
