#include "coin_selector.hpp"
#include "error.hpp"
#include "puzzle.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <optional>
#include <set>

namespace coldspend {

namespace {

// Older coins first; ties broken by block then id so the order is total
bool older_first(const SpendableCoin& a, const SpendableCoin& b) {
    if (a.record.timestamp != b.record.timestamp) {
        return a.record.timestamp < b.record.timestamp;
    }
    if (a.record.confirmed_block_index != b.record.confirmed_block_index) {
        return a.record.confirmed_block_index < b.record.confirmed_block_index;
    }
    return a.record.coin.id() < b.record.coin.id();
}

struct AddressEntry {
    bls::G1Element public_key;
    KeyPath path;
    std::optional<uint32_t> unhardened_index;
};

} // namespace

uint64_t CoinSelector::required_amount(const std::vector<Payment>& outputs, uint64_t fee) {
    uint64_t required = fee;
    for (const auto& output : outputs) {
        if (output.amount > std::numeric_limits<uint64_t>::max() - required) {
            throw SpendError(SpendError::ErrorType::AmountOverflow, "Sum of outputs and fee overflows 64 bits");
        }
        required += output.amount;
    }
    return required;
}

Selection CoinSelector::select(std::vector<SpendableCoin> candidates, const std::vector<Payment>& outputs,
                               uint64_t fee) {
    Selection selection;
    selection.required = required_amount(outputs, fee);

    std::erase_if(candidates, [](const SpendableCoin& c) { return c.record.spent; });

    std::vector<Coin> unspent;
    unspent.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        unspent.push_back(candidate.record.coin);
    }
    require_distinct(unspent);

    std::sort(candidates.begin(), candidates.end(), older_first);

    for (auto& candidate : candidates) {
        if (selection.total >= selection.required && !selection.coins.empty()) {
            break;
        }
        if (candidate.record.coin.amount > std::numeric_limits<uint64_t>::max() - selection.total) {
            throw SpendError(SpendError::ErrorType::AmountOverflow, "Sum of selected coins overflows 64 bits");
        }
        selection.total += candidate.record.coin.amount;
        selection.coins.push_back(std::move(candidate));
    }

    if (selection.total < selection.required) {
        throw SpendError(SpendError::ErrorType::InsufficientFunds,
            "Not enough coins, total value " + std::to_string(selection.total) +
            ", need " + std::to_string(selection.required));
    }

    return selection;
}

AddressScanner::AddressScanner(FullNode& node, const KeyExport& keys, uint32_t batch_size)
    : node_(node), keys_(keys), batch_size_(batch_size == 0 ? 1 : batch_size) {}

ScanResult AddressScanner::scan() {
    if (!node_.is_synced()) {
        throw SpendError(SpendError::ErrorType::NodeError, "Full node is not synced. Wait for it to sync and try again.");
    }

    ScanResult result;
    std::set<uint32_t> used;

    auto collect = [&](const std::map<Bytes32, AddressEntry>& addresses) {
        std::vector<Bytes32> puzzle_hashes;
        puzzle_hashes.reserve(addresses.size());
        for (const auto& [puzzle_hash, entry] : addresses) {
            puzzle_hashes.push_back(puzzle_hash);
        }

        auto records = node_.get_coin_records_by_puzzle_hashes(puzzle_hashes, true);
        for (auto& record : records) {
            auto it = addresses.find(record.coin.puzzle_hash);
            if (it == addresses.end()) {
                continue;
            }
            if (it->second.unhardened_index) {
                used.insert(*it->second.unhardened_index);
            }
            if (!record.spent) {
                result.coins.push_back(SpendableCoin{std::move(record), it->second.public_key, it->second.path});
            }
        }
        return !records.empty();
    };

    if (!keys_.hardened_children().empty()) {
        std::map<Bytes32, AddressEntry> hardened;
        for (const auto& child : keys_.hardened_children()) {
            hardened.emplace(StandardPuzzle::puzzle_hash_for_pk(child.public_key),
                AddressEntry{child.public_key, KeyPath::wallet_address(child.index, true), std::nullopt});
        }
        collect(hardened);
    }

    uint64_t start = 0;
    constexpr uint64_t index_limit = uint64_t{std::numeric_limits<uint32_t>::max()} + 1;
    while (start < index_limit) {
        uint64_t end = std::min(start + batch_size_, index_limit);

        std::map<Bytes32, AddressEntry> batch;
        for (uint64_t i = start; i < end; ++i) {
            auto index = static_cast<uint32_t>(i);
            auto key = keys_.address_key(index);
            batch.emplace(StandardPuzzle::puzzle_hash_for_pk(key.key()),
                AddressEntry{key.key(), key.path(), index});
        }

        result.scanned += static_cast<uint32_t>(end - start);
        start = end;
        if (!collect(batch)) {
            break;
        }
    }

    uint32_t next = 0;
    while (used.contains(next)) {
        ++next;
    }
    result.next_unused_index = next;

    return result;
}

} // namespace coldspend
