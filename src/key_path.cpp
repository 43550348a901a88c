#include "key_path.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace coldspend {

// Parses a textual derivation path.
//
// The format follows the usual HD wallet notation:
// - "m" represents the master key and may be omitted
// - "/" separates path components
// - a ' or h suffix marks a hardened step
//
// Hardened steps are flagged rather than offset by 2^31, so every 32-bit
// index is usable in both modes. Negative numbers, signs, empty components
// and values above 2^32 - 1 are rejected.
KeyPath KeyPath::parse(const std::string& text) {
    std::string path = text;
    if (path == "m" || path.empty()) {
        return KeyPath{};
    }
    if (path.starts_with("m/")) {
        path = path.substr(2);
    }

    std::vector<PathStep> steps;
    std::istringstream path_stream(path);
    std::string index_str;

    while (std::getline(path_stream, index_str, '/')) {
        bool hardened = index_str.ends_with('\'') || index_str.ends_with('h');
        if (hardened) {
            index_str.pop_back();
        }

        if (index_str.empty() || !std::all_of(index_str.begin(), index_str.end(),
                                              [](char c) { return c >= '0' && c <= '9'; })) {
            throw SpendError(SpendError::ErrorType::InvalidDerivationIndex,
                "Invalid derivation index '" + index_str + "' in path " + text);
        }

        unsigned long long index;
        try {
            index = std::stoull(index_str);
        } catch (const std::out_of_range&) {
            index = std::numeric_limits<unsigned long long>::max();
        }
        if (index > std::numeric_limits<uint32_t>::max()) {
            throw SpendError(SpendError::ErrorType::InvalidDerivationIndex,
                "Derivation index out of range in path " + text);
        }

        steps.push_back(PathStep{static_cast<uint32_t>(index), hardened});
    }

    if (path.ends_with('/')) {
        throw SpendError(SpendError::ErrorType::InvalidDerivationIndex, "Trailing separator in path " + text);
    }

    return KeyPath(std::move(steps));
}

KeyPath KeyPath::wallet_account() {
    return KeyPath({
        {PURPOSE_INDEX, true},
        {COIN_TYPE_INDEX, true},
        {WALLET_ACCOUNT_INDEX, true}
    });
}

KeyPath KeyPath::wallet_address(uint32_t index, bool hardened_leaf) {
    return wallet_account().child(index, hardened_leaf);
}

KeyPath KeyPath::child(uint32_t index, bool hardened) const {
    auto steps = steps_;
    steps.push_back(PathStep{index, hardened});
    return KeyPath(std::move(steps));
}

bool KeyPath::starts_with(const KeyPath& prefix) const {
    return prefix.steps_.size() <= steps_.size() &&
           std::equal(prefix.steps_.begin(), prefix.steps_.end(), steps_.begin());
}

KeyPath KeyPath::relative_to(const KeyPath& prefix) const {
    if (!starts_with(prefix)) {
        throw SpendError(SpendError::ErrorType::KeyPathMismatch,
            "Path " + to_string() + " is not below " + prefix.to_string());
    }
    return KeyPath(std::vector<PathStep>(steps_.begin() + prefix.steps_.size(), steps_.end()));
}

bool KeyPath::has_hardened_step() const {
    return std::any_of(steps_.begin(), steps_.end(), [](const PathStep& s) { return s.hardened; });
}

std::string KeyPath::to_string() const {
    std::string out = "m";
    for (const auto& step : steps_) {
        out += "/" + std::to_string(step.index);
        if (step.hardened) {
            out += "'";
        }
    }
    return out;
}

} // namespace coldspend
