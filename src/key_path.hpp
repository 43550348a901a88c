#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace coldspend {

// One derivation step: an index and whether it is derived hardened
struct PathStep {
    uint32_t index;
    bool hardened;

    bool operator==(const PathStep&) const = default;
};

// Ordered list of derivation steps from the master key, written "m/12381'/8444'/2'/7"
class KeyPath {
public:
    KeyPath() = default;
    explicit KeyPath(std::vector<PathStep> steps) : steps_(std::move(steps)) {}

    // Parses "m/a/b'/c" or "m/a/bh/c"; the leading "m" is optional
    // Throws SpendError(InvalidDerivationIndex) for negative, non-numeric or out-of-range indices
    static KeyPath parse(const std::string& text);

    // The wallet account path m/12381'/8444'/2'
    static KeyPath wallet_account();

    // The wallet address path m/12381'/8444'/2'/index, with the leaf hardened if requested
    static KeyPath wallet_address(uint32_t index, bool hardened_leaf = false);

    KeyPath child(uint32_t index, bool hardened) const;

    // True if this path begins with every step of prefix
    bool starts_with(const KeyPath& prefix) const;

    // The steps that follow prefix; prefix must be a prefix of this path
    KeyPath relative_to(const KeyPath& prefix) const;

    bool has_hardened_step() const;

    const std::vector<PathStep>& steps() const { return steps_; }
    size_t depth() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }

    std::string to_string() const;

    bool operator==(const KeyPath&) const = default;

private:
    std::vector<PathStep> steps_;
};

} // namespace coldspend
