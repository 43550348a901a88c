#pragma once

#include <stdexcept>
#include <string>

namespace coldspend {

class SpendError : public std::runtime_error {
public:
    enum class ErrorType {
        InsufficientFunds,
        AmountOverflow,
        CostExceeded,
        InvalidPuzzleReveal,
        KeyPathMismatch,
        PartialBundle,
        DuplicateCoin,
        InvalidChecksum,
        UnknownPrefix,
        AggregationDegenerate,
        DerivationError,
        InvalidDerivationIndex,
        HardenedRequiresPrivateKey,
        InvalidMnemonic,
        InvalidEncoding,
        SigningMessageMismatch,
        FeeMismatch,
        BindingBroken,
        InvalidSignature,
        ConfigError,
        NodeError
    };

    SpendError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? std::string(name(type)) : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

    // Stable identifier for an error type, used in CLI output and tests
    static const char* name(ErrorType type) {
        switch (type) {
            case ErrorType::InsufficientFunds: return "InsufficientFunds";
            case ErrorType::AmountOverflow: return "AmountOverflow";
            case ErrorType::CostExceeded: return "CostExceeded";
            case ErrorType::InvalidPuzzleReveal: return "InvalidPuzzleReveal";
            case ErrorType::KeyPathMismatch: return "KeyPathMismatch";
            case ErrorType::PartialBundle: return "PartialBundle";
            case ErrorType::DuplicateCoin: return "DuplicateCoin";
            case ErrorType::InvalidChecksum: return "InvalidChecksum";
            case ErrorType::UnknownPrefix: return "UnknownPrefix";
            case ErrorType::AggregationDegenerate: return "AggregationDegenerate";
            case ErrorType::DerivationError: return "DerivationError";
            case ErrorType::InvalidDerivationIndex: return "InvalidDerivationIndex";
            case ErrorType::HardenedRequiresPrivateKey: return "HardenedRequiresPrivateKey";
            case ErrorType::InvalidMnemonic: return "InvalidMnemonic";
            case ErrorType::InvalidEncoding: return "InvalidEncoding";
            case ErrorType::SigningMessageMismatch: return "SigningMessageMismatch";
            case ErrorType::FeeMismatch: return "FeeMismatch";
            case ErrorType::BindingBroken: return "BindingBroken";
            case ErrorType::InvalidSignature: return "InvalidSignature";
            case ErrorType::ConfigError: return "ConfigError";
            case ErrorType::NodeError: return "NodeError";
        }
        return "Unknown";
    }

private:
    ErrorType type_;
};

} // namespace coldspend
