#include "spend_bundle.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "puzzle.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace coldspend {

using json = nlohmann::json;

namespace {

uint64_t checked_add(uint64_t a, uint64_t b) {
    if (a > UINT64_MAX - b) {
        throw SpendError(SpendError::ErrorType::AmountOverflow, "Amount sum overflows 64 bits");
    }
    return a + b;
}

std::string encode_signature(const bls::G2Element& signature) {
    return HexUtils::encode_prefixed(signature.Serialize());
}

bls::G2Element decode_signature(const std::string& hex) {
    auto bytes = HexUtils::decode(hex);
    if (bytes.size() != SIGNATURE_SIZE) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, "Aggregated signature must be 96 bytes");
    }
    try {
        return bls::G2Element::FromByteVector(bytes);
    } catch (const std::invalid_argument& e) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding,
            std::string("Aggregated signature is not a G2 point: ") + e.what());
    }
}

} // namespace

void to_json(json& j, const SigningRequest& r) {
    j = json{
        {"coin_id", HexUtils::encode_prefixed(r.coin_id)},
        {"path", r.path.to_string()},
        {"public_key", HexUtils::encode_prefixed(r.public_key)},
        {"message", HexUtils::encode_prefixed(r.message)}
    };
}

void from_json(const json& j, SigningRequest& r) {
    r.coin_id = HexUtils::decode_fixed<32>(j.at("coin_id").get<std::string>());
    r.path = KeyPath::parse(j.at("path").get<std::string>());
    r.public_key = HexUtils::decode_fixed<PUBLIC_KEY_SIZE>(j.at("public_key").get<std::string>());
    r.message = HexUtils::decode(j.at("message").get<std::string>());
}

void to_json(json& j, const BundleMetadata& m) {
    j = json{
        {"fee", m.fee},
        {"network", m.network},
        {"cost", m.cost},
        {"signing", m.signing}
    };
}

void from_json(const json& j, BundleMetadata& m) {
    m.fee = j.at("fee").get<uint64_t>();
    m.network = j.at("network").get<std::string>();
    m.cost = j.at("cost").get<uint64_t>();
    m.signing = j.at("signing").get<std::vector<SigningRequest>>();
}

std::vector<Coin> SpendBundle::additions() const {
    std::vector<Coin> created;
    for (const auto& spend : coin_spends) {
        auto parent = spend.coin.id();
        for (const auto& condition : StandardPuzzle::run(spend.puzzle_reveal, spend.solution).conditions) {
            if (const auto* create = std::get_if<CreateCoin>(&condition)) {
                created.push_back(Coin{parent, create->puzzle_hash, create->amount});
            }
        }
    }
    return created;
}

std::vector<Coin> SpendBundle::removals() const {
    std::vector<Coin> spent;
    spent.reserve(coin_spends.size());
    for (const auto& spend : coin_spends) {
        spent.push_back(spend.coin);
    }
    return spent;
}

uint64_t SpendBundle::fees() const {
    uint64_t in = 0;
    for (const auto& coin : removals()) {
        in = checked_add(in, coin.amount);
    }
    uint64_t out = 0;
    for (const auto& coin : additions()) {
        out = checked_add(out, coin.amount);
    }
    if (out > in) {
        throw SpendError(SpendError::ErrorType::FeeMismatch,
            "Outputs " + std::to_string(out) + " exceed inputs " + std::to_string(in));
    }
    return in - out;
}

void to_json(json& j, const SpendBundle& b) {
    j = json{
        {"coin_spends", b.coin_spends},
        {"aggregated_signature", b.aggregated_signature ? json(encode_signature(*b.aggregated_signature)) : json(nullptr)}
    };
}

void from_json(const json& j, SpendBundle& b) {
    b.coin_spends = j.at("coin_spends").get<std::vector<CoinSpend>>();
    const auto& signature = j.at("aggregated_signature");
    if (signature.is_null()) {
        b.aggregated_signature.reset();
    } else {
        b.aggregated_signature = decode_signature(signature.get<std::string>());
    }
}

std::string BundleEnvelope::encode() const {
    json j = bundle;
    j["metadata"] = metadata;
    return j.dump(2);
}

BundleEnvelope BundleEnvelope::decode(const std::string& text) {
    try {
        json j = json::parse(text);
        BundleEnvelope envelope;
        envelope.bundle = j.get<SpendBundle>();
        envelope.metadata = j.at("metadata").get<BundleMetadata>();
        return envelope;
    } catch (const json::exception& e) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding,
            std::string("Malformed spend bundle document: ") + e.what());
    } catch (const SpendError& e) {
        if (e.type() == SpendError::ErrorType::InvalidEncoding) {
            throw;
        }
        throw SpendError(SpendError::ErrorType::InvalidEncoding,
            std::string("Malformed spend bundle document: ") + e.what());
    }
}

void BundleEnvelope::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << encode() << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

BundleEnvelope BundleEnvelope::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return decode(buffer.str());
}

json push_tx_request(const SpendBundle& bundle) {
    return json{{"spend_bundle", bundle}};
}

} // namespace coldspend
