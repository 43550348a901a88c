#include "key_export.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace coldspend {

using json = nlohmann::json;

namespace {

bls::G1Element parse_public_key(const std::string& hex) {
    auto bytes = HexUtils::decode(hex);
    if (bytes.size() != PUBLIC_KEY_SIZE) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, "Public key must be 48 bytes");
    }
    try {
        return bls::G1Element::FromByteVector(bytes);
    } catch (const std::invalid_argument& e) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding,
            std::string("Public key is not a G1 point: ") + e.what());
    }
}

} // namespace

KeyExport::KeyExport(std::string network, ExtendedPublicKey account, std::vector<HardenedChild> hardened_children)
    : network_(std::move(network)), account_(std::move(account)), hardened_children_(std::move(hardened_children)) {}

KeyExport KeyExport::from_master(const ExtendedPrivateKey& master, const std::string& network,
                                 uint32_t hardened_count) {
    auto account = master.derive_path(KeyPath::wallet_account());

    std::vector<HardenedChild> hardened;
    hardened.reserve(hardened_count);
    for (uint32_t i = 0; i < hardened_count; ++i) {
        auto child = account.derive_child(i, true);
        hardened.push_back(HardenedChild{i, child.secret().GetG1Element()});
    }

    return KeyExport(network, account.public_key(), std::move(hardened));
}

ExtendedPublicKey KeyExport::address_key(uint32_t index) const {
    return account_.derive_child(index, false);
}

std::optional<bls::G1Element> KeyExport::hardened_key(uint32_t index) const {
    for (const auto& child : hardened_children_) {
        if (child.index == index) {
            return child.public_key;
        }
    }
    return std::nullopt;
}

std::string KeyExport::encode() const {
    json children = json::array();
    for (const auto& child : hardened_children_) {
        children.push_back({
            {"index", child.index},
            {"public_key", HexUtils::encode_prefixed(child.public_key.Serialize())}
        });
    }

    json j = {
        {"network", network_},
        {"path", account_.path().to_string()},
        {"public_key", HexUtils::encode_prefixed(account_.key().Serialize())},
        {"chain_code", HexUtils::encode_prefixed(account_.chain_code())},
        {"hardened_children", children}
    };
    return j.dump(2);
}

KeyExport KeyExport::decode(const std::string& text) {
    try {
        json j = json::parse(text);

        ExtendedPublicKey account(
            parse_public_key(j.at("public_key").get<std::string>()),
            HexUtils::decode_fixed<CHAIN_CODE_SIZE>(j.at("chain_code").get<std::string>()),
            KeyPath::parse(j.at("path").get<std::string>()));

        std::vector<HardenedChild> hardened;
        for (const auto& child : j.value("hardened_children", json::array())) {
            hardened.push_back(HardenedChild{
                child.at("index").get<uint32_t>(),
                parse_public_key(child.at("public_key").get<std::string>())
            });
        }

        return KeyExport(j.at("network").get<std::string>(), std::move(account), std::move(hardened));
    } catch (const json::exception& e) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, std::string("Malformed key export: ") + e.what());
    } catch (const SpendError& e) {
        if (e.type() == SpendError::ErrorType::InvalidEncoding) {
            throw;
        }
        throw SpendError(SpendError::ErrorType::InvalidEncoding, std::string("Malformed key export: ") + e.what());
    }
}

void KeyExport::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << encode() << "\n";
}

KeyExport KeyExport::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return decode(buffer.str());
}

} // namespace coldspend
