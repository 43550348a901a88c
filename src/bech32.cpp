#include "bech32.hpp"
#include "error.hpp"
#include <array>
#include <cctype>

namespace coldspend {

namespace {

constexpr char CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr uint32_t BECH32M_CONST = 0x2bc830a3;
constexpr size_t CHECKSUM_LENGTH = 6;
constexpr size_t MAX_LENGTH = 90;

int charset_index(char c) {
    for (int i = 0; i < 32; ++i) {
        if (CHARSET[i] == c) {
            return i;
        }
    }
    return -1;
}

uint32_t polymod(const std::vector<uint8_t>& values) {
    static const std::array<uint32_t, 5> GENERATOR = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
    };
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = static_cast<uint8_t>(chk >> 25);
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) {
                chk ^= GENERATOR[i];
            }
        }
    }
    return chk;
}

// hrp expanded as high bits, a zero separator, then low bits
std::vector<uint8_t> hrp_expand(const std::string& hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) >> 5);
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) & 0x1f);
    }
    return ret;
}

// Regroups bits; with pad false the leftover bits must be zero padding of less than one input group
bool convert_bits(std::vector<uint8_t>& out, int from_bits, int to_bits, bool pad,
                  std::span<const uint8_t> data) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    for (uint8_t value : data) {
        if (value >> from_bits) {
            return false;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
        return false;
    }
    return true;
}

bool valid_hrp(const std::string& hrp) {
    if (hrp.empty() || hrp.size() > 83) {
        return false;
    }
    for (char c : hrp) {
        if (c < 33 || c > 126 || std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string Bech32m::encode(const std::string& hrp, std::span<const uint8_t> data) {
    if (!valid_hrp(hrp)) {
        throw SpendError(SpendError::ErrorType::UnknownPrefix, "Invalid address prefix '" + hrp + "'");
    }

    std::vector<uint8_t> values;
    if (!convert_bits(values, 8, 5, true, data)) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, "Cannot regroup address payload");
    }
    if (hrp.size() + 1 + values.size() + CHECKSUM_LENGTH > MAX_LENGTH) {
        throw SpendError(SpendError::ErrorType::UnknownPrefix,
            "Address prefix '" + hrp + "' is too long for a " + std::to_string(data.size()) + " byte payload");
    }

    auto checksum_input = hrp_expand(hrp);
    checksum_input.insert(checksum_input.end(), values.begin(), values.end());
    checksum_input.insert(checksum_input.end(), CHECKSUM_LENGTH, 0);
    uint32_t mod = polymod(checksum_input) ^ BECH32M_CONST;

    std::string result = hrp + '1';
    result.reserve(result.size() + values.size() + CHECKSUM_LENGTH);
    for (uint8_t v : values) {
        result += CHARSET[v];
    }
    for (size_t i = 0; i < CHECKSUM_LENGTH; ++i) {
        result += CHARSET[(mod >> (5 * (5 - i))) & 31];
    }
    return result;
}

Bech32m::Decoded Bech32m::decode(const std::string& text) {
    auto fail = [&text](const std::string& why) {
        return SpendError(SpendError::ErrorType::InvalidChecksum, "Invalid address '" + text + "': " + why);
    };

    if (text.size() > MAX_LENGTH) {
        throw fail("too long");
    }

    bool has_lower = false;
    bool has_upper = false;
    for (char c : text) {
        if (c < 33 || c > 126) {
            throw fail("invalid character");
        }
        has_lower |= (c >= 'a' && c <= 'z');
        has_upper |= (c >= 'A' && c <= 'Z');
    }
    if (has_lower && has_upper) {
        throw fail("mixed case");
    }

    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    size_t separator = lowered.rfind('1');
    if (separator == std::string::npos || separator == 0 || separator + 1 + CHECKSUM_LENGTH > lowered.size()) {
        throw fail("missing separator or checksum");
    }

    Decoded decoded;
    decoded.hrp = lowered.substr(0, separator);

    std::vector<uint8_t> values;
    for (size_t i = separator + 1; i < lowered.size(); ++i) {
        int v = charset_index(lowered[i]);
        if (v < 0) {
            throw fail("invalid data character");
        }
        values.push_back(static_cast<uint8_t>(v));
    }

    auto checksum_input = hrp_expand(decoded.hrp);
    checksum_input.insert(checksum_input.end(), values.begin(), values.end());
    if (polymod(checksum_input) != BECH32M_CONST) {
        throw fail("checksum mismatch");
    }

    values.resize(values.size() - CHECKSUM_LENGTH);
    if (!convert_bits(decoded.data, 5, 8, false, values)) {
        throw fail("invalid padding");
    }
    return decoded;
}

} // namespace coldspend
