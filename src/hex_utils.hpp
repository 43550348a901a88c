#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "error.hpp"

namespace coldspend {

class HexUtils {
public:
    // Convert a hexadecimal string (optionally 0x-prefixed) to a byte vector
    static std::vector<uint8_t> decode(const std::string& hex) {
        size_t start = hex.starts_with("0x") || hex.starts_with("0X") ? 2 : 0;
        if ((hex.length() - start) % 2 != 0) {
            throw SpendError(SpendError::ErrorType::InvalidEncoding, "Invalid hex string length");
        }

        std::vector<uint8_t> bytes;
        bytes.reserve((hex.length() - start) / 2);

        for (size_t i = start; i < hex.length(); i += 2) {
            int hi = nibble(hex[i]);
            int lo = nibble(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                throw SpendError(SpendError::ErrorType::InvalidEncoding, "Invalid hex character");
            }
            bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }

        return bytes;
    }

    // Decode into a fixed-size array, rejecting any other length
    template <size_t N>
    static std::array<uint8_t, N> decode_fixed(const std::string& hex) {
        auto bytes = decode(hex);
        if (bytes.size() != N) {
            throw SpendError(SpendError::ErrorType::InvalidEncoding,
                "Expected " + std::to_string(N) + " bytes, got " + std::to_string(bytes.size()));
        }
        std::array<uint8_t, N> out;
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return out;
    }

    // Convert bytes to a lowercase hexadecimal string
    static std::string encode(std::span<const uint8_t> data) {
        std::string result;
        result.reserve(data.size() * 2);

        static const char hex_chars[] = "0123456789abcdef";
        for (uint8_t byte : data) {
            result.push_back(hex_chars[byte >> 4]);
            result.push_back(hex_chars[byte & 0x0F]);
        }

        return result;
    }

    // Hex with the 0x prefix used by the exchange format
    static std::string encode_prefixed(std::span<const uint8_t> data) {
        return "0x" + encode(data);
    }

private:
    static int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

} // namespace coldspend
