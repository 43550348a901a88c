#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace coldspend {

// Bech32m (BIP350) encoding of arbitrary byte payloads.
//
// Bech32m is a checksummed base32 format: a human-readable part, the separator '1',
// the payload in 5-bit groups and a 6-character checksum that detects any error
// affecting up to four characters.
class Bech32m {
public:
    struct Decoded {
        std::string hrp;
        std::vector<uint8_t> data;   // payload regrouped into 8-bit bytes
    };

    // Encodes 8-bit data under hrp
    // Throws SpendError(UnknownPrefix) for an empty or invalid hrp, or one that would make
    // the result longer than decode accepts
    static std::string encode(const std::string& hrp, std::span<const uint8_t> data);

    // Decodes and checks the checksum
    // Throws SpendError(InvalidChecksum) on mixed case, bad characters, bad length,
    // bad padding or a checksum mismatch
    static Decoded decode(const std::string& text);

private:
    Bech32m() = delete;
};

} // namespace coldspend
