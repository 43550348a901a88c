#include "address.hpp"
#include "bech32.hpp"
#include "coin.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "test_wallet.hpp"
#include "gtest/gtest.h"
#include <cctype>

namespace coldspend {

    using test_support::filled;

    SpendError::ErrorType decode_error (const std::string &address) {
        try {
            AddressCodec::decode_address (address);
        } catch (const SpendError &e) {
            return e.type ();
        }
        ADD_FAILURE () << "decoded " << address;
        return SpendError::ErrorType::InvalidEncoding;
    }

    TEST (Bech32m, ReferenceVectors) {
        auto empty = Bech32m::decode ("a1lqfn3a");
        EXPECT_EQ (empty.hrp, "a");
        EXPECT_TRUE (empty.data.empty ());

        EXPECT_EQ (Bech32m::decode ("A1LQFN3A").hrp, "a");
        EXPECT_EQ (Bech32m::decode ("abcdef1l7aum6echk45nj3s0wdvt2fg8x9yrzpqzd3ryx").data.size (), 20u);
    }

    TEST (Address, KnownEncoding) {
        EXPECT_EQ (AddressCodec::encode_address (filled (0), "xch"),
            "xch1qqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqq2u30kz");

        Bytes32 counting;
        for (size_t i = 0; i < counting.size (); ++i) counting[i] = static_cast<uint8_t> (i);
        EXPECT_EQ (AddressCodec::encode_address (counting, "txch"),
            "txch1qqqsyqcyq5rqwzqfpg9scrgwpugpzysnzs23v9ccrydpk8qarc0sw0amhg");
    }

    TEST (Address, RoundTripBothNetworks) {
        test_support::TestWallet wallet;
        auto puzzle_hash = wallet.address (4);

        for (const std::string prefix : {"xch", "txch"}) {
            auto address = AddressCodec::encode_address (puzzle_hash, prefix);
            auto decoded = AddressCodec::decode_address (address);
            EXPECT_EQ (decoded.puzzle_hash, puzzle_hash);
            EXPECT_EQ (decoded.prefix, prefix);
            EXPECT_EQ (AddressCodec::decode_address (address, prefix), puzzle_hash);
        }
    }

    TEST (Address, FlippedCharacterFailsChecksum) {
        auto address = AddressCodec::encode_address (filled (0x5a), "xch");
        for (size_t i = 4; i < address.size (); ++i) {
            auto corrupted = address;
            corrupted[i] = corrupted[i] == 'q' ? 'p' : 'q';
            EXPECT_EQ (decode_error (corrupted), SpendError::ErrorType::InvalidChecksum) << i;
        }
    }

    TEST (Address, MalformedInput) {
        auto address = AddressCodec::encode_address (filled (0x5a), "xch");

        auto mixed = address;
        mixed[5] = static_cast<char> (std::toupper (mixed[5]));
        if (mixed != address) EXPECT_EQ (decode_error (mixed), SpendError::ErrorType::InvalidChecksum);

        EXPECT_EQ (decode_error (address.substr (0, address.size () - 1)), SpendError::ErrorType::InvalidChecksum);
        EXPECT_EQ (decode_error ("xch1b" + address.substr (4)), SpendError::ErrorType::InvalidChecksum);
        EXPECT_EQ (decode_error ("xchqqqqqq"), SpendError::ErrorType::InvalidChecksum);

        // valid bech32m, but a 20-byte payload
        EXPECT_EQ (decode_error (Bech32m::encode ("xch", std::vector<uint8_t> (20, 7))),
            SpendError::ErrorType::InvalidChecksum);
    }

    TEST (Address, UnknownPrefix) {
        auto address = AddressCodec::encode_address (filled (0x11), "btc");
        EXPECT_EQ (decode_error (address), SpendError::ErrorType::UnknownPrefix);

        auto testnet = AddressCodec::encode_address (filled (0x11), "txch");
        try {
            AddressCodec::decode_address (testnet, "xch");
            FAIL () << "accepted a testnet address on mainnet";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::UnknownPrefix);
        }
    }

    TEST (Address, PrefixLength) {
        std::string longest (31, 'x');
        auto address = AddressCodec::encode_address (filled (0x11), longest);
        EXPECT_EQ (address.size (), 90u);
        EXPECT_EQ (Bech32m::decode (address).hrp, longest);

        try {
            AddressCodec::encode_address (filled (0x11), std::string (35, 'x'));
            FAIL () << "encoded an address too long to decode";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::UnknownPrefix);
        }
    }

    TEST (Coin, IdOfKnownCoin) {
        Coin coin {filled (1), filled (2), 1000};
        EXPECT_EQ (HexUtils::encode (coin.id ()), "aad58c47f39d4490b13c9e1eb3908a4818c57a8fdac68357da0a4673e69ccce9");

        coin.amount = 0;
        EXPECT_EQ (HexUtils::encode (coin.id ()), "f818afd37a6dc3bc92fb44731011277006db4efa6e9023cd7468c02335d22a4d");

        coin.amount = UINT64_MAX;
        EXPECT_EQ (HexUtils::encode (coin.id ()), "7a642bfb87dd7820f538e9a8c105a0e33be4d13bfdf9ef87ed95887e4f25e811");
    }

    TEST (Coin, AmountBytes) {
        EXPECT_TRUE (amount_bytes (0).empty ());
        EXPECT_EQ (amount_bytes (1), std::vector<uint8_t> ({0x01}));
        EXPECT_EQ (amount_bytes (128), std::vector<uint8_t> ({0x00, 0x80}));
        EXPECT_EQ (amount_bytes (1000), std::vector<uint8_t> ({0x03, 0xe8}));
    }

}
