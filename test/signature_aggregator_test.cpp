#include "error.hpp"
#include "key_derivation.hpp"
#include "signature_aggregator.hpp"
#include "test_wallet.hpp"
#include "gtest/gtest.h"
#include <algorithm>

namespace coldspend {

    class SignatureAggregatorTest : public ::testing::Test {
    protected:
        std::vector<bls::PrivateKey> keys;
        std::vector<std::vector<uint8_t>> messages {{1, 2, 3}, {4, 5, 6}, {7}};

        void SetUp () override {
            auto seed = test_support::fixed_seed ();
            auto account = ExtendedPrivateKey::from_seed (seed.view ()).derive_path (KeyPath::wallet_account ());
            for (uint32_t i = 0; i < messages.size (); ++i) {
                keys.push_back (account.derive_child (i, false).secret ());
            }
        }

        std::vector<bls::G2Element> signatures () const {
            std::vector<bls::G2Element> out;
            for (size_t i = 0; i < keys.size (); ++i) {
                out.push_back (bls::AugSchemeMPL ().Sign (keys[i], messages[i]));
            }
            return out;
        }

        std::vector<bls::G1Element> public_keys () const {
            std::vector<bls::G1Element> out;
            for (const auto &key : keys) out.push_back (key.GetG1Element ());
            return out;
        }
    };

    TEST_F (SignatureAggregatorTest, AggregateVerifies) {
        auto aggregate = SignatureAggregator::aggregate_nonempty (signatures ());
        EXPECT_TRUE (SignatureAggregator::verify (public_keys (), messages, aggregate));

        auto other = messages;
        other[2] = {8};
        EXPECT_FALSE (SignatureAggregator::verify (public_keys (), other, aggregate));
    }

    TEST_F (SignatureAggregatorTest, OrderDoesNotMatter) {
        auto sigs = signatures ();
        auto forward = SignatureAggregator::aggregate (sigs);
        std::reverse (sigs.begin (), sigs.end ());
        EXPECT_EQ (SignatureAggregator::aggregate (sigs), forward);
    }

    TEST_F (SignatureAggregatorTest, SingleSignatureIsItself) {
        auto sigs = signatures ();
        EXPECT_EQ (SignatureAggregator::aggregate ({sigs[0]}), sigs[0]);
    }

    TEST_F (SignatureAggregatorTest, EmptyList) {
        EXPECT_EQ (SignatureAggregator::aggregate ({}), bls::G2Element ());

        try {
            SignatureAggregator::aggregate_nonempty ({});
            FAIL () << "aggregated nothing";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::AggregationDegenerate);
        }

        EXPECT_FALSE (SignatureAggregator::verify ({}, {}, bls::G2Element ()));
    }

    TEST_F (SignatureAggregatorTest, SizeMismatchDoesNotVerify) {
        auto aggregate = SignatureAggregator::aggregate (signatures ());
        auto fewer = messages;
        fewer.pop_back ();
        EXPECT_FALSE (SignatureAggregator::verify (public_keys (), fewer, aggregate));
    }

}
