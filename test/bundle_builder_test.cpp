#include "bundle_builder.hpp"
#include "condition.hpp"
#include "cost.hpp"
#include "error.hpp"
#include "puzzle.hpp"
#include "test_wallet.hpp"
#include "gtest/gtest.h"
#include <algorithm>

namespace coldspend {

    using test_support::filled;

    class BundleBuilderTest : public ::testing::Test {
    protected:
        test_support::TestWallet wallet;
        Bytes32 destination = filled (0xaa);
        Bytes32 change = wallet.address (7);

        UnsignedBundleBuilder builder () const {
            return UnsignedBundleBuilder (wallet.network);
        }

        std::vector<Condition> conditions_of (const CoinSpend &spend) const {
            return Conditions::decode (spend.solution);
        }
    };

    TEST_F (BundleBuilderTest, OutputChangeAndFee) {
        std::vector<SpendableCoin> candidates {
            wallet.coin (0, 1000, 10, 0x01),
            wallet.coin (1, 500, 20, 0x02)
        };

        auto envelope = builder ().create (candidates, {{destination, 1200}}, 100, change);
        const auto &spends = envelope.bundle.coin_spends;
        ASSERT_EQ (spends.size (), 2u);
        EXPECT_EQ (spends[0].coin.amount, 1000u);
        EXPECT_EQ (spends[1].coin.amount, 500u);

        auto additions = envelope.bundle.additions ();
        ASSERT_EQ (additions.size (), 2u);
        EXPECT_EQ (additions[0].puzzle_hash, destination);
        EXPECT_EQ (additions[0].amount, 1200u);
        EXPECT_EQ (additions[1].puzzle_hash, change);
        EXPECT_EQ (additions[1].amount, 200u);
        EXPECT_EQ (additions[0].parent_coin_info, spends[0].coin.id ());
        EXPECT_EQ (envelope.bundle.fees (), 100u);

        auto message = UnsignedBundleBuilder::announcement_message (envelope.bundle.removals ());
        auto lead = conditions_of (spends[0]);
        ASSERT_EQ (lead.size (), 4u);
        EXPECT_EQ (lead[2], Condition {ReserveFee {100}});
        EXPECT_EQ (lead[3], Condition {CreateCoinAnnouncement {std::vector<uint8_t> (message.begin (), message.end ())}});

        auto follower = conditions_of (spends[1]);
        ASSERT_EQ (follower.size (), 1u);
        EXPECT_EQ (follower[0], Condition {AssertCoinAnnouncement {Conditions::announcement_id (spends[0].coin.id (), message)}});

        EXPECT_EQ (envelope.metadata.fee, 100u);
        EXPECT_EQ (envelope.metadata.network, "txch");
        EXPECT_FALSE (envelope.is_signed ());
    }

    TEST_F (BundleBuilderTest, SigningRequests) {
        auto envelope = builder ().create ({wallet.coin (3, 1000, 1, 0x01), wallet.coin (4, 1000, 2, 0x02)},
                                           {{destination, 1500}}, 0, change);

        ASSERT_EQ (envelope.metadata.signing.size (), 2u);
        for (size_t i = 0; i < 2; ++i) {
            const auto &spend = envelope.bundle.coin_spends[i];
            const auto &request = envelope.metadata.signing[i];
            EXPECT_EQ (request.coin_id, spend.coin.id ());
            EXPECT_EQ (request.path, KeyPath::wallet_address (static_cast<uint32_t> (3 + i)));

            auto output = StandardPuzzle::run (spend.puzzle_reveal, spend.solution);
            const auto &agg_sig = std::get<AggSigMe> (output.conditions.back ());
            EXPECT_EQ (request.public_key, agg_sig.public_key);
            EXPECT_EQ (request.message, StandardPuzzle::signing_message (agg_sig, spend.coin.id (), wallet.network.additional_data));
        }
    }

    TEST_F (BundleBuilderTest, ExactAmountHasNoChange) {
        auto envelope = builder ().create ({wallet.coin (0, 1000, 1)}, {{destination, 900}}, 100, change);
        auto additions = envelope.bundle.additions ();
        ASSERT_EQ (additions.size (), 1u);
        EXPECT_EQ (additions[0].amount, 900u);
        EXPECT_EQ (envelope.bundle.fees (), 100u);
    }

    TEST_F (BundleBuilderTest, ZeroFeeIsStillReserved) {
        auto envelope = builder ().create ({wallet.coin (0, 1000, 1)}, {{destination, 400}}, 0, change);
        auto lead = conditions_of (envelope.bundle.coin_spends[0]);
        EXPECT_EQ (std::count (lead.begin (), lead.end (), Condition {ReserveFee {0}}), 1);
        EXPECT_EQ (envelope.bundle.fees (), 0u);
    }

    TEST_F (BundleBuilderTest, InsufficientFunds) {
        try {
            builder ().create ({}, {{destination, 1}}, 0, change);
            FAIL () << "built from no coins";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::InsufficientFunds);
        }

        try {
            builder ().build ({wallet.coin (0, 100, 1)}, {{destination, 100}}, 1, change);
            FAIL () << "built with outputs above inputs";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::InsufficientFunds);
        }
    }

    TEST_F (BundleBuilderTest, EmptyBundleIsDegenerate) {
        try {
            builder ().build ({}, {{destination, 1}}, 0, change);
            FAIL () << "built an empty bundle";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::AggregationDegenerate);
        }
    }

    TEST_F (BundleBuilderTest, CoinListedTwice) {
        auto coin = wallet.coin (0, 1000, 1);
        try {
            builder ().build ({coin, coin}, {{destination, 1500}}, 0, change);
            FAIL () << "built a bundle spending one coin twice";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::DuplicateCoin);
        }
    }

    TEST_F (BundleBuilderTest, KeyMustLockCoin) {
        auto coin = wallet.coin (0, 1000, 1);
        coin.public_key = wallet.keys.address_key (1).key ();

        try {
            builder ().build ({coin}, {{destination, 10}}, 0, change);
            FAIL () << "built with a key that does not lock the coin";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::InvalidPuzzleReveal);
        }
    }

    TEST_F (BundleBuilderTest, CostGrowsWithOutputsAndSpends) {
        auto one_output = builder ().build ({wallet.coin (0, 1000, 1)}, {{destination, 100}}, 0, change);
        auto two_outputs = builder ().build ({wallet.coin (0, 1000, 1)}, {{destination, 100}, {filled (0xbb), 100}}, 0, change);
        auto two_spends = builder ().build ({wallet.coin (0, 1000, 1), wallet.coin (1, 1000, 2, 0x02)},
                                            {{destination, 100}}, 0, change);

        EXPECT_GT (two_outputs.metadata.cost, one_output.metadata.cost);
        EXPECT_GT (two_spends.metadata.cost, one_output.metadata.cost);
        EXPECT_EQ (one_output.metadata.cost, CostValidator::bundle_cost (one_output.bundle.coin_spends));
    }

    TEST_F (BundleBuilderTest, CostLimit) {
        auto network = wallet.network;
        auto cost = builder ().build ({wallet.coin (0, 1000, 1)}, {{destination, 100}}, 0, change).metadata.cost;

        network.max_block_cost = cost;
        EXPECT_NO_THROW (UnsignedBundleBuilder (network).build ({wallet.coin (0, 1000, 1)}, {{destination, 100}}, 0, change));

        network.max_block_cost = cost - 1;
        try {
            UnsignedBundleBuilder (network).build ({wallet.coin (0, 1000, 1)}, {{destination, 100}}, 0, change);
            FAIL () << "over-cost bundle built";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::CostExceeded);
        }
    }

}
