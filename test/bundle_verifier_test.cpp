#include "bundle_builder.hpp"
#include "bundle_verifier.hpp"
#include "condition.hpp"
#include "cost.hpp"
#include "error.hpp"
#include "test_wallet.hpp"
#include "gtest/gtest.h"
#include <algorithm>

namespace coldspend {

    using test_support::filled;

    class BundleVerifierTest : public ::testing::Test {
    protected:
        test_support::TestWallet wallet;

        BundleEnvelope signed_bundle (uint64_t fee = 100) const {
            auto envelope = UnsignedBundleBuilder (wallet.network).create (
                {wallet.coin (0, 1000, 10, 0x01), wallet.coin (1, 500, 20, 0x02), wallet.coin (2, 300, 30, 0x03)},
                {{filled (0xaa), 1500}}, fee, wallet.address (9));
            return wallet.signer.sign (envelope);
        }

        SpendError::ErrorType verify_error (const SpendBundle &bundle, const NetworkParams &network) const {
            try {
                BundleVerifier (network).verify (bundle);
            } catch (const SpendError &e) {
                return e.type ();
            }
            ADD_FAILURE () << "bundle verified";
            return SpendError::ErrorType::AggregationDegenerate;
        }

        SpendError::ErrorType verify_error (const SpendBundle &bundle) const {
            return verify_error (bundle, wallet.network);
        }

        // Rewrites the lead spend's solution, keeping the rest of the bundle as signed
        static void edit_lead (SpendBundle &bundle, void (*edit) (std::vector<Condition> &)) {
            auto conditions = Conditions::decode (bundle.coin_spends[0].solution);
            edit (conditions);
            bundle.coin_spends[0].solution = Conditions::encode (conditions);
        }
    };

    TEST_F (BundleVerifierTest, ValidBundleSummary) {
        auto bundle = signed_bundle ().bundle;
        auto summary = BundleVerifier (wallet.network).verify (bundle);

        ASSERT_EQ (summary.removals.size (), 3u);
        EXPECT_EQ (summary.removals[0].amount, 1000u);
        ASSERT_EQ (summary.additions.size (), 2u);
        EXPECT_EQ (summary.additions[0].amount, 1500u);
        EXPECT_EQ (summary.additions[1].amount, 200u);
        EXPECT_EQ (summary.additions[1].puzzle_hash, wallet.address (9));
        EXPECT_EQ (summary.fee, 100u);
        EXPECT_EQ (summary.cost, CostValidator::bundle_cost (bundle.coin_spends));
    }

    TEST_F (BundleVerifierTest, RemovedSpendsBreakBinding) {
        auto bundle = signed_bundle ().bundle;

        auto without_lead = bundle;
        without_lead.coin_spends.erase (without_lead.coin_spends.begin ());
        EXPECT_EQ (verify_error (without_lead), SpendError::ErrorType::BindingBroken);

        auto without_follower = bundle;
        without_follower.coin_spends.pop_back ();
        EXPECT_EQ (verify_error (without_follower), SpendError::ErrorType::BindingBroken);
    }

    TEST_F (BundleVerifierTest, ReorderedSpendsBreakBinding) {
        auto bundle = signed_bundle ().bundle;

        auto swapped = bundle;
        std::swap (swapped.coin_spends[0], swapped.coin_spends[1]);
        EXPECT_EQ (verify_error (swapped), SpendError::ErrorType::BindingBroken);

        auto followers_swapped = bundle;
        std::swap (followers_swapped.coin_spends[1], followers_swapped.coin_spends[2]);
        EXPECT_EQ (verify_error (followers_swapped), SpendError::ErrorType::BindingBroken);
    }

    TEST_F (BundleVerifierTest, AddedSpendBreaksBinding) {
        auto bundle = signed_bundle ().bundle;
        auto other = UnsignedBundleBuilder (wallet.network).create (
            {wallet.coin (5, 700, 1, 0x09)}, {{filled (0xbb), 600}}, 0, wallet.address (9));

        bundle.coin_spends.push_back (other.bundle.coin_spends[0]);
        EXPECT_EQ (verify_error (bundle), SpendError::ErrorType::BindingBroken);
    }

    TEST_F (BundleVerifierTest, CoinSpentTwice) {
        auto bundle = signed_bundle ().bundle;
        bundle.coin_spends.push_back (bundle.coin_spends[1]);
        EXPECT_EQ (verify_error (bundle), SpendError::ErrorType::DuplicateCoin);
    }

    TEST_F (BundleVerifierTest, FeeReservedOnceAndCovered) {
        auto twice = signed_bundle ().bundle;
        edit_lead (twice, [] (std::vector<Condition> &conditions) {
            conditions.push_back (ReserveFee {1});
        });
        EXPECT_EQ (verify_error (twice), SpendError::ErrorType::FeeMismatch);

        auto uncovered = signed_bundle ().bundle;
        edit_lead (uncovered, [] (std::vector<Condition> &conditions) {
            for (auto &condition : conditions) {
                if (std::holds_alternative<ReserveFee> (condition)) condition = ReserveFee {101};
            }
        });
        EXPECT_EQ (verify_error (uncovered), SpendError::ErrorType::FeeMismatch);
    }

    TEST_F (BundleVerifierTest, ChangedSolutionInvalidatesSignature) {
        auto bundle = signed_bundle ().bundle;
        edit_lead (bundle, [] (std::vector<Condition> &conditions) {
            std::get<CreateCoin> (conditions[0]).puzzle_hash = filled (0xee);
        });
        EXPECT_EQ (verify_error (bundle), SpendError::ErrorType::InvalidSignature);
    }

    TEST_F (BundleVerifierTest, SignatureChecks) {
        auto unsigned_bundle = signed_bundle ().bundle;
        unsigned_bundle.aggregated_signature.reset ();
        EXPECT_EQ (verify_error (unsigned_bundle), SpendError::ErrorType::InvalidSignature);

        auto foreign = signed_bundle ().bundle;
        foreign.aggregated_signature = signed_bundle (50).bundle.aggregated_signature;
        EXPECT_EQ (verify_error (foreign), SpendError::ErrorType::InvalidSignature);

        // signed for testnet, checked against mainnet's additional data
        EXPECT_EQ (verify_error (signed_bundle ().bundle, NetworkParams::mainnet ()),
            SpendError::ErrorType::InvalidSignature);
    }

    TEST_F (BundleVerifierTest, CostAndEmptyBundle) {
        auto network = wallet.network;
        network.max_block_cost = 1000;
        EXPECT_EQ (verify_error (signed_bundle ().bundle, network), SpendError::ErrorType::CostExceeded);

        EXPECT_EQ (verify_error (SpendBundle {}), SpendError::ErrorType::AggregationDegenerate);
    }

    TEST_F (BundleVerifierTest, ForeignRevealRejected) {
        auto bundle = signed_bundle ().bundle;
        bundle.coin_spends[2].puzzle_reveal = bundle.coin_spends[1].puzzle_reveal;
        EXPECT_EQ (verify_error (bundle), SpendError::ErrorType::InvalidPuzzleReveal);
    }

}
