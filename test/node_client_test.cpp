#include "bundle_builder.hpp"
#include "error.hpp"
#include "node_client.hpp"
#include "fake_node.hpp"
#include "test_wallet.hpp"
#include "gtest/gtest.h"

namespace coldspend {

    using test_support::filled;
    using json = nlohmann::json;

    class SubmitTest : public ::testing::Test {
    protected:
        test_support::TestWallet wallet;
        test_support::FakeNode node;

        SpendBundle signed_bundle () const {
            auto envelope = UnsignedBundleBuilder (wallet.network).create (
                {wallet.coin (0, 1000, 10, 0x01)}, {{filled (0xaa), 900}}, 10, wallet.address (2));
            return wallet.signer.sign (envelope).bundle;
        }
    };

    TEST_F (SubmitTest, Accepted) {
        auto bundle = signed_bundle ();
        EXPECT_EQ (node.submit (bundle), "SUCCESS");
        ASSERT_EQ (node.pushed.size (), 1u);
        EXPECT_EQ (node.pushed[0], bundle);
        EXPECT_EQ (node.queries, 0u);
    }

    TEST_F (SubmitTest, Rejected) {
        node.rejection = "DOUBLE_SPEND";

        try {
            node.submit (signed_bundle ());
            FAIL () << "rejected bundle reported as accepted";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::NodeError);
            EXPECT_NE (std::string (e.what ()).find ("DOUBLE_SPEND"), std::string::npos);
        }
        EXPECT_EQ (node.pushed.size (), 1u);
    }

    // sh prints its second argument, which is the request, so the node echoes what it was sent
    TEST (ChiaCliNode, RequestReachesCommandIntact) {
        ChiaCliNode node ("sh -c 'printf \"%s\" \"$2\"' sh");
        json request = {{"success", true}, {"note", "it's quoted"}};
        EXPECT_EQ (node.execute ("get_blockchain_state", request), request);
    }

    TEST (ChiaCliNode, FailedCommands) {
        ChiaCliNode silent ("sh -c 'exit 0' sh");
        EXPECT_THROW (silent.execute ("get_blockchain_state", json::object ()), SpendError);

        ChiaCliNode failing ("sh -c 'echo no such endpoint; exit 3' sh");
        try {
            failing.get_blockchain_state ();
            FAIL () << "failed command accepted";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::NodeError);
        }

        // the echoed request carries no success flag
        ChiaCliNode echo ("sh -c 'printf \"%s\" \"$2\"' sh");
        try {
            echo.get_blockchain_state ();
            FAIL () << "response without success accepted";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::NodeError);
        }
    }

}
