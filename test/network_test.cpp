#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "network.hpp"
#include "gtest/gtest.h"
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace coldspend {

    class NetworkConfigTest : public ::testing::Test {
    protected:
        std::string path = (std::filesystem::temp_directory_path () / "coldspend_network_test.json").string ();

        void TearDown () override {
            std::remove (path.c_str ());
        }

        void write_config (const std::string &text) const {
            std::ofstream file (path);
            file << text;
        }

        SpendError::ErrorType load_error () const {
            try {
                NetworkParams::load (path);
            } catch (const SpendError &e) {
                return e.type ();
            }
            ADD_FAILURE () << "loaded " << path;
            return SpendError::ErrorType::InvalidEncoding;
        }
    };

    TEST (Network, BuiltIn) {
        auto mainnet = NetworkParams::by_name ("mainnet");
        EXPECT_EQ (mainnet.address_prefix, "xch");
        EXPECT_EQ (HexUtils::encode (mainnet.additional_data),
            "ccd5bb71183532bff220ba46c268991a3ff07eb358e8255a65c30a2dce0e5fbb");
        EXPECT_EQ (mainnet.max_block_cost, DEFAULT_MAX_BLOCK_COST);
        EXPECT_EQ (mainnet.node_command, "chia rpc full_node");

        auto testnet = NetworkParams::by_name ("testnet");
        EXPECT_EQ (testnet.address_prefix, "txch");
        EXPECT_NE (testnet.additional_data, mainnet.additional_data);

        try {
            NetworkParams::by_name ("regtest");
            FAIL () << "unknown network accepted";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::ConfigError);
        }
    }

    TEST (Network, ByPrefix) {
        ASSERT_TRUE (NetworkParams::by_prefix ("txch").has_value ());
        EXPECT_EQ (NetworkParams::by_prefix ("txch")->name, "testnet");
        EXPECT_EQ (NetworkParams::by_prefix ("xch")->name, "mainnet");
        EXPECT_FALSE (NetworkParams::by_prefix ("bc").has_value ());
        EXPECT_EQ (NetworkParams::known_prefixes (), std::vector<std::string> ({"xch", "txch"}));
    }

    TEST_F (NetworkConfigTest, Overrides) {
        write_config (R"({
            "network": "testnet",
            "max_block_cost": 5000000,
            "node_command": "chia --root-path /srv/chia rpc full_node"
        })");

        auto params = NetworkParams::load (path);
        EXPECT_EQ (params.name, "testnet");
        EXPECT_EQ (params.address_prefix, "txch");
        EXPECT_EQ (params.additional_data, NetworkParams::testnet ().additional_data);
        EXPECT_EQ (params.max_block_cost, 5000000u);
        EXPECT_EQ (params.node_command, "chia --root-path /srv/chia rpc full_node");

        // a network given on the command line wins over the file
        EXPECT_EQ (NetworkParams::load (path, "mainnet").address_prefix, "xch");
    }

    TEST_F (NetworkConfigTest, CustomAdditionalData) {
        write_config (R"({"additional_data": "0x0101010101010101010101010101010101010101010101010101010101010101"})");
        auto params = NetworkParams::load (path);
        EXPECT_EQ (params.name, "mainnet");
        Bytes32 expected;
        expected.fill (0x01);
        EXPECT_EQ (params.additional_data, expected);
    }

    TEST_F (NetworkConfigTest, MalformedConfig) {
        write_config ("{ not json");
        EXPECT_EQ (load_error (), SpendError::ErrorType::ConfigError);

        write_config (R"({"network": "regtest"})");
        EXPECT_EQ (load_error (), SpendError::ErrorType::ConfigError);

        write_config (R"({"additional_data": "0x0102"})");
        EXPECT_EQ (load_error (), SpendError::ErrorType::ConfigError);

        write_config (R"({"max_block_cost": "lots"})");
        EXPECT_EQ (load_error (), SpendError::ErrorType::ConfigError);

        write_config (R"({"address_prefix": "averyveryverylongaddressprefix0123"})");
        EXPECT_EQ (load_error (), SpendError::ErrorType::ConfigError);

        write_config (R"({"address_prefix": "TXCH"})");
        EXPECT_EQ (load_error (), SpendError::ErrorType::ConfigError);
    }

    TEST_F (NetworkConfigTest, MissingFile) {
        EXPECT_EQ (load_error (), SpendError::ErrorType::ConfigError);
    }

}
