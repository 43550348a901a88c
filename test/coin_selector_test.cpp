#include "coin_selector.hpp"
#include "error.hpp"
#include "puzzle.hpp"
#include "fake_node.hpp"
#include "test_wallet.hpp"
#include "gtest/gtest.h"

namespace coldspend {

    using test_support::filled;

    TEST (CoinSelector, OldestFirst) {
        test_support::TestWallet wallet;
        std::vector<SpendableCoin> candidates {
            wallet.coin (0, 500, 30, 0x01),
            wallet.coin (1, 1000, 10, 0x02),
            wallet.coin (2, 300, 20, 0x03)
        };

        auto selection = CoinSelector::select (candidates, {{filled (0xaa), 1200}}, 0);
        ASSERT_EQ (selection.coins.size (), 2u);
        EXPECT_EQ (selection.coins[0].record.coin.amount, 1000u);
        EXPECT_EQ (selection.coins[1].record.coin.amount, 300u);
        EXPECT_EQ (selection.total, 1300u);
        EXPECT_EQ (selection.required, 1200u);
        EXPECT_EQ (selection.total - selection.required, 100u);
    }

    TEST (CoinSelector, TiesBrokenByBlockThenId) {
        test_support::TestWallet wallet;
        auto a = wallet.coin (0, 10, 50, 0x01);
        auto b = wallet.coin (1, 10, 50, 0x02);
        a.record.confirmed_block_index = 9;
        b.record.confirmed_block_index = 8;

        auto selection = CoinSelector::select ({a, b}, {{filled (0xaa), 5}}, 0);
        ASSERT_EQ (selection.coins.size (), 1u);
        EXPECT_EQ (selection.coins[0].record.coin, b.record.coin);

        b.record.confirmed_block_index = 9;
        auto first = a.record.coin.id () < b.record.coin.id () ? a : b;
        selection = CoinSelector::select ({b, a}, {{filled (0xaa), 5}}, 0);
        EXPECT_EQ (selection.coins[0].record.coin, first.record.coin);
    }

    TEST (CoinSelector, SkipsSpentCoins) {
        test_support::TestWallet wallet;
        auto spent = wallet.coin (0, 5000, 1, 0x01);
        spent.record.spent = true;
        auto unspent = wallet.coin (1, 800, 2, 0x02);

        auto selection = CoinSelector::select ({spent, unspent}, {{filled (0xaa), 700}}, 50);
        ASSERT_EQ (selection.coins.size (), 1u);
        EXPECT_EQ (selection.coins[0].record.coin, unspent.record.coin);
    }

    TEST (CoinSelector, CandidateListedTwice) {
        test_support::TestWallet wallet;
        auto coin = wallet.coin (0, 1000, 1);

        try {
            CoinSelector::select ({coin, coin}, {{filled (0xaa), 1500}}, 0);
            FAIL () << "selected one coin twice";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::DuplicateCoin);
        }

        // a spent record of the same coin is dropped before the check
        auto spent = coin;
        spent.record.spent = true;
        auto selection = CoinSelector::select ({spent, coin}, {{filled (0xaa), 500}}, 0);
        EXPECT_EQ (selection.coins.size (), 1u);
    }

    TEST (CoinSelector, InsufficientFunds) {
        test_support::TestWallet wallet;

        try {
            CoinSelector::select ({}, {{filled (0xaa), 1}}, 0);
            FAIL () << "selected from nothing";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::InsufficientFunds);
        }

        try {
            CoinSelector::select ({wallet.coin (0, 1000, 1), wallet.coin (1, 500, 2, 0x02)}, {{filled (0xaa), 1450}}, 100);
            FAIL () << "selected 1500 for 1550";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::InsufficientFunds);
        }
    }

    TEST (CoinSelector, AmountOverflow) {
        try {
            CoinSelector::required_amount ({{filled (0xaa), UINT64_MAX}, {filled (0xbb), 1}}, 0);
            FAIL () << "overflow not detected";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::AmountOverflow);
        }
        EXPECT_THROW (CoinSelector::required_amount ({{filled (0xaa), UINT64_MAX}}, 1), SpendError);
        EXPECT_EQ (CoinSelector::required_amount ({{filled (0xaa), 1200}}, 100), 1300u);
    }

    TEST (AddressScanner, FindsCoinsAndNextUnusedIndex) {
        test_support::TestWallet wallet;
        test_support::FakeNode node;

        auto spent = wallet.coin (0, 100, 1, 0x01);
        spent.record.spent = true;
        node.records.push_back (spent.record);
        node.records.push_back (wallet.coin (2, 200, 2, 0x02).record);
        node.records.push_back (wallet.coin (15, 300, 3, 0x03).record);

        auto hardened_key = *wallet.keys.hardened_key (1);
        node.records.push_back (CoinRecord {
            .coin = Coin {filled (0x04), StandardPuzzle::puzzle_hash_for_pk (hardened_key), 400},
            .timestamp = 4
        });

        // not ours
        node.records.push_back (CoinRecord {.coin = Coin {filled (0x05), filled (0x77), 999}});

        AddressScanner scanner (node, wallet.keys, 10);
        auto result = scanner.scan ();

        EXPECT_EQ (result.scanned, 30u);
        EXPECT_EQ (result.next_unused_index, 1u);
        ASSERT_EQ (result.coins.size (), 3u);

        uint64_t total = 0;
        for (const auto &coin : result.coins) {
            total += coin.record.coin.amount;
            EXPECT_EQ (StandardPuzzle::puzzle_hash_for_pk (coin.public_key), coin.record.coin.puzzle_hash);
            if (coin.record.coin.amount == 400) {
                EXPECT_EQ (coin.path, KeyPath::wallet_address (1, true));
            }
            if (coin.record.coin.amount == 300) {
                EXPECT_EQ (coin.path, KeyPath::wallet_address (15));
            }
        }
        EXPECT_EQ (total, 900u);
    }

    TEST (AddressScanner, EmptyWallet) {
        test_support::TestWallet wallet;
        test_support::FakeNode node;

        AddressScanner scanner (node, wallet.keys, 5);
        auto result = scanner.scan ();
        EXPECT_TRUE (result.coins.empty ());
        EXPECT_EQ (result.scanned, 5u);
        EXPECT_EQ (result.next_unused_index, 0u);
    }

    TEST (AddressScanner, RequiresSyncedNode) {
        test_support::TestWallet wallet;
        test_support::FakeNode node;
        node.synced = false;

        try {
            AddressScanner (node, wallet.keys, 5).scan ();
            FAIL () << "scanned an unsynced node";
        } catch (const SpendError &e) {
            EXPECT_EQ (e.type (), SpendError::ErrorType::NodeError);
        }
        EXPECT_EQ (node.queries, 0u);
    }

}
