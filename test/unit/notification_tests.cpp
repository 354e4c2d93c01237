// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license
// Tests for chain notification system

#include <catch2/catch_test_macros.hpp>
#include "chain/notifications.hpp"
#include "chain/block.hpp"
#include "chain/chain_store.hpp"
#include "chain/chainparams.hpp"
#include "chain/validation.hpp"
#include <utility>
#include <vector>

using namespace equirelay;
using namespace equirelay::chain;
using validation::ValidationState;

// Test helper: Create a block header with specified parent and time
static CBlockHeader CreateTestHeader(const uint256& hashPrevBlock, uint32_t nTime,
                                     uint32_t nBits = 0x1f07ffff) {
    CBlockHeader header;
    header.nVersion = 4;
    header.hashPrevBlock = hashPrevBlock;
    header.nTime = nTime;
    header.nBits = nBits;
    return header;
}

TEST_CASE("Notifications - block registration and tip events", "[notifications]") {
    auto params = ChainParams::CreateMainNet();
    ChainStore store(*params);

    std::vector<std::pair<uint256, int>> registered;
    std::vector<std::pair<uint256, int>> tips;

    auto block_sub = Notifications().SubscribeBlockRegistered(
        [&](const uint256& hash, const BlockRecord& record) {
            registered.emplace_back(hash, record.height);
        });
    auto tip_sub = Notifications().SubscribeChainTip([&](const uint256& tip, int height) {
        // Store state is already updated when subscribers run
        REQUIRE(store.GetTip() == tip);
        tips.emplace_back(tip, height);
    });

    auto first = CreateTestHeader(uint256(), 1000);
    auto second = CreateTestHeader(first.GetHash(), 1150);
    auto side = CreateTestHeader(first.GetHash(), 1200);

    ValidationState state;
    REQUIRE(store.OnBlockFinalized(first, 1000, state));
    REQUIRE(store.OnBlockFinalized(second, 1150, state));
    REQUIRE(store.OnBlockFinalized(side, 1200, state));

    SECTION("every registration is announced") {
        REQUIRE(registered.size() == 3);
        REQUIRE(registered[2] == std::make_pair(side.GetHash(), 1));
    }

    SECTION("only canonical extensions move the tip") {
        REQUIRE(tips.size() == 2);
        REQUIRE(tips[0] == std::make_pair(first.GetHash(), 0));
        REQUIRE(tips[1] == std::make_pair(second.GetHash(), 1));
    }

    SECTION("branch activation announces the new tip") {
        auto heavy = CreateTestHeader(side.GetHash(), 1300, 0x1e07ffff);
        REQUIRE(store.OnBlockFinalized(heavy, 1300, state));
        REQUIRE(store.ActivateBranch(heavy.GetHash(), state));
        REQUIRE(tips.back() == std::make_pair(heavy.GetHash(), 2));
    }
}

TEST_CASE("Notifications - subscription lifetime", "[notifications]") {
    auto params = ChainParams::CreateMainNet();
    ChainStore store(*params);
    int calls = 0;

    SECTION("destroyed subscription stops delivery") {
        {
            auto sub = Notifications().SubscribeChainTip([&](const uint256&, int) { ++calls; });
            ValidationState state;
            REQUIRE(store.OnBlockFinalized(CreateTestHeader(uint256(), 1000), 1000, state));
        }
        REQUIRE(calls == 1);

        ValidationState state;
        REQUIRE(store.OnBlockFinalized(CreateTestHeader(store.GetTip(), 1150), 1150, state));
        REQUIRE(calls == 1);
    }

    SECTION("explicit unsubscribe") {
        auto sub = Notifications().SubscribeChainTip([&](const uint256&, int) { ++calls; });
        sub.Unsubscribe();
        ValidationState state;
        REQUIRE(store.OnBlockFinalized(CreateTestHeader(uint256(), 1000), 1000, state));
        REQUIRE(calls == 0);
    }

    SECTION("moved subscription stays active") {
        ChainNotifications::Subscription outer;
        {
            auto sub = Notifications().SubscribeChainTip([&](const uint256&, int) { ++calls; });
            outer = std::move(sub);
        }
        ValidationState state;
        REQUIRE(store.OnBlockFinalized(CreateTestHeader(uint256(), 1000), 1000, state));
        REQUIRE(calls == 1);
    }
}
