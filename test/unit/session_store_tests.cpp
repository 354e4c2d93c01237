// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license
// MemorySessionStore tests: per-session data and JSON persistence

#include <catch2/catch_test_macros.hpp>
#include "verify/session_store.hpp"
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "crypto/equihash.hpp"
#include "util/files.hpp"
#include "util/sha256.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace equirelay;
using namespace equirelay::verify;

namespace {

VerificationSession MakeGenesisSession() {
    auto params = chain::ChainParams::CreateMainNet();
    const CBlockHeader& genesis = params->GenesisBlock();

    VerificationSession session;
    session.block_hash = genesis.GetHash();
    session.id = ComputeVerificationId(session.block_hash);
    session.header_bytes = genesis.SerializeEquihashInput();
    session.header_commitment = Hash256(session.header_bytes);
    session.midstate = crypto::ComputeEquihashMidstate(session.header_bytes);
    session.indices = *crypto::DecodeIndices(genesis.nSolution);
    session.initiator = uint160S("00112233445566778899aabbccddeeff00112233");
    session.created = 1700000000;
    session.deadline = 1700003600;
    session.target = *consensus::GetTargetFromBits(genesis.nBits);
    session.n_bits = genesis.nBits;
    session.state = SessionState::LEAVES_IN_PROGRESS;
    return session;
}

} // namespace

TEST_CASE("VerificationId - block hash prefix", "[session]") {
    auto params = chain::ChainParams::CreateMainNet();
    const uint256 hash = params->GenesisBlock().GetHash();
    const VerificationId id = ComputeVerificationId(hash);

    REQUIRE(id.GetHex() == "00000000ec8471911baa1db1266ea15dd06b4a8a5c453883c000b031973dce08");
    REQUIRE(std::equal(id.begin(), id.begin() + 28, hash.begin()));
}

TEST_CASE("SessionState - names", "[session]") {
    for (auto state : {SessionState::STARTED, SessionState::LEAVES_IN_PROGRESS,
                       SessionState::LEAVES_COMPLETE, SessionState::TREE_BUILT,
                       SessionState::FINALIZED, SessionState::FAILED}) {
        REQUIRE(SessionStateFromString(SessionStateString(state)) == state);
    }
    REQUIRE(std::string(SessionStateString(SessionState::LEAVES_COMPLETE)) == "leaves-complete");
    REQUIRE_FALSE(SessionStateFromString("done").has_value());
}

TEST_CASE("MemorySessionStore - per-session data", "[session_store]") {
    MemorySessionStore store;
    const VerificationSession session = MakeGenesisSession();

    SECTION("unknown session reads as empty") {
        REQUIRE_FALSE(store.GetSession(session.id).has_value());
        REQUIRE(store.GetBatchBitmap(session.id) == 0);
        REQUIRE_FALSE(store.GetLeaf(session.id, 0).has_value());
        REQUIRE_FALSE(store.GetRoot(session.id).has_value());
    }

    SECTION("writes need an existing session") {
        REQUIRE_THROWS_AS(store.SetLeaf(session.id, 0, {1, 2, 3}), std::runtime_error);
        REQUIRE_THROWS_AS(store.SetBatchBitmap(session.id, 1), std::runtime_error);
        REQUIRE_THROWS_AS(store.SetRoot(session.id, {0, 0, 0}), std::runtime_error);
    }

    SECTION("erase drops leaves, bitmap and root") {
        store.PutSession(session);
        store.SetLeaf(session.id, 5, {1, 2, 3});
        store.SetBatchBitmap(session.id, 0x03);
        store.SetRoot(session.id, {0, 0, 0});
        REQUIRE(store.ListSessions().size() == 1);

        store.EraseSession(session.id);
        REQUIRE(store.ListSessions().empty());
        REQUIRE_FALSE(store.GetLeaf(session.id, 5).has_value());
        REQUIRE(store.GetBatchBitmap(session.id) == 0);
        REQUIRE_FALSE(store.GetRoot(session.id).has_value());
    }

    SECTION("put replaces only the session record") {
        store.PutSession(session);
        store.SetBatchBitmap(session.id, 0x81);
        VerificationSession updated = session;
        updated.state = SessionState::FAILED;
        store.PutSession(updated);
        REQUIRE(store.GetSession(session.id)->state == SessionState::FAILED);
        REQUIRE(store.GetBatchBitmap(session.id) == 0x81);
    }
}

TEST_CASE("MemorySessionStore - persistence", "[session_store]") {
    auto test_dir = std::filesystem::temp_directory_path() / "equirelay_session_store_test";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);
    const std::string file = (test_dir / "sessions.json").string();

    const VerificationSession session = MakeGenesisSession();

    SECTION("round trip") {
        MemorySessionStore store;
        store.PutSession(session);
        store.SetLeaf(session.id, 0, std::vector<uint8_t>(30, 0x11));
        store.SetLeaf(session.id, 511, std::vector<uint8_t>(30, 0x22));
        store.SetBatchBitmap(session.id, 0x81);
        REQUIRE(store.Save(file));

        MemorySessionStore loaded;
        REQUIRE(loaded.Load(file));
        auto restored = loaded.GetSession(session.id);
        REQUIRE(restored.has_value());
        REQUIRE(restored->block_hash == session.block_hash);
        REQUIRE(restored->header_bytes == session.header_bytes);
        REQUIRE(restored->midstate == session.midstate);
        REQUIRE(restored->indices == session.indices);
        REQUIRE(restored->initiator == session.initiator);
        REQUIRE(restored->deadline == session.deadline);
        REQUIRE(restored->target == session.target);
        REQUIRE(restored->state == SessionState::LEAVES_IN_PROGRESS);
        REQUIRE(loaded.GetBatchBitmap(session.id) == 0x81);
        REQUIRE(loaded.GetLeaf(session.id, 511) == std::vector<uint8_t>(30, 0x22));
        REQUIRE_FALSE(loaded.GetLeaf(session.id, 1).has_value());
        REQUIRE_FALSE(loaded.GetRoot(session.id).has_value());
    }

    SECTION("stored header must match its commitment") {
        VerificationSession corrupt = session;
        corrupt.header_bytes[0] ^= 0x01;
        MemorySessionStore store;
        store.PutSession(corrupt);
        REQUIRE(store.Save(file));

        MemorySessionStore loaded;
        loaded.PutSession(session);
        REQUIRE_FALSE(loaded.Load(file));
        // Failed load keeps the previous contents
        REQUIRE(loaded.GetSession(session.id).has_value());
    }

    SECTION("unsupported version") {
        REQUIRE(util::atomic_write_file(file, std::string("{\"version\": 2, \"sessions\": []}")));
        MemorySessionStore store;
        REQUIRE_FALSE(store.Load(file));
    }

    SECTION("missing file") {
        MemorySessionStore store;
        REQUIRE_FALSE(store.Load((test_dir / "absent.json").string()));
    }

    std::filesystem::remove_all(test_dir);
}
