// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license
// IncrementalVerifier tests: the full step sequence on the genesis header,
// step gating (caller, deadline, state) and failure handling

#include <catch2/catch_test_macros.hpp>
#include "verify/verifier.hpp"
#include "chain/block.hpp"
#include "chain/chain_store.hpp"
#include "chain/chainparams.hpp"
#include "chain/validation.hpp"
#include "util/time.hpp"
#include <memory>
#include <utility>
#include <vector>

using namespace equirelay;
using namespace equirelay::verify;
using validation::ValidationState;
using validation::VerifyError;

namespace {

const uint160 ALICE = uint160S("a11ce00000000000000000000000000000000001");
const uint160 MALLORY = uint160S("0000000000000000000000000000000000bad001");

// Verifier wired to fresh in-memory stores
struct VerifierFixture {
    std::unique_ptr<chain::ChainParams> params = chain::ChainParams::CreateMainNet();
    MemorySessionStore sessions;
    chain::ChainStore chain{*params};
    IncrementalVerifier verifier{*params, sessions, chain};
    const CBlockHeader& genesis = params->GenesisBlock();
    const int64_t start_time = static_cast<int64_t>(genesis.nTime) + 1000;

    VerificationId StartGenesis() {
        ValidationState state;
        auto id = verifier.Start(genesis, ALICE, state);
        REQUIRE(id.has_value());
        return *id;
    }

    void RunAllBatches(const VerificationId& id) {
        for (size_t batch = 0; batch < LEAF_BATCHES; ++batch) {
            ValidationState state;
            REQUIRE(verifier.VerifyLeavesBatch(id, batch, ALICE, state));
        }
    }
};

} // namespace

TEST_CASE("IncrementalVerifier - genesis end to end", "[verifier]") {
    VerifierFixture f;
    util::MockTimeScope mock_time(f.start_time);

    const VerificationId id = f.StartGenesis();
    REQUIRE(id == ComputeVerificationId(f.genesis.GetHash()));

    auto session = f.verifier.GetSession(id);
    REQUIRE(session.has_value());
    REQUIRE(session->state == SessionState::STARTED);
    REQUIRE(session->initiator == ALICE);
    REQUIRE(session->deadline == f.start_time + f.params->GetConsensus().nSessionWindow);
    REQUIRE(session->indices[0] == 337);

    // Batches may arrive in any order
    for (size_t batch : {7u, 2u, 0u, 5u, 1u, 6u, 3u}) {
        ValidationState state;
        REQUIRE(f.verifier.VerifyLeavesBatch(id, batch, ALICE, state));
        REQUIRE(f.verifier.GetSession(id)->state == SessionState::LEAVES_IN_PROGRESS);
    }
    REQUIRE(f.verifier.GetCompletedBatches(id) == 0xef);

    ValidationState last;
    REQUIRE(f.verifier.VerifyLeavesBatch(id, 4, ALICE, last));
    REQUIRE(f.verifier.GetCompletedBatches(id) == ALL_BATCHES_DONE);
    REQUIRE(f.verifier.GetSession(id)->state == SessionState::LEAVES_COMPLETE);

    ValidationState tree_state;
    REQUIRE(f.verifier.VerifyTree(id, ALICE, tree_state));
    REQUIRE(f.verifier.GetSession(id)->state == SessionState::TREE_BUILT);
    REQUIRE(f.sessions.GetRoot(id) == std::vector<uint8_t>{0, 0, 0});

    ValidationState final_state;
    auto hash = f.verifier.Finalize(id, f.genesis, ALICE, final_state);
    REQUIRE(hash.has_value());
    REQUIRE(*hash == f.genesis.GetHash());

    // Registered, and the session is gone
    REQUIRE(f.chain.GetChainHeight() == 0);
    REQUIRE(f.chain.GetTip() == f.genesis.GetHash());
    REQUIRE(f.chain.GetBlock(*hash)->registration_time == f.start_time);
    REQUIRE_FALSE(f.verifier.GetSession(id).has_value());
    REQUIRE(f.sessions.ListSessions().empty());

    SECTION("a registered header cannot be started again") {
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Start(f.genesis, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::BLOCK_ALREADY_REGISTERED);
    }

    SECTION("later steps find no session") {
        ValidationState state;
        REQUIRE_FALSE(f.verifier.VerifyTree(id, ALICE, state));
        REQUIRE(state.GetError() == VerifyError::SESSION_NOT_FOUND);
    }
}

TEST_CASE("IncrementalVerifier - start checks", "[verifier]") {
    VerifierFixture f;
    util::MockTimeScope mock_time(f.start_time);

    SECTION("old version") {
        CBlockHeader header = f.genesis;
        header.nVersion = 3;
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Start(header, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::INVALID_VERSION);
    }

    SECTION("short solution") {
        CBlockHeader header = f.genesis;
        header.nSolution.resize(1343);
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Start(header, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::INVALID_SOLUTION_SIZE);
    }

    SECTION("timestamp too far ahead") {
        CBlockHeader header = f.genesis;
        header.nTime = static_cast<uint32_t>(f.start_time + 3 * 60 * 60);
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Start(header, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::INVALID_TIMESTAMP);
    }

    SECTION("undecodable target") {
        CBlockHeader header = f.genesis;
        header.nBits = 0x04923456;
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Start(header, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::INVALID_DIFFICULTY_TARGET);
    }

    SECTION("hash above target") {
        CBlockHeader header = f.genesis;
        header.nBits = 0x1c07ffff;
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Start(header, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::INVALID_PROOF_OF_WORK);
    }

    SECTION("unknown parent once the chain is anchored") {
        CBlockHeader other;
        other.nVersion = 4;
        other.nTime = 1000;
        other.nBits = 0x1f07ffff;
        ValidationState anchored;
        REQUIRE(f.chain.OnBlockFinalized(other, 1000, anchored));

        ValidationState state;
        REQUIRE_FALSE(f.verifier.Start(f.genesis, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::PREV_BLOCK_NOT_FOUND);
    }

    SECTION("failed start writes nothing") {
        CBlockHeader header = f.genesis;
        header.nVersion = 1;
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Start(header, ALICE, state).has_value());
        REQUIRE(f.sessions.ListSessions().empty());
    }
}

TEST_CASE("IncrementalVerifier - step gating", "[verifier]") {
    VerifierFixture f;
    util::MockTimeScope mock_time(f.start_time);
    const VerificationId id = f.StartGenesis();

    SECTION("unknown session") {
        ValidationState state;
        REQUIRE_FALSE(f.verifier.VerifyLeavesBatch(uint256S("1234"), 0, ALICE, state));
        REQUIRE(state.GetError() == VerifyError::SESSION_NOT_FOUND);
    }

    SECTION("only the initiator may advance") {
        ValidationState state;
        REQUIRE_FALSE(f.verifier.VerifyLeavesBatch(id, 0, MALLORY, state));
        REQUIRE(state.GetError() == VerifyError::UNAUTHORIZED);
        // Not fatal for the session
        REQUIRE(f.verifier.GetSession(id)->state == SessionState::STARTED);
        REQUIRE(f.verifier.GetCompletedBatches(id) == 0);
    }

    SECTION("batch id out of range") {
        ValidationState state;
        REQUIRE_FALSE(f.verifier.VerifyLeavesBatch(id, LEAF_BATCHES, ALICE, state));
        REQUIRE(state.GetError() == VerifyError::INVALID_BATCH_ID);
    }

    SECTION("each batch runs once") {
        ValidationState first;
        REQUIRE(f.verifier.VerifyLeavesBatch(id, 3, ALICE, first));
        std::vector<std::vector<uint8_t>> stored;
        for (size_t slot = 3 * LEAVES_PER_BATCH; slot < 4 * LEAVES_PER_BATCH; ++slot) {
            auto leaf = f.sessions.GetLeaf(id, slot);
            REQUIRE(leaf.has_value());
            stored.push_back(*leaf);
        }
        const auto before = f.verifier.GetSession(id);

        ValidationState second;
        REQUIRE_FALSE(f.verifier.VerifyLeavesBatch(id, 3, ALICE, second));
        REQUIRE(second.GetError() == VerifyError::BATCH_ALREADY_VERIFIED);
        REQUIRE(f.verifier.GetCompletedBatches(id) == 0x08);
        for (size_t i = 0; i < stored.size(); ++i) {
            REQUIRE(f.sessions.GetLeaf(id, 3 * LEAVES_PER_BATCH + i) == stored[i]);
        }
        REQUIRE_FALSE(f.sessions.GetLeaf(id, 2 * LEAVES_PER_BATCH).has_value());
        const auto after = f.verifier.GetSession(id);
        REQUIRE(after->state == before->state);
        REQUIRE(after->deadline == before->deadline);
    }

    SECTION("tree needs every batch") {
        ValidationState batch_state;
        REQUIRE(f.verifier.VerifyLeavesBatch(id, 0, ALICE, batch_state));
        ValidationState state;
        REQUIRE_FALSE(f.verifier.VerifyTree(id, ALICE, state));
        REQUIRE(state.GetError() == VerifyError::BATCHES_INCOMPLETE);
    }

    SECTION("finalize needs the tree") {
        f.RunAllBatches(id);
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Finalize(id, f.genesis, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::INVALID_STATE);
        REQUIRE(f.chain.GetBlockCount() == 0);
    }

    SECTION("tree cannot be rebuilt") {
        f.RunAllBatches(id);
        ValidationState first;
        REQUIRE(f.verifier.VerifyTree(id, ALICE, first));
        ValidationState second;
        REQUIRE_FALSE(f.verifier.VerifyTree(id, ALICE, second));
        REQUIRE(second.GetError() == VerifyError::INVALID_STATE);
    }
}

TEST_CASE("IncrementalVerifier - session expiry", "[verifier]") {
    VerifierFixture f;
    VerificationId id;
    {
        util::MockTimeScope mock_time(f.start_time);
        id = f.StartGenesis();
    }
    const int64_t deadline = f.verifier.GetSession(id)->deadline;

    SECTION("the deadline itself is still in time") {
        util::MockTimeScope mock_time(deadline);
        ValidationState state;
        REQUIRE(f.verifier.VerifyLeavesBatch(id, 0, ALICE, state));
    }

    SECTION("past the deadline the session fails for good") {
        util::MockTimeScope mock_time(deadline + 1);
        ValidationState state;
        REQUIRE_FALSE(f.verifier.VerifyLeavesBatch(id, 0, ALICE, state));
        REQUIRE(state.GetError() == VerifyError::SESSION_EXPIRED);
        REQUIRE(f.verifier.GetSession(id)->state == SessionState::FAILED);

        ValidationState again;
        REQUIRE_FALSE(f.verifier.VerifyLeavesBatch(id, 1, ALICE, again));
        REQUIRE(again.GetError() == VerifyError::SESSION_FAILED);
    }

    SECTION("a new start replaces the expired session") {
        util::MockTimeScope mock_time(deadline + 10);
        ValidationState expired;
        REQUIRE_FALSE(f.verifier.VerifyLeavesBatch(id, 0, ALICE, expired));

        const VerificationId restarted = f.StartGenesis();
        REQUIRE(restarted == id);
        auto session = f.verifier.GetSession(id);
        REQUIRE(session->state == SessionState::STARTED);
        REQUIRE(session->deadline == deadline + 10 + f.params->GetConsensus().nSessionWindow);
    }
}

TEST_CASE("IncrementalVerifier - restart", "[verifier]") {
    VerifierFixture f;
    util::MockTimeScope mock_time(f.start_time);
    const VerificationId id = f.StartGenesis();

    ValidationState batch_state;
    REQUIRE(f.verifier.VerifyLeavesBatch(id, 0, ALICE, batch_state));
    REQUIRE(f.sessions.GetLeaf(id, 0).has_value());

    SECTION("another caller cannot take over a live session") {
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Start(f.genesis, MALLORY, state).has_value());
        REQUIRE(state.GetError() == VerifyError::SESSION_IN_PROGRESS);

        auto session = f.verifier.GetSession(id);
        REQUIRE(session->initiator == ALICE);
        REQUIRE(session->state == SessionState::LEAVES_IN_PROGRESS);
        REQUIRE(f.verifier.GetCompletedBatches(id) == 0x01);
        REQUIRE(f.sessions.GetLeaf(id, 0).has_value());

        ValidationState next;
        REQUIRE(f.verifier.VerifyLeavesBatch(id, 1, ALICE, next));
    }

    SECTION("the initiator may start over") {
        ValidationState state;
        REQUIRE(f.verifier.Start(f.genesis, ALICE, state).has_value());
        REQUIRE(f.verifier.GetCompletedBatches(id) == 0);
        REQUIRE_FALSE(f.sessions.GetLeaf(id, 0).has_value());
        REQUIRE(f.verifier.GetSession(id)->state == SessionState::STARTED);
    }

    SECTION("an expired session is open to anyone") {
        const int64_t deadline = f.verifier.GetSession(id)->deadline;
        util::MockTimeScope later(deadline + 1);

        ValidationState state;
        REQUIRE(f.verifier.Start(f.genesis, MALLORY, state).has_value());
        REQUIRE(f.verifier.GetSession(id)->initiator == MALLORY);
        REQUIRE(f.verifier.GetCompletedBatches(id) == 0);

        ValidationState denied;
        REQUIRE_FALSE(f.verifier.VerifyLeavesBatch(id, 0, ALICE, denied));
        REQUIRE(denied.GetError() == VerifyError::UNAUTHORIZED);
    }

    SECTION("a failed session is open to anyone") {
        auto session = f.sessions.GetSession(id);
        session->state = SessionState::FAILED;
        f.sessions.PutSession(*session);

        ValidationState state;
        REQUIRE(f.verifier.Start(f.genesis, MALLORY, state).has_value());
        REQUIRE(f.verifier.GetSession(id)->initiator == MALLORY);
    }
}

TEST_CASE("IncrementalVerifier - tampered sessions", "[verifier]") {
    VerifierFixture f;
    util::MockTimeScope mock_time(f.start_time);
    const VerificationId id = f.StartGenesis();

    SECTION("misordered indices fail the tree and kill the session") {
        auto session = f.sessions.GetSession(id);
        std::swap(session->indices[0], session->indices[1]);
        f.sessions.PutSession(*session);

        f.RunAllBatches(id);
        ValidationState state;
        REQUIRE_FALSE(f.verifier.VerifyTree(id, ALICE, state));
        REQUIRE(state.GetError() == VerifyError::BAD_ORDERING);
        REQUIRE(f.verifier.GetSession(id)->state == SessionState::FAILED);
        REQUIRE_FALSE(f.sessions.GetRoot(id).has_value());
    }

    SECTION("stored header that no longer matches its commitment") {
        auto session = f.sessions.GetSession(id);
        session->header_bytes[CBlockHeader::OFF_TIME] ^= 0x01;
        f.sessions.PutSession(*session);

        ValidationState state;
        REQUIRE_FALSE(f.verifier.VerifyLeavesBatch(id, 0, ALICE, state));
        REQUIRE(state.GetError() == VerifyError::HEADER_MISMATCH);
        REQUIRE(f.verifier.GetSession(id)->state == SessionState::FAILED);
        REQUIRE(f.verifier.GetCompletedBatches(id) == 0);
    }

    SECTION("nonzero root is rejected at finalize") {
        f.RunAllBatches(id);
        ValidationState tree_state;
        REQUIRE(f.verifier.VerifyTree(id, ALICE, tree_state));
        f.sessions.SetRoot(id, {0, 0, 1});

        ValidationState state;
        REQUIRE_FALSE(f.verifier.Finalize(id, f.genesis, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::INVALID_ROOT_PREFIX);
        REQUIRE_FALSE(f.verifier.GetSession(id).has_value());
        REQUIRE(f.chain.GetBlockCount() == 0);
    }

    SECTION("missing leaf is a storage error") {
        f.RunAllBatches(id);
        MemorySessionStore& store = f.sessions;
        auto session = store.GetSession(id);
        auto bitmap = store.GetBatchBitmap(id);
        store.EraseSession(id);
        store.PutSession(*session);
        store.SetBatchBitmap(id, bitmap);

        ValidationState state;
        REQUIRE_FALSE(f.verifier.VerifyTree(id, ALICE, state));
        REQUIRE(state.IsError());
        REQUIRE(state.GetError() == VerifyError::STORAGE_ERROR);
    }
}

TEST_CASE("IncrementalVerifier - finalize checks", "[verifier]") {
    VerifierFixture f;
    util::MockTimeScope mock_time(f.start_time);
    const VerificationId id = f.StartGenesis();
    f.RunAllBatches(id);
    ValidationState tree_state;
    REQUIRE(f.verifier.VerifyTree(id, ALICE, tree_state));

    SECTION("a different header is refused without killing the session") {
        CBlockHeader other = f.genesis;
        other.hashBlockCommitments = uint256S("01");
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Finalize(id, other, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::HEADER_MISMATCH);
        REQUIRE(f.verifier.GetSession(id)->state == SessionState::TREE_BUILT);

        ValidationState retry;
        REQUIRE(f.verifier.Finalize(id, f.genesis, ALICE, retry).has_value());
    }

    SECTION("wrong caller") {
        ValidationState state;
        REQUIRE_FALSE(f.verifier.Finalize(id, f.genesis, MALLORY, state).has_value());
        REQUIRE(state.GetError() == VerifyError::UNAUTHORIZED);
        REQUIRE(f.verifier.GetSession(id).has_value());
    }

    SECTION("chain store rejection drops the session") {
        // Anchor the chain elsewhere so genesis has no registered parent
        CBlockHeader other;
        other.nVersion = 4;
        other.nTime = 1000;
        other.nBits = 0x1f07ffff;
        ValidationState anchored;
        REQUIRE(f.chain.OnBlockFinalized(other, 1000, anchored));

        ValidationState state;
        REQUIRE_FALSE(f.verifier.Finalize(id, f.genesis, ALICE, state).has_value());
        REQUIRE(state.GetError() == VerifyError::PREV_BLOCK_NOT_FOUND);
        REQUIRE_FALSE(f.verifier.GetSession(id).has_value());
    }
}
