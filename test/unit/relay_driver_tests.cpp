// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license
// RelayDriver tests: full relay of a header, persistence across restarts,
// resuming an interrupted session and header file parsing

#include <catch2/catch_test_macros.hpp>
#include "app/relay_driver.hpp"
#include "chain/block.hpp"
#include "chain/chain_store.hpp"
#include "chain/chainparams.hpp"
#include "chain/validation.hpp"
#include "util/files.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "verify/session_store.hpp"
#include "verify/verifier.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

using namespace equirelay;
using namespace equirelay::app;

namespace {

const uint160 CALLER = uint160S("00000000000000000000000000000000000000c1");

struct TempDatadir {
    std::filesystem::path path;
    explicit TempDatadir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path);
    }
    ~TempDatadir() { std::filesystem::remove_all(path); }
};

RelayConfig MakeConfig(const std::filesystem::path& datadir) {
    RelayConfig config;
    config.datadir = datadir;
    config.chain_type = chain::ChainType::REGTEST;
    return config;
}

nlohmann::json GenesisJson(const CBlockHeader& genesis) {
    nlohmann::json data;
    data["version"] = genesis.nVersion;
    data["previousblockhash"] = genesis.hashPrevBlock.GetHex();
    data["merkleroot"] = genesis.hashMerkleRoot.GetHex();
    data["time"] = genesis.nTime;
    data["bits"] = "1f07ffff";
    data["nonce"] = genesis.nNonce.GetHex();
    data["solution"] = util::HexStr(genesis.nSolution);
    return data;
}

} // namespace

TEST_CASE("RelayDriver - relay and restart", "[relay]") {
    TempDatadir dir("equirelay_relay_driver_test");
    auto params = chain::ChainParams::CreateRegTest();
    const CBlockHeader& genesis = params->GenesisBlock();

    {
        RelayDriver driver(MakeConfig(dir.path));
        REQUIRE(driver.initialize());
        REQUIRE(driver.chain_store().GetChainHeight() == -1);

        auto hash = driver.Relay(genesis, CALLER, false);
        REQUIRE(hash.has_value());
        REQUIRE(*hash == genesis.GetHash());
        REQUIRE(driver.chain_store().GetTip() == genesis.GetHash());
        REQUIRE(driver.session_store().ListSessions().empty());

        const std::string status = driver.GetStatusString();
        REQUIRE(status.find("Height:          0") != std::string::npos);
        REQUIRE(status.find(genesis.GetHash().GetHex()) != std::string::npos);
    }

    REQUIRE(std::filesystem::exists(dir.path / "chain.json"));
    REQUIRE(std::filesystem::exists(dir.path / "sessions.json"));

    SECTION("state survives a restart") {
        RelayDriver driver(MakeConfig(dir.path));
        REQUIRE(driver.initialize());
        REQUIRE(driver.chain_store().GetChainHeight() == 0);
        REQUIRE(driver.chain_store().GetTip() == genesis.GetHash());
    }

    SECTION("relaying the same header again fails") {
        RelayDriver driver(MakeConfig(dir.path));
        REQUIRE(driver.initialize());
        REQUIRE_FALSE(driver.Relay(genesis, CALLER, false).has_value());
    }

    SECTION("finality depth override") {
        RelayConfig config = MakeConfig(dir.path);
        config.finality_depth = 6;
        RelayDriver driver(config);
        REQUIRE(driver.initialize());
        REQUIRE(driver.chain_store().GetFinalityDepth() == 6);
    }
}

TEST_CASE("RelayDriver - resume", "[relay]") {
    TempDatadir dir("equirelay_relay_resume_test");
    REQUIRE(util::ensure_directory(dir.path));
    auto params = chain::ChainParams::CreateRegTest();
    const CBlockHeader& genesis = params->GenesisBlock();
    util::MockTimeScope mock_time(static_cast<int64_t>(genesis.nTime) + 1000);

    // An interrupted run: started, three batches done, then saved
    {
        verify::MemorySessionStore sessions;
        chain::ChainStore chain(*params);
        verify::IncrementalVerifier verifier(*params, sessions, chain);
        validation::ValidationState state;
        auto id = verifier.Start(genesis, CALLER, state);
        REQUIRE(id.has_value());
        for (size_t batch = 0; batch < 3; ++batch) {
            REQUIRE(verifier.VerifyLeavesBatch(*id, batch, CALLER, state));
        }

        // Sibling order broken after the stored batches; only a resumed run sees it
        auto session = sessions.GetSession(*id);
        std::swap(session->indices[510], session->indices[511]);
        sessions.PutSession(*session);
        REQUIRE(sessions.Save((dir.path / "sessions.json").string()));
    }

    SECTION("resume continues the stored session") {
        RelayDriver driver(MakeConfig(dir.path));
        REQUIRE(driver.initialize());
        REQUIRE(driver.session_store().ListSessions().size() == 1);
        REQUIRE_FALSE(driver.Relay(genesis, CALLER, true).has_value());
        auto id = verify::ComputeVerificationId(genesis.GetHash());
        REQUIRE(driver.session_store().GetSession(id)->state == verify::SessionState::FAILED);
    }

    SECTION("without resume the session is restarted") {
        RelayDriver driver(MakeConfig(dir.path));
        REQUIRE(driver.initialize());
        REQUIRE(driver.Relay(genesis, CALLER, false).has_value());
    }

    SECTION("another caller cannot take over someone else's session") {
        RelayDriver driver(MakeConfig(dir.path));
        REQUIRE(driver.initialize());
        REQUIRE_FALSE(driver.Relay(genesis, uint160S("00000000000000000000000000000000000000c2"), true)
                          .has_value());
        auto id = verify::ComputeVerificationId(genesis.GetHash());
        auto session = driver.session_store().GetSession(id);
        REQUIRE(session.has_value());
        REQUIRE(session->initiator == CALLER);
        REQUIRE(driver.session_store().GetBatchBitmap(id) == 0x07);
    }
}

TEST_CASE("ReadHeaderFile - formats", "[relay]") {
    TempDatadir dir("equirelay_header_file_test");
    REQUIRE(util::ensure_directory(dir.path));
    const auto file = dir.path / "header.json";
    auto params = chain::ChainParams::CreateMainNet();
    const CBlockHeader& genesis = params->GenesisBlock();

    SECTION("RPC-style fields") {
        auto data = GenesisJson(genesis);
        data["hash"] = genesis.GetHash().GetHex();
        REQUIRE(util::atomic_write_file(file, data.dump()));
        auto header = ReadHeaderFile(file);
        REQUIRE(header.has_value());
        REQUIRE(header->GetHash() == genesis.GetHash());
    }

    SECTION("raw serialization") {
        nlohmann::json data;
        data["raw"] = util::HexStr(genesis.Serialize());
        REQUIRE(util::atomic_write_file(file, data.dump()));
        auto header = ReadHeaderFile(file);
        REQUIRE(header.has_value());
        REQUIRE(header->nSolution == genesis.nSolution);
    }

    SECTION("hash cross-check") {
        auto data = GenesisJson(genesis);
        data["hash"] = std::string(64, '1');
        REQUIRE(util::atomic_write_file(file, data.dump()));
        REQUIRE_FALSE(ReadHeaderFile(file).has_value());
    }

    SECTION("missing field") {
        auto data = GenesisJson(genesis);
        data.erase("solution");
        REQUIRE(util::atomic_write_file(file, data.dump()));
        REQUIRE_FALSE(ReadHeaderFile(file).has_value());
    }

    SECTION("not JSON") {
        REQUIRE(util::atomic_write_file(file, std::string("version=4")));
        REQUIRE_FALSE(ReadHeaderFile(file).has_value());
    }

    SECTION("missing file") {
        REQUIRE_FALSE(ReadHeaderFile(dir.path / "absent.json").has_value());
    }
}
