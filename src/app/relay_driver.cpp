// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "app/relay_driver.hpp"
#include "chain/pow.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <exception>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace equirelay {
namespace app {

using validation::ValidationState;

RelayDriver::RelayDriver(const RelayConfig &config) : config_(config) {}

bool RelayDriver::initialize() {
  if (!init_datadir()) {
    return false;
  }
  if (!init_chain()) {
    return false;
  }
  if (!init_sessions()) {
    return false;
  }

  verifier_ = std::make_unique<verify::IncrementalVerifier>(*chain_params_, *session_store_,
                                                            *chain_store_);

  block_sub_ = Notifications().SubscribeBlockRegistered(
      [](const uint256 &hash, const chain::BlockRecord &record) {
        LOG_APP_INFO("Registered block {} at height {} (chainwork {})", hash.GetHex(),
                     record.height, record.chain_work.GetHex());
      });
  tip_sub_ = Notifications().SubscribeChainTip([](const uint256 &tip, int height) {
    LOG_APP_INFO("New tip {} height={}", tip.GetHex(), height);
  });

  return true;
}

bool RelayDriver::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }
  return true;
}

bool RelayDriver::init_chain() {
  chain::GlobalChainParams::Select(config_.chain_type);

  switch (config_.chain_type) {
  case chain::ChainType::MAIN:
    chain_params_ = chain::ChainParams::CreateMainNet();
    break;
  case chain::ChainType::REGTEST:
    chain_params_ = chain::ChainParams::CreateRegTest();
    break;
  }
  LOG_APP_INFO("Using {}", chain_params_->GetChainTypeString());

  if (config_.finality_depth > 0) {
    LOG_APP_INFO("Overriding finality depth: {} (default was {})", config_.finality_depth,
                 chain_params_->GetConsensus().nFinalityDepth);
    chain_params_->SetFinalityDepth(config_.finality_depth);
  }

  chain_store_ = std::make_unique<chain::ChainStore>(*chain_params_);

  if (!std::filesystem::exists(chain_file())) {
    LOG_APP_INFO("No chain state found, starting with an empty chain");
    return true;
  }
  if (!chain_store_->Load(chain_file().string())) {
    LOG_APP_ERROR("Failed to load chain state from {}", chain_file().string());
    return false;
  }
  LOG_APP_INFO("Loaded {} blocks, height {}", chain_store_->GetBlockCount(),
               chain_store_->GetChainHeight());
  return true;
}

bool RelayDriver::init_sessions() {
  session_store_ = std::make_unique<verify::MemorySessionStore>();

  if (!std::filesystem::exists(sessions_file())) {
    return true;
  }
  if (!session_store_->Load(sessions_file().string())) {
    LOG_APP_ERROR("Failed to load sessions from {}", sessions_file().string());
    return false;
  }
  LOG_APP_INFO("Loaded {} open verification sessions", session_store_->ListSessions().size());
  return true;
}

bool RelayDriver::save_state() const {
  bool ok = true;
  if (!chain_store_->Save(chain_file().string())) {
    LOG_APP_ERROR("Failed to save chain state");
    ok = false;
  }
  if (!session_store_->Save(sessions_file().string())) {
    LOG_APP_ERROR("Failed to save sessions");
    ok = false;
  }
  return ok;
}

std::optional<uint256> RelayDriver::Relay(const CBlockHeader &header, const uint160 &caller,
                                          bool resume) {
  if (!verifier_) {
    throw std::logic_error("RelayDriver::Relay called before initialize()");
  }

  const uint256 hash = header.GetHash();
  const verify::VerificationId id = verify::ComputeVerificationId(hash);
  ValidationState state;

  auto session = verifier_->GetSession(id);
  const bool resumable = resume && session && session->state != verify::SessionState::FAILED &&
                         session->initiator == caller && session->block_hash == hash;
  if (resumable) {
    LOG_APP_INFO("Resuming session {} in state {} (batches {:#04x})", id.GetHex(),
                 verify::SessionStateString(session->state), verifier_->GetCompletedBatches(id));
  } else {
    if (resume) {
      LOG_APP_INFO("No resumable session for {}, starting a new one", hash.GetHex());
    }
    if (!verifier_->Start(header, caller, state)) {
      LOG_APP_ERROR("Start failed for {}: {}", hash.GetHex(), state.ToString());
      save_state();
      return std::nullopt;
    }
    if (!save_state()) {
      return std::nullopt;
    }
    session = verifier_->GetSession(id);
  }

  if (session->state == verify::SessionState::STARTED ||
      session->state == verify::SessionState::LEAVES_IN_PROGRESS) {
    for (size_t batch = 0; batch < verify::LEAF_BATCHES; ++batch) {
      if (verifier_->GetCompletedBatches(id) & (1u << batch)) {
        continue;
      }
      if (!verifier_->VerifyLeavesBatch(id, batch, caller, state)) {
        LOG_APP_ERROR("Leaf batch {} failed: {}", batch, state.ToString());
        save_state();
        return std::nullopt;
      }
      if (!save_state()) {
        return std::nullopt;
      }
      LOG_APP_INFO("Leaf batch {}/{} verified", batch + 1, verify::LEAF_BATCHES);
    }
    session = verifier_->GetSession(id);
  }

  if (session->state == verify::SessionState::LEAVES_COMPLETE) {
    if (!verifier_->VerifyTree(id, caller, state)) {
      LOG_APP_ERROR("Tree verification failed: {}", state.ToString());
      save_state();
      return std::nullopt;
    }
    if (!save_state()) {
      return std::nullopt;
    }
    LOG_APP_INFO("Collision tree verified");
  }

  auto registered = verifier_->Finalize(id, header, caller, state);
  if (!registered) {
    LOG_APP_ERROR("Finalize failed for {}: {}", hash.GetHex(), state.ToString());
    save_state();
    return std::nullopt;
  }
  if (!save_state()) {
    LOG_APP_WARN("Block {} registered but chain state was not saved", hash.GetHex());
  }
  return registered;
}

std::string RelayDriver::GetStatusString() const {
  std::ostringstream out;
  const int height = chain_store_->GetChainHeight();

  out << "Chain:           " << chain_params_->GetChainTypeString() << "\n";
  out << "Height:          " << height << "\n";
  if (height >= 0) {
    out << "Tip:             " << chain_store_->GetTip().GetHex() << "\n";
    auto work = chain_store_->GetCumulativePowAtHeight(height, height + 1);
    out << "Cumulative work: " << (work ? work->GetHex() : std::string("unknown")) << "\n";
  }
  out << "Last finalized:  " << chain_store_->GetLastFinalizedHeight() << "\n";
  out << "Finality depth:  " << chain_store_->GetFinalityDepth() << "\n";
  out << "Known blocks:    " << chain_store_->GetBlockCount() << "\n";

  const auto sessions = session_store_->ListSessions();
  out << "Open sessions:   " << sessions.size() << "\n";
  for (const auto &id : sessions) {
    auto session = session_store_->GetSession(id);
    if (!session) {
      continue;
    }
    out << "  " << id.GetHex() << " " << verify::SessionStateString(session->state)
        << " deadline " << util::FormatTime(session->deadline) << "\n";
  }
  return out.str();
}

namespace {

uint256 RequireHash(const nlohmann::json &data, const char *field) {
  auto hash = util::SafeParseHash(data.at(field).get<std::string>());
  if (!hash) {
    throw std::runtime_error(std::string("invalid hash in field '") + field + "'");
  }
  return *hash;
}

} // namespace

std::optional<CBlockHeader> ReadHeaderFile(const std::filesystem::path &path) {
  using json = nlohmann::json;

  try {
    auto contents = util::read_file_string(path);
    if (!contents) {
      LOG_APP_ERROR("Cannot read header file {}", path.string());
      return std::nullopt;
    }
    json data = json::parse(*contents);

    CBlockHeader header;
    if (data.contains("raw")) {
      auto raw = util::ParseHex(data["raw"].get<std::string>());
      if (!raw || !header.Deserialize(*raw)) {
        LOG_APP_ERROR("Header file {}: 'raw' is not a serialized header", path.string());
        return std::nullopt;
      }
    } else {
      static const std::vector<std::string> required_fields = {
          "version", "previousblockhash", "merkleroot", "time", "bits", "nonce", "solution"};
      for (const auto &field : required_fields) {
        if (!data.contains(field)) {
          LOG_APP_ERROR("Header file {} missing required field '{}'", path.string(), field);
          return std::nullopt;
        }
      }

      header.nVersion = data["version"].get<int32_t>();
      header.hashPrevBlock = RequireHash(data, "previousblockhash");
      header.hashMerkleRoot = RequireHash(data, "merkleroot");
      if (data.contains("blockcommitments")) {
        header.hashBlockCommitments = RequireHash(data, "blockcommitments");
      }
      header.nTime = data["time"].get<uint32_t>();

      // RPC form is bare hex ("1f07ffff"); a 0x prefix is accepted too
      std::string bits_str = data["bits"].get<std::string>();
      if (bits_str.rfind("0x", 0) != 0) {
        bits_str = "0x" + bits_str;
      }
      auto bits = util::SafeParseUint32(bits_str);
      if (!bits) {
        LOG_APP_ERROR("Header file {}: invalid bits", path.string());
        return std::nullopt;
      }
      header.nBits = *bits;
      header.nNonce = RequireHash(data, "nonce");

      auto solution = util::ParseHex(data["solution"].get<std::string>());
      if (!solution) {
        LOG_APP_ERROR("Header file {}: invalid solution hex", path.string());
        return std::nullopt;
      }
      header.nSolution = std::move(*solution);
    }

    if (data.contains("hash")) {
      const uint256 expected = RequireHash(data, "hash");
      if (header.GetHash() != expected) {
        LOG_APP_ERROR("Header file {}: hash {} does not match computed {}", path.string(),
                      expected.GetHex(), header.GetHash().GetHex());
        return std::nullopt;
      }
    }
    return header;

  } catch (const std::exception &e) {
    LOG_APP_ERROR("Failed to parse header file {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}

} // namespace app
} // namespace equirelay
