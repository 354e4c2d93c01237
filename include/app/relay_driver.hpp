// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chain_store.hpp"
#include "chain/chainparams.hpp"
#include "chain/notifications.hpp"
#include "util/files.hpp"
#include "util/uint.hpp"
#include "verify/session_store.hpp"
#include "verify/verifier.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace equirelay {
namespace app {

// Relay driver configuration
struct RelayConfig {
  // Data directory (chain.json, sessions.json, debug.log)
  std::filesystem::path datadir;

  chain::ChainType chain_type = chain::ChainType::MAIN;

  // Finality depth override (0 = chain default)
  int finality_depth = 0;

  RelayConfig() : datadir(util::get_default_datadir()) {}
};

/**
 * RelayDriver - drives a header through the incremental verifier
 *
 * Owns the chain parameters, chain store and session store of one data
 * directory. Relay() runs Start, the eight leaf batches, the tree build
 * and Finalize, saving both stores after every step so that an
 * interrupted run can be picked up with `resume`.
 */
class RelayDriver {
public:
  explicit RelayDriver(const RelayConfig &config = RelayConfig{});

  // Loads chain.json and sessions.json if present
  bool initialize();

  /**
   * Verify and register `header` on behalf of `caller`.
   * With `resume`, an existing live session for this header is continued
   * from its last completed step instead of being restarted.
   * Returns the block hash on success.
   */
  std::optional<uint256> Relay(const CBlockHeader &header, const uint160 &caller,
                               bool resume);

  bool save_state() const;

  // Multi-line summary: height, tip, finality, cumulative work, open sessions
  std::string GetStatusString() const;

  const chain::ChainParams &chain_params() const { return *chain_params_; }
  const chain::ChainStore &chain_store() const { return *chain_store_; }
  const verify::MemorySessionStore &session_store() const { return *session_store_; }

private:
  bool init_datadir();
  bool init_chain();
  bool init_sessions();

  std::filesystem::path chain_file() const { return config_.datadir / "chain.json"; }
  std::filesystem::path sessions_file() const { return config_.datadir / "sessions.json"; }

  RelayConfig config_;

  std::unique_ptr<chain::ChainParams> chain_params_;
  std::unique_ptr<chain::ChainStore> chain_store_;
  std::unique_ptr<verify::MemorySessionStore> session_store_;
  std::unique_ptr<verify::IncrementalVerifier> verifier_;

  // Must be declared after the components they observe
  ChainNotifications::Subscription block_sub_;
  ChainNotifications::Subscription tip_sub_;
};

/**
 * Read a header from a JSON file.
 *
 * Either {"raw": "<hex of the full serialization>"} or the RPC-style
 * fields: version, previousblockhash, merkleroot, blockcommitments
 * (optional), time, bits (hex), nonce, solution. An optional "hash" is
 * checked against the computed block hash.
 */
std::optional<CBlockHeader> ReadHeaderFile(const std::filesystem::path &path);

} // namespace app
} // namespace equirelay
