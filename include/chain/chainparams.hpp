// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace equirelay {
namespace chain {

/**
 * Chain type enumeration
 */
enum class ChainType {
  MAIN,   // Verifies real Zcash mainnet headers
  REGTEST // Same proof of work, shallow finality for local testing
};

/**
 * Consensus parameters
 * Simplified from Bitcoin's Consensus::Params
 */
struct ConsensusParams {
  // Proof of Work (Equihash n, k)
  unsigned int nEquihashN{200};
  unsigned int nEquihashK{9};

  // Header shape
  int32_t nMinBlockVersion{4};
  int64_t nMaxFutureBlockTime{2 * 60 * 60};  // Allowed clock drift (in seconds)

  // Verification sessions
  int64_t nSessionWindow{60 * 60};           // Start to deadline (in seconds)

  // Blocks at least this far below the tip are final
  int32_t nFinalityDepth{24};

  // Hash of genesis block
  uint256 hashGenesisBlock;
};

/**
 * ChainParams - Chain-specific parameters
 * Simplified version of Bitcoin's CChainParams
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  const ConsensusParams &GetConsensus() const { return consensus; }
  const CBlockHeader &GenesisBlock() const { return genesis; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  // Mutators (for CLI overrides)
  void SetFinalityDepth(int32_t depth) { consensus.nFinalityDepth = depth; }
  void SetSessionWindow(int64_t seconds) { consensus.nSessionWindow = seconds; }

  // Factory methods
  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateRegTest();

protected:
  ConsensusParams consensus;
  ChainType chainType{ChainType::MAIN};
  CBlockHeader genesis;
};

/**
 * MainNet parameters
 */
class CMainParams : public ChainParams {
public:
  CMainParams();
};

/**
 * RegTest parameters
 */
class CRegTestParams : public CMainParams {
public:
  CRegTestParams();
};

/**
 * Global chain params singleton
 * Simple alternative to Bitcoin's global pointer
 */
class GlobalChainParams {
public:
  static void Select(ChainType chain);
  static const ChainParams &Get();
  static bool IsInitialized();

private:
  static std::unique_ptr<ChainParams> instance;
};

// Helper to create genesis block
// @throws std::invalid_argument if solution_hex is not valid hex
CBlockHeader CreateGenesisBlock(uint32_t nTime, const uint256 &nNonce, uint32_t nBits,
                                int32_t nVersion, const uint256 &hashMerkleRoot,
                                std::string_view solution_hex);

} // namespace chain
} // namespace equirelay
