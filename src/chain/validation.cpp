// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "crypto/equihash.hpp"

namespace equirelay {
namespace validation {

const char *VerifyErrorString(VerifyError error) {
  switch (error) {
  case VerifyError::NONE: return "valid";
  case VerifyError::INVALID_VERSION: return "bad-version";
  case VerifyError::INVALID_TIMESTAMP: return "time-too-new";
  case VerifyError::INVALID_SOLUTION_SIZE: return "bad-solution-size";
  case VerifyError::INVALID_DIFFICULTY_TARGET: return "bad-diffbits";
  case VerifyError::BLOCK_ALREADY_REGISTERED: return "duplicate";
  case VerifyError::INVALID_PROOF_OF_WORK: return "high-hash";
  case VerifyError::SOLUTION_DECODE_FAILURE: return "bad-solution-encoding";
  case VerifyError::SESSION_NOT_FOUND: return "session-not-found";
  case VerifyError::SESSION_FAILED: return "session-failed";
  case VerifyError::UNAUTHORIZED: return "unauthorized";
  case VerifyError::SESSION_EXPIRED: return "session-expired";
  case VerifyError::SESSION_IN_PROGRESS: return "session-in-progress";
  case VerifyError::INVALID_STATE: return "bad-session-state";
  case VerifyError::HEADER_MISMATCH: return "header-mismatch";
  case VerifyError::INVALID_BATCH_ID: return "bad-batch-id";
  case VerifyError::BATCH_ALREADY_VERIFIED: return "batch-already-verified";
  case VerifyError::BATCHES_INCOMPLETE: return "batches-incomplete";
  case VerifyError::NO_COLLISION: return "no-collision";
  case VerifyError::BAD_ORDERING: return "bad-ordering";
  case VerifyError::DUPLICATE_INDICES: return "duplicate-indices";
  case VerifyError::INVALID_ROOT_PREFIX: return "bad-root-prefix";
  case VerifyError::PREV_BLOCK_NOT_FOUND: return "prev-blk-not-found";
  case VerifyError::BLOCK_NOT_FOUND: return "block-not-found";
  case VerifyError::FINALITY_VIOLATION: return "bad-fork-finalized";
  case VerifyError::INSUFFICIENT_CHAINWORK: return "too-little-chainwork";
  case VerifyError::INVALID_MERKLE_PROOF: return "bad-merkle-proof";
  case VerifyError::STORAGE_ERROR: return "storage-error";
  }
  return "unknown";
}

std::string ValidationState::ToString() const {
  if (IsValid()) {
    return "valid";
  }
  std::string s = GetRejectReason();
  if (!debug_message_.empty()) {
    s += ", " + debug_message_;
  }
  return s;
}

bool CheckBlockHeaderShape(const CBlockHeader &header,
                           const chain::ChainParams &params, int64_t now,
                           ValidationState &state) {
  const auto &consensus = params.GetConsensus();

  if (header.nVersion < consensus.nMinBlockVersion) {
    return state.Invalid(VerifyError::INVALID_VERSION,
                         "block version too old: " + std::to_string(header.nVersion));
  }

  if (header.nSolution.size() != crypto::SOLUTION_SIZE) {
    return state.Invalid(VerifyError::INVALID_SOLUTION_SIZE,
                         "solution is " + std::to_string(header.nSolution.size()) +
                             " bytes, expected " + std::to_string(crypto::SOLUTION_SIZE));
  }

  if (header.nBits == 0) {
    return state.Invalid(VerifyError::INVALID_DIFFICULTY_TARGET, "nBits is zero");
  }

  if (static_cast<int64_t>(header.nTime) > now + consensus.nMaxFutureBlockTime) {
    return state.Invalid(
        VerifyError::INVALID_TIMESTAMP,
        "block timestamp too far in future: " + std::to_string(header.nTime) +
            " > " + std::to_string(now + consensus.nMaxFutureBlockTime));
  }

  return true;
}

} // namespace validation
} // namespace equirelay
