// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

class CBlockHeader;

namespace equirelay {

namespace chain {
class ChainParams;
} // namespace chain

namespace validation {

/**
 * Why a header, verification step or chain query was rejected.
 * Each code maps to a short, stable reject reason (GetRejectReason()).
 */
enum class VerifyError {
  NONE,

  // Header shape (start)
  INVALID_VERSION,
  INVALID_TIMESTAMP,
  INVALID_SOLUTION_SIZE,
  INVALID_DIFFICULTY_TARGET,
  BLOCK_ALREADY_REGISTERED,
  INVALID_PROOF_OF_WORK,
  SOLUTION_DECODE_FAILURE,

  // Session gating
  SESSION_NOT_FOUND,
  SESSION_FAILED,
  UNAUTHORIZED,
  SESSION_EXPIRED,
  SESSION_IN_PROGRESS,
  INVALID_STATE,
  HEADER_MISMATCH,

  // Leaf batches
  INVALID_BATCH_ID,
  BATCH_ALREADY_VERIFIED,
  BATCHES_INCOMPLETE,

  // Collision tree
  NO_COLLISION,
  BAD_ORDERING,
  DUPLICATE_INDICES,
  INVALID_ROOT_PREFIX,

  // Chain store
  PREV_BLOCK_NOT_FOUND,
  BLOCK_NOT_FOUND,
  FINALITY_VIOLATION,
  INSUFFICIENT_CHAINWORK,
  INVALID_MERKLE_PROOF,

  STORAGE_ERROR,
};

/** Short reject reason, e.g. "high-hash" for INVALID_PROOF_OF_WORK */
const char *VerifyErrorString(VerifyError error);

/**
 * Validation state - tracks why validation failed
 * Simplified from Bitcoin Core's BlockValidationState
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Rejected input
    ERROR    // Local failure (storage)
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(VerifyError error, const std::string &debug_message = "") {
    result_ = Result::INVALID;
    error_ = error;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(VerifyError error, const std::string &debug_message = "") {
    result_ = Result::ERROR;
    error_ = error;
    debug_message_ = debug_message;
    return false;
  }

  VerifyError GetError() const { return error_; }
  std::string GetRejectReason() const { return VerifyErrorString(error_); }
  const std::string &GetDebugMessage() const { return debug_message_; }

  std::string ToString() const;

private:
  Result result_;
  VerifyError error_{VerifyError::NONE};
  std::string debug_message_;
};

/**
 * Context-free header checks run before any Equihash work: version,
 * solution size, nonzero nBits, and timestamp no further than
 * nMaxFutureBlockTime past `now`.
 */
bool CheckBlockHeaderShape(const CBlockHeader &header,
                           const chain::ChainParams &params, int64_t now,
                           ValidationState &state);

} // namespace validation
} // namespace equirelay
