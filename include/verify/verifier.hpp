// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include "verify/session.hpp"
#include "verify/session_store.hpp"
#include <optional>

class CBlockHeader;

namespace equirelay {

namespace validation {
class ValidationState;
}

namespace chain {
class ChainParams;
class ChainStore;
} // namespace chain

namespace verify {

/**
 * IncrementalVerifier - Equihash(200,9) proof checking in bounded steps
 *
 *   Start            header shape, PoW target, index decoding; opens a session
 *   VerifyLeavesBatch 64 leaf hashes for one of 8 batches, in any order, once each
 *   VerifyTree       rebuilds the 9-level collision tree from the stored leaves
 *   Finalize         root prefix and PoW re-check, then registers the block
 *
 * Every step after Start is gated on: the session exists and has not
 * failed, the caller is the initiator, and the deadline has not passed.
 * A step either completes all of its writes or none of them.
 */
class IncrementalVerifier {
public:
  IncrementalVerifier(const chain::ChainParams &params, SessionStore &store,
                      chain::ChainStore &chain);

  /**
   * Check the header and open a session keyed by its verification id.
   * An existing session with the same id is replaced when it has failed,
   * has expired, or belongs to `caller`; otherwise SESSION_IN_PROGRESS.
   */
  std::optional<VerificationId> Start(const CBlockHeader &header, const uint160 &caller,
                                      validation::ValidationState &state);

  bool VerifyLeavesBatch(const VerificationId &id, size_t batch, const uint160 &caller,
                         validation::ValidationState &state);

  /**
   * Requires all batches. A merge failure marks the session FAILED and
   * reports the merge error (NO_COLLISION, BAD_ORDERING, DUPLICATE_INDICES).
   */
  bool VerifyTree(const VerificationId &id, const uint160 &caller,
                  validation::ValidationState &state);

  /**
   * `header` must be the header the session was started with. On success
   * the block is registered with the chain store, the session is removed
   * and the block hash is returned.
   */
  std::optional<uint256> Finalize(const VerificationId &id, const CBlockHeader &header,
                                  const uint160 &caller, validation::ValidationState &state);

  std::optional<VerificationSession> GetSession(const VerificationId &id) const {
    return store_.GetSession(id);
  }

  uint8_t GetCompletedBatches(const VerificationId &id) const {
    return store_.GetBatchBitmap(id);
  }

private:
  // Session lookup plus the initiator and deadline gates
  std::optional<VerificationSession> LoadForStep(const VerificationId &id,
                                                 const uint160 &caller,
                                                 validation::ValidationState &state);

  void MarkFailed(VerificationSession &session);

  const chain::ChainParams &params_;
  SessionStore &store_;
  chain::ChainStore &chain_;
};

} // namespace verify
} // namespace equirelay
