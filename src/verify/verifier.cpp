// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "verify/verifier.hpp"
#include "chain/block.hpp"
#include "chain/chain_store.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "chain/validation.hpp"
#include "crypto/blake2b.hpp"
#include "crypto/equihash.hpp"
#include "util/logging.hpp"
#include "util/sha256.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <span>
#include <vector>

namespace equirelay {
namespace verify {

using validation::ValidationState;
using validation::VerifyError;

IncrementalVerifier::IncrementalVerifier(const chain::ChainParams &params,
                                         SessionStore &store, chain::ChainStore &chain)
    : params_(params), store_(store), chain_(chain) {}

void IncrementalVerifier::MarkFailed(VerificationSession &session) {
  session.state = SessionState::FAILED;
  store_.PutSession(session);
}

std::optional<VerificationSession>
IncrementalVerifier::LoadForStep(const VerificationId &id, const uint160 &caller,
                                 ValidationState &state) {
  auto session = store_.GetSession(id);
  if (!session) {
    state.Invalid(VerifyError::SESSION_NOT_FOUND, "no session " + id.GetHex());
    return std::nullopt;
  }
  if (session->state == SessionState::FAILED) {
    state.Invalid(VerifyError::SESSION_FAILED, "session " + id.GetHex() + " has failed");
    return std::nullopt;
  }
  if (session->initiator != caller) {
    LOG_VERIFY_DEBUG("Session {}: caller {} is not initiator {}", id.GetHex(),
                     caller.GetHex(), session->initiator.GetHex());
    state.Invalid(VerifyError::UNAUTHORIZED, "caller is not the session initiator");
    return std::nullopt;
  }

  const int64_t now = util::GetTime();
  if (now > session->deadline) {
    // Expired sessions never resume; a new Start is required
    MarkFailed(*session);
    LOG_VERIFY_DEBUG("Session {} expired at {}", id.GetHex(), util::FormatTime(session->deadline));
    state.Invalid(VerifyError::SESSION_EXPIRED,
                  "deadline " + std::to_string(session->deadline) + " < now " +
                      std::to_string(now));
    return std::nullopt;
  }
  return session;
}

std::optional<VerificationId> IncrementalVerifier::Start(const CBlockHeader &header,
                                                         const uint160 &caller,
                                                         ValidationState &state) {
  const int64_t now = util::GetTime();

  if (!validation::CheckBlockHeaderShape(header, params_, now, state)) {
    LOG_VERIFY_DEBUG("Start rejected: {}", state.ToString());
    return std::nullopt;
  }

  const uint256 hash = header.GetHash();
  if (chain_.IsRegistered(hash)) {
    state.Invalid(VerifyError::BLOCK_ALREADY_REGISTERED, "block " + hash.GetHex());
    return std::nullopt;
  }

  // Catch an unknown parent now rather than after the full proof check
  if (chain_.GetBlockCount() > 0 && !chain_.IsRegistered(header.hashPrevBlock)) {
    state.Invalid(VerifyError::PREV_BLOCK_NOT_FOUND,
                  "parent " + header.hashPrevBlock.GetHex() + " not registered");
    return std::nullopt;
  }

  auto target = consensus::GetTargetFromBits(header.nBits, &state);
  if (!target) {
    return std::nullopt;
  }
  if (!consensus::CheckProofOfWork(hash, *target)) {
    state.Invalid(VerifyError::INVALID_PROOF_OF_WORK, "hash " + hash.GetHex() + " above target");
    return std::nullopt;
  }

  auto indices = crypto::DecodeIndices(header.nSolution);
  if (!indices) {
    state.Invalid(VerifyError::SOLUTION_DECODE_FAILURE, "solution indices do not round-trip");
    return std::nullopt;
  }

  VerificationSession session;
  session.id = ComputeVerificationId(hash);
  session.block_hash = hash;
  session.header_bytes = header.SerializeEquihashInput();
  session.header_commitment = Hash256(session.header_bytes);
  session.midstate = crypto::ComputeEquihashMidstate(session.header_bytes);
  session.indices = *indices;
  session.initiator = caller;
  session.created = now;
  session.deadline = now + params_.GetConsensus().nSessionWindow;
  session.target = *target;
  session.n_bits = header.nBits;
  session.state = SessionState::STARTED;

  if (auto existing = store_.GetSession(session.id)) {
    // A live session can only be restarted by its own initiator
    const bool live = existing->state != SessionState::FAILED && now <= existing->deadline;
    if (live && existing->initiator != caller) {
      LOG_VERIFY_DEBUG("Session {} is held by {} until {}", session.id.GetHex(),
                       existing->initiator.GetHex(), util::FormatTime(existing->deadline));
      state.Invalid(VerifyError::SESSION_IN_PROGRESS,
                    "session " + session.id.GetHex() + " is open for another caller");
      return std::nullopt;
    }
    LOG_VERIFY_INFO("Replacing existing session {}", session.id.GetHex());
    store_.EraseSession(session.id);
  }
  store_.PutSession(session);

  LOG_VERIFY_INFO("Started session {} for block {} (deadline {})", session.id.GetHex(),
                  hash.GetHex(), util::FormatTime(session.deadline));
  return session.id;
}

bool IncrementalVerifier::VerifyLeavesBatch(const VerificationId &id, size_t batch,
                                            const uint160 &caller, ValidationState &state) {
  auto session = LoadForStep(id, caller, state);
  if (!session) {
    return false;
  }

  if (batch >= LEAF_BATCHES) {
    return state.Invalid(VerifyError::INVALID_BATCH_ID,
                         "batch " + std::to_string(batch) + " out of range");
  }

  const uint8_t bitmap = store_.GetBatchBitmap(id);
  const uint8_t bit = static_cast<uint8_t>(1u << batch);
  if (bitmap & bit) {
    return state.Invalid(VerifyError::BATCH_ALREADY_VERIFIED,
                         "batch " + std::to_string(batch) + " already verified");
  }
  if (session->state != SessionState::STARTED &&
      session->state != SessionState::LEAVES_IN_PROGRESS) {
    return state.Invalid(VerifyError::INVALID_STATE,
                         std::string("leaf batch in state ") + SessionStateString(session->state));
  }

  // Only a store written outside this class can break the pairing
  if (Hash256(session->header_bytes) != session->header_commitment) {
    MarkFailed(*session);
    return state.Invalid(VerifyError::HEADER_MISMATCH, "stored header does not match commitment");
  }

  const auto slice = std::span<const uint32_t>(session->indices)
                         .subspan(batch * LEAVES_PER_BATCH, LEAVES_PER_BATCH);
  auto leaves = crypto::ComputeLeafBatch(session->midstate, session->header_bytes, slice);

  for (size_t i = 0; i < leaves.size(); ++i) {
    store_.SetLeaf(id, batch * LEAVES_PER_BATCH + i, std::move(leaves[i]));
  }
  const uint8_t updated = bitmap | bit;
  store_.SetBatchBitmap(id, updated);
  session->state = updated == ALL_BATCHES_DONE ? SessionState::LEAVES_COMPLETE
                                               : SessionState::LEAVES_IN_PROGRESS;
  store_.PutSession(*session);

  LOG_VERIFY_DEBUG("Session {}: batch {} verified (bitmap {:#04x})", id.GetHex(), batch, updated);
  return true;
}

bool IncrementalVerifier::VerifyTree(const VerificationId &id, const uint160 &caller,
                                     ValidationState &state) {
  auto session = LoadForStep(id, caller, state);
  if (!session) {
    return false;
  }

  if (store_.GetBatchBitmap(id) != ALL_BATCHES_DONE) {
    return state.Invalid(VerifyError::BATCHES_INCOMPLETE,
                         "completed batches " + std::to_string(store_.GetBatchBitmap(id)));
  }
  if (session->state != SessionState::LEAVES_COMPLETE) {
    return state.Invalid(VerifyError::INVALID_STATE,
                         std::string("tree build in state ") + SessionStateString(session->state));
  }

  std::vector<crypto::EquihashNode> nodes;
  nodes.reserve(crypto::SOLUTION_INDICES);
  for (size_t slot = 0; slot < crypto::SOLUTION_INDICES; ++slot) {
    auto leaf = store_.GetLeaf(id, slot);
    if (!leaf) {
      return state.Error(VerifyError::STORAGE_ERROR, "leaf " + std::to_string(slot) + " missing");
    }
    nodes.emplace_back(std::move(*leaf), session->indices[slot]);
  }

  crypto::EquihashNode root;
  if (!crypto::BuildTree(nodes, root, state)) {
    MarkFailed(*session);
    LOG_VERIFY_DEBUG("Session {}: tree rejected: {}", id.GetHex(), state.ToString());
    return false;
  }

  store_.SetRoot(id, root.hash);
  session->state = SessionState::TREE_BUILT;
  store_.PutSession(*session);

  LOG_VERIFY_DEBUG("Session {}: tree built, root {}", id.GetHex(), util::HexStr(root.hash));
  return true;
}

std::optional<uint256> IncrementalVerifier::Finalize(const VerificationId &id,
                                                     const CBlockHeader &header,
                                                     const uint160 &caller,
                                                     ValidationState &state) {
  auto session = LoadForStep(id, caller, state);
  if (!session) {
    return std::nullopt;
  }
  if (session->state != SessionState::TREE_BUILT) {
    state.Invalid(VerifyError::INVALID_STATE,
                  std::string("finalize in state ") + SessionStateString(session->state));
    return std::nullopt;
  }

  // The header must be the one whose solution was verified
  if (Hash256(header.SerializeEquihashInput()) != session->header_commitment ||
      header.GetHash() != session->block_hash) {
    state.Invalid(VerifyError::HEADER_MISMATCH, "header differs from the one started");
    return std::nullopt;
  }

  auto root = store_.GetRoot(id);
  if (!root) {
    state.Error(VerifyError::STORAGE_ERROR, "root missing");
    return std::nullopt;
  }
  if (!crypto::IsZeroPrefix(*root, crypto::COLLISION_BYTE_LENGTH)) {
    store_.EraseSession(id);
    state.Invalid(VerifyError::INVALID_ROOT_PREFIX, "root " + util::HexStr(*root));
    return std::nullopt;
  }
  if (!consensus::CheckProofOfWork(session->block_hash, session->target)) {
    store_.EraseSession(id);
    state.Invalid(VerifyError::INVALID_PROOF_OF_WORK, "hash above stored target");
    return std::nullopt;
  }

  if (!chain_.OnBlockFinalized(header, util::GetTime(), state)) {
    store_.EraseSession(id);
    LOG_VERIFY_WARN("Session {}: chain store rejected block: {}", id.GetHex(), state.ToString());
    return std::nullopt;
  }

  store_.EraseSession(id);
  LOG_VERIFY_INFO("Session {} finalized block {}", id.GetHex(), session->block_hash.GetHex());
  return session->block_hash;
}

} // namespace verify
} // namespace equirelay
