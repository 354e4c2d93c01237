// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "verify/session.hpp"
#include <algorithm>

namespace equirelay {
namespace verify {

VerificationId ComputeVerificationId(const uint256 &block_hash) {
  VerificationId id = block_hash;
  std::fill(id.begin() + 28, id.end(), 0);
  return id;
}

const char *SessionStateString(SessionState state) {
  switch (state) {
  case SessionState::STARTED: return "started";
  case SessionState::LEAVES_IN_PROGRESS: return "leaves-in-progress";
  case SessionState::LEAVES_COMPLETE: return "leaves-complete";
  case SessionState::TREE_BUILT: return "tree-built";
  case SessionState::FINALIZED: return "finalized";
  case SessionState::FAILED: return "failed";
  }
  return "unknown";
}

std::optional<SessionState> SessionStateFromString(std::string_view name) {
  for (SessionState s : {SessionState::STARTED, SessionState::LEAVES_IN_PROGRESS,
                         SessionState::LEAVES_COMPLETE, SessionState::TREE_BUILT,
                         SessionState::FINALIZED, SessionState::FAILED}) {
    if (name == SessionStateString(s)) {
      return s;
    }
  }
  return std::nullopt;
}

} // namespace verify
} // namespace equirelay
