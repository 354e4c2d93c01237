// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "verify/session_store.hpp"
#include "chain/endian.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/sha256.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <exception>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace equirelay {
namespace verify {

std::optional<VerificationSession>
MemorySessionStore::GetSession(const VerificationId &id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.session;
}

void MemorySessionStore::PutSession(const VerificationSession &session) {
  entries_[session.id].session = session;
}

void MemorySessionStore::EraseSession(const VerificationId &id) {
  entries_.erase(id);
}

std::optional<std::vector<uint8_t>> MemorySessionStore::GetLeaf(const VerificationId &id,
                                                                size_t slot) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  auto leaf = it->second.leaves.find(slot);
  if (leaf == it->second.leaves.end()) {
    return std::nullopt;
  }
  return leaf->second;
}

void MemorySessionStore::SetLeaf(const VerificationId &id, size_t slot,
                                 std::vector<uint8_t> hash) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw std::runtime_error("SetLeaf: no session " + id.GetHex());
  }
  it->second.leaves[slot] = std::move(hash);
}

uint8_t MemorySessionStore::GetBatchBitmap(const VerificationId &id) const {
  auto it = entries_.find(id);
  return it == entries_.end() ? 0 : it->second.bitmap;
}

void MemorySessionStore::SetBatchBitmap(const VerificationId &id, uint8_t bitmap) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw std::runtime_error("SetBatchBitmap: no session " + id.GetHex());
  }
  it->second.bitmap = bitmap;
}

std::optional<std::vector<uint8_t>> MemorySessionStore::GetRoot(const VerificationId &id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.root;
}

void MemorySessionStore::SetRoot(const VerificationId &id, std::vector<uint8_t> root) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw std::runtime_error("SetRoot: no session " + id.GetHex());
  }
  it->second.root = std::move(root);
}

std::vector<VerificationId> MemorySessionStore::ListSessions() const {
  std::vector<VerificationId> ids;
  ids.reserve(entries_.size());
  for (const auto &[id, entry] : entries_) {
    ids.push_back(id);
  }
  return ids;
}

namespace {

std::string MidstateToHex(const crypto::Blake2bMidstate &midstate) {
  std::array<uint8_t, 64> bytes;
  for (size_t i = 0; i < midstate.size(); ++i) {
    endian::WriteLE64(bytes.data() + 8 * i, midstate[i]);
  }
  return util::HexStr(bytes);
}

// Throws std::runtime_error on malformed input (caught by Load)
std::vector<uint8_t> RequireHex(const nlohmann::json &value, size_t expected_size,
                                const char *field) {
  auto bytes = util::ParseHex(value.get<std::string>());
  if (!bytes || (expected_size != 0 && bytes->size() != expected_size)) {
    throw std::runtime_error(std::string("bad hex in field '") + field + "'");
  }
  return *bytes;
}

} // namespace

bool MemorySessionStore::Save(const std::string &filepath) const {
  using json = nlohmann::json;

  try {
    LOG_VERIFY_TRACE("Saving {} sessions to {}", entries_.size(), filepath);

    json root;
    root["version"] = 1; // Format version for future compatibility

    json sessions = json::array();
    for (const auto &[id, entry] : entries_) {
      const VerificationSession &s = entry.session;

      json data;
      data["id"] = id.GetHex();
      data["block_hash"] = s.block_hash.GetHex();
      data["header_commitment"] = s.header_commitment.GetHex();
      data["header"] = util::HexStr(s.header_bytes);
      data["midstate"] = MidstateToHex(s.midstate);
      data["indices"] = std::vector<uint32_t>(s.indices.begin(), s.indices.end());
      data["initiator"] = s.initiator.GetHex();
      data["created"] = s.created;
      data["deadline"] = s.deadline;
      data["target"] = s.target.GetHex();
      data["bits"] = s.n_bits;
      data["state"] = SessionStateString(s.state);
      data["completed_batches"] = entry.bitmap;

      json leaves = json::object();
      for (const auto &[slot, hash] : entry.leaves) {
        leaves[std::to_string(slot)] = util::HexStr(hash);
      }
      data["leaves"] = leaves;
      data["root"] = entry.root ? json(util::HexStr(*entry.root)) : json(nullptr);

      sessions.push_back(data);
    }
    root["sessions"] = sessions;

    if (!util::atomic_write_file(filepath, root.dump(2))) {
      LOG_VERIFY_ERROR("Failed to write sessions to {}", filepath);
      return false;
    }
    return true;

  } catch (const std::exception &e) {
    LOG_VERIFY_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

bool MemorySessionStore::Load(const std::string &filepath) {
  using json = nlohmann::json;

  try {
    auto contents = util::read_file_string(filepath);
    if (!contents) {
      LOG_VERIFY_TRACE("Session file not found: {} (starting fresh)", filepath);
      return false;
    }

    json root = json::parse(*contents);

    int version = root.value("version", 0);
    if (version != 1) {
      LOG_VERIFY_ERROR("Unsupported session file version: {}", version);
      return false;
    }
    if (!root.contains("sessions") || !root["sessions"].is_array()) {
      LOG_VERIFY_ERROR("Session file missing 'sessions' array");
      return false;
    }

    std::map<VerificationId, Entry> entries;
    for (const auto &data : root["sessions"]) {
      static const std::vector<std::string> required_fields = {
          "id", "block_hash", "header_commitment", "header", "midstate",
          "indices", "initiator", "created", "deadline", "target", "bits",
          "state", "completed_batches", "leaves", "root"};
      for (const auto &field : required_fields) {
        if (!data.contains(field)) {
          LOG_VERIFY_ERROR("Session entry missing required field '{}'. File corrupted.", field);
          return false;
        }
      }

      Entry entry;
      VerificationSession &s = entry.session;
      s.id = uint256S(data["id"].get<std::string>());
      s.block_hash = uint256S(data["block_hash"].get<std::string>());
      s.header_commitment = uint256S(data["header_commitment"].get<std::string>());

      auto header = RequireHex(data["header"], s.header_bytes.size(), "header");
      std::copy(header.begin(), header.end(), s.header_bytes.begin());

      auto midstate = RequireHex(data["midstate"], 64, "midstate");
      for (size_t i = 0; i < s.midstate.size(); ++i) {
        s.midstate[i] = endian::ReadLE64(midstate.data() + 8 * i);
      }

      auto indices = data["indices"].get<std::vector<uint32_t>>();
      if (indices.size() != s.indices.size()) {
        LOG_VERIFY_ERROR("Session {} has {} indices", s.id.GetHex(), indices.size());
        return false;
      }
      std::copy(indices.begin(), indices.end(), s.indices.begin());

      s.initiator = uint160S(data["initiator"].get<std::string>());
      s.created = data["created"].get<int64_t>();
      s.deadline = data["deadline"].get<int64_t>();
      s.target = UintToArith256(uint256S(data["target"].get<std::string>()));
      s.n_bits = data["bits"].get<uint32_t>();

      auto state = SessionStateFromString(data["state"].get<std::string>());
      if (!state) {
        LOG_VERIFY_ERROR("Session {} has unknown state '{}'", s.id.GetHex(),
                         data["state"].get<std::string>());
        return false;
      }
      s.state = *state;

      // Stored derived values must agree with the header they came from
      if (Hash256(s.header_bytes) != s.header_commitment ||
          crypto::ComputeEquihashMidstate(s.header_bytes) != s.midstate) {
        LOG_VERIFY_ERROR("Session {} header does not match its commitment", s.id.GetHex());
        return false;
      }

      entry.bitmap = data["completed_batches"].get<uint8_t>();
      for (const auto &[slot, hex] : data["leaves"].items()) {
        entry.leaves[std::stoul(slot)] = RequireHex(hex, 0, "leaves");
      }
      if (!data["root"].is_null()) {
        entry.root = RequireHex(data["root"], 0, "root");
      }

      entries.emplace(s.id, std::move(entry));
    }

    entries_ = std::move(entries);
    LOG_VERIFY_DEBUG("Loaded {} sessions from {}", entries_.size(), filepath);
    return true;

  } catch (const std::exception &e) {
    LOG_VERIFY_ERROR("Exception during Load: {}", e.what());
    return false;
  }
}

} // namespace verify
} // namespace equirelay
