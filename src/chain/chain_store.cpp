// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "chain/chain_store.hpp"
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/notifications.hpp"
#include "chain/pow.hpp"
#include "chain/validation.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <nlohmann/json.hpp>

namespace equirelay {
namespace chain {

using validation::ValidationState;
using validation::VerifyError;

// Blocks considered by GetMedianTimePast (Bitcoin's nMedianTimeSpan)
static constexpr int MEDIAN_TIME_SPAN = 11;

const char *BlockStatusString(BlockStatus status) {
  switch (status) {
  case BlockStatus::UNKNOWN: return "unknown";
  case BlockStatus::REGISTERED: return "registered";
  case BlockStatus::CANONICAL: return "canonical";
  case BlockStatus::FINALIZED: return "finalized";
  }
  return "unknown";
}

ChainStore::ChainStore(const ChainParams &params)
    : finality_depth_(params.GetConsensus().nFinalityDepth) {}

bool ChainStore::IsCanonical(const uint256 &hash, const BlockRecord &record) const {
  return record.height >= 0 &&
         static_cast<size_t>(record.height) < canonical_.size() &&
         canonical_[record.height] == hash;
}

void ChainStore::UpdateFinality() {
  const int height = GetChainHeight();
  if (height >= finality_depth_) {
    // Finality never moves backwards
    last_finalized_height_ = std::max(last_finalized_height_, height - finality_depth_);
  }
}

bool ChainStore::OnBlockFinalized(const CBlockHeader &header, int64_t registration_time,
                                  ValidationState &state, bool *tip_advanced) {
  if (tip_advanced) {
    *tip_advanced = false;
  }

  const uint256 hash = header.GetHash();
  if (blocks_.count(hash)) {
    return state.Invalid(VerifyError::BLOCK_ALREADY_REGISTERED,
                         "block " + hash.GetHex() + " already registered");
  }

  BlockRecord record;
  record.registration_time = registration_time;
  record.prev_hash = header.hashPrevBlock;
  record.pow = consensus::GetBlockProof(header.nBits);
  record.time = header.nTime;
  record.bits = header.nBits;
  record.merkle_root = header.hashMerkleRoot;

  if (blocks_.empty()) {
    // First block anchors the chain at height 0
    record.height = 0;
    record.chain_work = record.pow;
  } else {
    auto parent = blocks_.find(header.hashPrevBlock);
    if (parent == blocks_.end()) {
      return state.Invalid(VerifyError::PREV_BLOCK_NOT_FOUND,
                           "parent " + header.hashPrevBlock.GetHex() + " not registered");
    }
    record.height = parent->second.height + 1;
    record.chain_work = parent->second.chain_work + record.pow;
  }

  const auto &stored = blocks_.emplace(hash, record).first->second;

  bool advanced = false;
  if (canonical_.empty() || header.hashPrevBlock == canonical_.back()) {
    canonical_.push_back(hash);
    UpdateFinality();
    advanced = true;
  }

  LOG_CHAIN_INFO("Registered block {} height={} log2_work={:.6f}{}", hash.GetHex(),
                 record.height, std::log(record.chain_work.getdouble()) / std::log(2.0),
                 advanced ? " (new tip)" : " (side branch)");

  Notifications().NotifyBlockRegistered(hash, stored);
  if (advanced) {
    Notifications().NotifyChainTip(hash, record.height);
  }

  if (tip_advanced) {
    *tip_advanced = advanced;
  }
  return true;
}

bool ChainStore::ActivateBranch(const uint256 &tip_hash, ValidationState &state) {
  auto it = blocks_.find(tip_hash);
  if (it == blocks_.end()) {
    return state.Invalid(VerifyError::BLOCK_NOT_FOUND, "unknown block " + tip_hash.GetHex());
  }
  if (IsCanonical(tip_hash, it->second)) {
    LOG_CHAIN_DEBUG("ActivateBranch: {} already canonical", tip_hash.GetHex());
    return true;
  }

  const BlockRecord &current_tip = blocks_.at(canonical_.back());
  if (it->second.chain_work <= current_tip.chain_work) {
    return state.Invalid(VerifyError::INSUFFICIENT_CHAINWORK,
                         "branch work " + it->second.chain_work.GetHex() +
                             " does not exceed tip work " + current_tip.chain_work.GetHex());
  }

  // Walk back to the fork point
  std::vector<uint256> branch;
  uint256 cursor = tip_hash;
  while (true) {
    auto rec = blocks_.find(cursor);
    if (rec == blocks_.end()) {
      return state.Invalid(VerifyError::BLOCK_NOT_FOUND,
                           "branch ancestor " + cursor.GetHex() + " missing");
    }
    if (IsCanonical(cursor, rec->second)) {
      break;
    }
    branch.push_back(cursor);
    cursor = rec->second.prev_hash;
  }

  const int fork_height = blocks_.at(cursor).height;
  if (fork_height < last_finalized_height_) {
    return state.Invalid(VerifyError::FINALITY_VIOLATION,
                         "fork at height " + std::to_string(fork_height) +
                             " is below finalized height " +
                             std::to_string(last_finalized_height_));
  }

  const int old_height = GetChainHeight();
  canonical_.resize(static_cast<size_t>(fork_height) + 1);
  canonical_.insert(canonical_.end(), branch.rbegin(), branch.rend());
  UpdateFinality();

  LOG_CHAIN_INFO("Activated branch {}: fork_height={} old_height={} new_height={}",
                 tip_hash.GetHex(), fork_height, old_height, GetChainHeight());

  Notifications().NotifyChainTip(tip_hash, GetChainHeight());
  return true;
}

uint256 ChainStore::GetTip() const {
  if (canonical_.empty()) {
    return uint256();
  }
  return canonical_.back();
}

std::optional<uint256> ChainStore::GetBlockHashAtHeight(int height) const {
  if (height < 0 || height > GetChainHeight()) {
    return std::nullopt;
  }
  return canonical_[height];
}

const BlockRecord *ChainStore::GetBlock(const uint256 &hash) const {
  auto it = blocks_.find(hash);
  if (it == blocks_.end()) {
    return nullptr;
  }
  return &it->second;
}

BlockStatus ChainStore::GetStatus(const uint256 &hash) const {
  auto it = blocks_.find(hash);
  if (it == blocks_.end()) {
    return BlockStatus::UNKNOWN;
  }
  if (!IsCanonical(hash, it->second)) {
    return BlockStatus::REGISTERED;
  }
  if (it->second.height <= last_finalized_height_) {
    return BlockStatus::FINALIZED;
  }
  return BlockStatus::CANONICAL;
}

std::optional<int> ChainStore::GetBlockHeight(const uint256 &hash) const {
  auto it = blocks_.find(hash);
  if (it == blocks_.end() || !IsCanonical(hash, it->second)) {
    return std::nullopt;
  }
  return it->second.height;
}

bool ChainStore::IsBlockFinalized(const uint256 &hash) const {
  return GetStatus(hash) == BlockStatus::FINALIZED;
}

std::optional<arith_uint256> ChainStore::GetCumulativePowAtHeight(int height,
                                                                  int max_depth) const {
  if (height < 0 || height > GetChainHeight() || max_depth < 0) {
    return std::nullopt;
  }

  arith_uint256 total;
  const int lowest = std::max(0, height - max_depth + 1);
  for (int h = height; h >= lowest; --h) {
    total += blocks_.at(canonical_[h]).pow;
  }
  return total;
}

std::optional<int64_t> ChainStore::GetMedianTimePast(const uint256 &hash) const {
  std::vector<int64_t> times;
  times.reserve(MEDIAN_TIME_SPAN);

  auto it = blocks_.find(hash);
  while (it != blocks_.end() && static_cast<int>(times.size()) < MEDIAN_TIME_SPAN) {
    times.push_back(it->second.time);
    if (it->second.height == 0) {
      break;
    }
    it = blocks_.find(it->second.prev_hash);
  }

  if (times.empty()) {
    return std::nullopt;
  }
  std::sort(times.begin(), times.end());
  return times[times.size() / 2];
}

bool ChainStore::Save(const std::string &filepath) const {
  using json = nlohmann::json;

  try {
    LOG_CHAIN_TRACE("Saving {} blocks to {}", blocks_.size(), filepath);

    json root;
    root["version"] = 1; // Format version for future compatibility
    root["finality_depth"] = finality_depth_;
    root["last_finalized_height"] = last_finalized_height_;

    json canonical = json::array();
    for (const auto &hash : canonical_) {
      canonical.push_back(hash.GetHex());
    }
    root["canonical"] = canonical;

    // Height order makes the file easier to read and diff
    std::vector<std::pair<const uint256 *, const BlockRecord *>> sorted;
    sorted.reserve(blocks_.size());
    for (const auto &[hash, record] : blocks_) {
      sorted.emplace_back(&hash, &record);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto &a, const auto &b) {
      return a.second->height < b.second->height;
    });

    json blocks = json::array();
    for (const auto &[hash, record] : sorted) {
      json block_data;
      block_data["hash"] = hash->GetHex();
      block_data["prev_hash"] = record->prev_hash.GetHex();
      block_data["registration_time"] = record->registration_time;
      block_data["time"] = record->time;
      block_data["bits"] = record->bits;
      block_data["merkle_root"] = record->merkle_root.GetHex();
      block_data["height"] = record->height;
      block_data["pow"] = record->pow.GetHex();
      block_data["chainwork"] = record->chain_work.GetHex();
      blocks.push_back(block_data);
    }
    root["blocks"] = blocks;

    if (!util::atomic_write_file(filepath, root.dump(2))) {
      LOG_CHAIN_ERROR("Failed to write chain state to {}", filepath);
      return false;
    }

    LOG_CHAIN_TRACE("Successfully saved {} blocks", blocks_.size());
    return true;

  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

bool ChainStore::Load(const std::string &filepath) {
  using json = nlohmann::json;

  try {
    LOG_CHAIN_TRACE("Loading chain state from {}", filepath);

    auto contents = util::read_file_string(filepath);
    if (!contents) {
      LOG_CHAIN_TRACE("Chain state file not found: {} (starting fresh)", filepath);
      return false;
    }

    json root = json::parse(*contents);

    int version = root.value("version", 0);
    if (version != 1) {
      LOG_CHAIN_ERROR("Unsupported chain state file version: {}", version);
      return false;
    }

    if (!root.contains("blocks") || !root["blocks"].is_array() ||
        !root.contains("canonical") || !root["canonical"].is_array()) {
      LOG_CHAIN_ERROR("Chain state file missing 'blocks' or 'canonical' array");
      return false;
    }

    std::map<uint256, BlockRecord> blocks;
    for (const auto &block_data : root["blocks"]) {
      static const std::vector<std::string> required_fields = {
          "hash", "prev_hash", "registration_time", "time", "bits",
          "merkle_root", "height", "pow", "chainwork"};
      for (const auto &field : required_fields) {
        if (!block_data.contains(field)) {
          LOG_CHAIN_ERROR("Block entry missing required field '{}'. File corrupted.", field);
          return false;
        }
      }

      BlockRecord record;
      record.prev_hash = uint256S(block_data["prev_hash"].get<std::string>());
      record.registration_time = block_data["registration_time"].get<int64_t>();
      record.time = block_data["time"].get<uint32_t>();
      record.bits = block_data["bits"].get<uint32_t>();
      record.merkle_root = uint256S(block_data["merkle_root"].get<std::string>());
      record.height = block_data["height"].get<int>();
      record.pow = UintToArith256(uint256S(block_data["pow"].get<std::string>()));
      record.chain_work = UintToArith256(uint256S(block_data["chainwork"].get<std::string>()));

      blocks.emplace(uint256S(block_data["hash"].get<std::string>()), record);
    }

    std::vector<uint256> canonical;
    for (const auto &entry : root["canonical"]) {
      uint256 hash = uint256S(entry.get<std::string>());
      auto it = blocks.find(hash);
      if (it == blocks.end() || it->second.height != static_cast<int>(canonical.size())) {
        LOG_CHAIN_ERROR("Canonical entry {} at height {} is inconsistent with block records",
                        hash.GetHex(), canonical.size());
        return false;
      }
      if (!canonical.empty() && it->second.prev_hash != canonical.back()) {
        LOG_CHAIN_ERROR("Canonical chain broken at height {}", canonical.size());
        return false;
      }
      canonical.push_back(hash);
    }

    if (!blocks.empty() && canonical.empty()) {
      LOG_CHAIN_ERROR("Chain state has {} blocks but no canonical chain", blocks.size());
      return false;
    }

    // Every record except the anchor must hang off a registered parent
    for (const auto &[hash, record] : blocks) {
      if (hash == canonical.front()) {
        continue;
      }
      auto parent = blocks.find(record.prev_hash);
      if (parent == blocks.end()) {
        LOG_CHAIN_ERROR("Block {} has unregistered parent {}", hash.GetHex(),
                        record.prev_hash.GetHex());
        return false;
      }
      if (record.height != parent->second.height + 1) {
        LOG_CHAIN_ERROR("Block {} height {} does not follow parent height {}", hash.GetHex(),
                        record.height, parent->second.height);
        return false;
      }
    }

    const int chain_height = static_cast<int>(canonical.size()) - 1;
    const int last_finalized = root.value("last_finalized_height", -1);
    if (last_finalized < -1 || last_finalized > chain_height) {
      LOG_CHAIN_ERROR("Last finalized height {} outside chain height {}", last_finalized,
                      chain_height);
      return false;
    }

    const int saved_depth = root.value("finality_depth", finality_depth_);
    if (saved_depth != finality_depth_) {
      LOG_CHAIN_WARN("Finality depth changed from {} to {}", saved_depth, finality_depth_);
    }

    blocks_ = std::move(blocks);
    canonical_ = std::move(canonical);
    last_finalized_height_ = last_finalized;
    UpdateFinality();

    LOG_CHAIN_INFO("Loaded {} blocks, height={} last_finalized={}", blocks_.size(),
                   GetChainHeight(), last_finalized_height_);
    return true;

  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during Load: {}", e.what());
    return false;
  }
}

} // namespace chain
} // namespace equirelay
