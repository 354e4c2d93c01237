// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include "verify/session.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace equirelay {
namespace verify {

/**
 * Storage behind the incremental verifier.
 *
 * Each verifier step reads what it needs, computes, then writes; nothing
 * is written before that step's checks have passed.
 */
class SessionStore {
public:
  virtual ~SessionStore() = default;

  virtual std::optional<VerificationSession> GetSession(const VerificationId &id) const = 0;
  virtual void PutSession(const VerificationSession &session) = 0;

  // Drops the session together with its leaves, bitmap and root
  virtual void EraseSession(const VerificationId &id) = 0;

  virtual std::optional<std::vector<uint8_t>> GetLeaf(const VerificationId &id,
                                                      size_t slot) const = 0;
  virtual void SetLeaf(const VerificationId &id, size_t slot, std::vector<uint8_t> hash) = 0;

  virtual uint8_t GetBatchBitmap(const VerificationId &id) const = 0;
  virtual void SetBatchBitmap(const VerificationId &id, uint8_t bitmap) = 0;

  virtual std::optional<std::vector<uint8_t>> GetRoot(const VerificationId &id) const = 0;
  virtual void SetRoot(const VerificationId &id, std::vector<uint8_t> root) = 0;

  virtual std::vector<VerificationId> ListSessions() const = 0;
};

/**
 * In-memory SessionStore with JSON persistence, used by the relay driver
 * (one file per data directory) and by tests.
 */
class MemorySessionStore : public SessionStore {
public:
  std::optional<VerificationSession> GetSession(const VerificationId &id) const override;
  void PutSession(const VerificationSession &session) override;
  void EraseSession(const VerificationId &id) override;

  std::optional<std::vector<uint8_t>> GetLeaf(const VerificationId &id,
                                              size_t slot) const override;
  void SetLeaf(const VerificationId &id, size_t slot, std::vector<uint8_t> hash) override;

  uint8_t GetBatchBitmap(const VerificationId &id) const override;
  void SetBatchBitmap(const VerificationId &id, uint8_t bitmap) override;

  std::optional<std::vector<uint8_t>> GetRoot(const VerificationId &id) const override;
  void SetRoot(const VerificationId &id, std::vector<uint8_t> root) override;

  std::vector<VerificationId> ListSessions() const override;

  bool Save(const std::string &filepath) const;

  // Replaces the in-memory contents. Sessions whose stored header does not
  // match its commitment or midstate make the whole load fail.
  bool Load(const std::string &filepath);

private:
  struct Entry {
    VerificationSession session;
    std::map<size_t, std::vector<uint8_t>> leaves;
    uint8_t bitmap{0};
    std::optional<std::vector<uint8_t>> root;
  };

  std::map<VerificationId, Entry> entries_;
};

} // namespace verify
} // namespace equirelay
