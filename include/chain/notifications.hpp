// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <functional>
#include <mutex>
#include <vector>

namespace equirelay {

namespace chain {
struct BlockRecord;
}

/**
 * Notification system for chain store events
 *
 * Design philosophy:
 * - Simple observer pattern with std::function
 * - No background queue (synchronous callbacks)
 * - RAII-based subscription management
 *
 * Events:
 * - BlockRegistered: a block passed verification and was recorded
 * - ChainTip: the canonical tip changed (extension or branch activation)
 */
class ChainNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Unsubscribe explicitly
    void Unsubscribe();

  private:
    friend class ChainNotifications;
    Subscription(ChainNotifications *owner, size_t id);

    ChainNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  // Callback types
  using BlockRegisteredCallback =
      std::function<void(const uint256 &hash, const chain::BlockRecord &record)>;
  using ChainTipCallback = std::function<void(const uint256 &tip, int height)>;

  [[nodiscard]] Subscription
  SubscribeBlockRegistered(BlockRegisteredCallback callback);

  [[nodiscard]] Subscription SubscribeChainTip(ChainTipCallback callback);

  /**
   * Called by ChainStore::OnBlockFinalized after the record is stored,
   * whether or not it extended the canonical chain.
   */
  void NotifyBlockRegistered(const uint256 &hash, const chain::BlockRecord &record);

  /**
   * Called by ChainStore after the canonical tip moved.
   * GetTip() already returns `tip` when subscribers run.
   */
  void NotifyChainTip(const uint256 &tip, int height);

  static ChainNotifications &Get();

private:
  ChainNotifications() = default;

  // Unsubscribe by ID (called by Subscription destructor)
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    BlockRegisteredCallback block_registered;
    ChainTipCallback chain_tip;
  };

  std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

/**
 * Global accessor for notifications
 */
inline ChainNotifications &Notifications() { return ChainNotifications::Get(); }

} // namespace equirelay
