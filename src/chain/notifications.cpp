// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "chain/notifications.hpp"
#include <algorithm>

namespace equirelay {

// ============================================================================
// ChainNotifications::Subscription
// ============================================================================

ChainNotifications::Subscription::Subscription(ChainNotifications *owner,
                                               size_t id)
    : owner_(owner), id_(id), active_(true) {}

ChainNotifications::Subscription::~Subscription() { Unsubscribe(); }

ChainNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

ChainNotifications::Subscription &
ChainNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void ChainNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// ChainNotifications
// ============================================================================

ChainNotifications::Subscription
ChainNotifications::SubscribeBlockRegistered(BlockRegisteredCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.block_registered = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

ChainNotifications::Subscription
ChainNotifications::SubscribeChainTip(ChainTipCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.chain_tip = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

void ChainNotifications::NotifyBlockRegistered(const uint256 &hash,
                                               const chain::BlockRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.block_registered) {
      entry.block_registered(hash, record);
    }
  }
}

void ChainNotifications::NotifyChainTip(const uint256 &tip, int height) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.chain_tip) {
      entry.chain_tip(tip, height);
    }
  }
}

void ChainNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it =
      std::find_if(callbacks_.begin(), callbacks_.end(),
                   [id](const CallbackEntry &entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

ChainNotifications &ChainNotifications::Get() {
  static ChainNotifications instance;
  return instance;
}

} // namespace equirelay
