/**
 * @file sender.hpp
 * @brief Sender<T, P> - producer handle bound to one channel.
 *
 * A Sender is (channel id, shared registry, shared channel). Copies are
 * independent producers on the same channel. Every send variant leaves the
 * message untouched (not moved from) when it fails, so the caller may retry
 * or route it elsewhere.
 *
 * Usage:
 * @code
 *   auto rx = mch::NewRegistry<Msg, int>();
 *   auto tx = rx.NewChannel(1, 10, false, 64U);
 *   Msg m{...};
 *   auto r = tx.TrySend(std::move(m));
 *   if (!r && r.get_error() == mch::ChannelError::kFull) { ... }
 * @endcode
 */

#ifndef MCH_SENDER_HPP_
#define MCH_SENDER_HPP_

#include "mch/cancel_token.hpp"
#include "mch/channel.hpp"
#include "mch/registry.hpp"
#include "mch/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <memory>
#include <utility>

namespace mch {

template <typename T, typename P>
class Sender final {
 public:
  using RegistryType = Registry<T, P>;
  using ChannelType = Channel<T, P>;
  using TimePoint = typename RegistryType::TimePoint;

  Sender(std::shared_ptr<RegistryType> registry,
         std::shared_ptr<ChannelType> channel) noexcept
      : registry_(std::move(registry)), channel_(std::move(channel)) {
    MCH_ASSERT(registry_ != nullptr && channel_ != nullptr);
  }

  ChannelId Id() const noexcept { return channel_->Id(); }
  const P& Priority() const noexcept { return channel_->Priority(); }
  uint32_t Weight() const noexcept { return channel_->Weight(); }
  optional<uint32_t> Capacity() const noexcept { return channel_->Capacity(); }

  // ======================== Send ========================

  /**
   * @brief Enqueue, waiting while a bounded channel is full.
   * @return kClosed after close/removal, kDisconnected once no receiver
   *         remains.
   */
  expected<void, ChannelError> Send(T&& msg) {
    return registry_->Push(*channel_, std::move(msg), true, nullptr, nullptr);
  }

  expected<void, ChannelError> Send(const T& msg) {
    return registry_->Push(*channel_, msg, true, nullptr, nullptr);
  }

  /** @brief Enqueue without waiting; kFull when at capacity. */
  expected<void, ChannelError> TrySend(T&& msg) {
    return registry_->Push(*channel_, std::move(msg), false, nullptr, nullptr);
  }

  expected<void, ChannelError> TrySend(const T& msg) {
    return registry_->Push(*channel_, msg, false, nullptr, nullptr);
  }

  /**
   * @brief Blocking send with a timeout.
   * @param timeout_us Maximum time to wait for space, in microseconds.
   * @return kTimedOut if the channel stayed full.
   */
  expected<void, ChannelError> SendFor(T&& msg, uint64_t timeout_us) {
    const TimePoint deadline = RegistryType::DeadlineAfter(timeout_us);
    return registry_->Push(*channel_, std::move(msg), true, &deadline, nullptr);
  }

  expected<void, ChannelError> SendUntil(T&& msg, TimePoint deadline) {
    return registry_->Push(*channel_, std::move(msg), true, &deadline, nullptr);
  }

  /** @brief Blocking send that gives up with kCancelled on @p token. */
  expected<void, ChannelError> Send(T&& msg, const CancelToken& token) {
    return registry_->Push(*channel_, std::move(msg), true, nullptr, &token);
  }

  // ======================== Freeze ========================

  /** @brief Exclude this channel from selection; sends still succeed. */
  expected<void, ChannelError> Freeze() { return SetFrozen(true); }

  expected<void, ChannelError> Unfreeze() { return SetFrozen(false); }

  expected<void, ChannelError> SetFrozen(bool frozen) {
    return registry_->SetFrozen(*channel_, frozen);
  }

  expected<bool, ChannelError> IsFrozen() const {
    return registry_->IsFrozen(*channel_);
  }

  // ======================== Lifecycle ========================

  /**
   * @brief Close the channel for every Sender of it. Messages already queued
   *        stay deliverable until the channel is removed.
   */
  void Close() { registry_->Close(*channel_); }

  bool IsClosed() const { return registry_->IsClosed(*channel_); }

  /** @brief Messages currently queued in this channel. */
  size_t QueueLength() const { return registry_->QueueLength(*channel_); }

 private:
  std::shared_ptr<RegistryType> registry_;
  std::shared_ptr<ChannelType> channel_;
};

}  // namespace mch

#endif  // MCH_SENDER_HPP_
