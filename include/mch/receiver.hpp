/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file mch/receiver.hpp
 * @brief Receiver<T, P> - consumer handle over a whole registry.
 *
 * A Receiver is not bound to one channel: Receive() picks among every
 * channel of its registry (highest priority first, weighted random within a
 * level, frozen channels skipped). Copies share the registry and count as
 * independent consumers; when the last Receiver of a registry is destroyed,
 * its Senders fail with kDisconnected.
 *
 * Usage:
 * @code
 *   enum class Prio : uint8_t { kLow = 0, kHigh = 1 };
 *   auto rx = mch::NewRegistry<Msg, Prio>();
 *   auto ctrl = rx.NewChannel(Prio::kHigh, 1, false, 1U);
 *   auto bulk_a = rx.NewChannel(Prio::kLow, 33, false, {});
 *   auto bulk_b = rx.NewChannel(Prio::kLow, 66, false, {});
 *
 *   std::thread consumer([rx]() mutable {
 *     for (;;) Handle(rx.Receive());
 *   });
 * @endcode
 */

#ifndef MCH_RECEIVER_HPP_
#define MCH_RECEIVER_HPP_

#include "mch/cancel_token.hpp"
#include "mch/registry.hpp"
#include "mch/sender.hpp"
#include "mch/vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <memory>
#include <utility>

namespace mch {

// ============================================================================
// ChannelOptions
// ============================================================================

/**
 * @brief Per-channel settings other than the priority.
 */
struct ChannelOptions {
  uint32_t weight{1U};
  bool frozen{false};
  optional<uint32_t> capacity{};  ///< Empty: unbounded.
};

// ============================================================================
// Receiver<T, P>
// ============================================================================

template <typename T, typename P>
class Receiver final {
 public:
  using RegistryType = Registry<T, P>;
  using SenderType = Sender<T, P>;
  using TimePoint = typename RegistryType::TimePoint;

  /** @brief Create a new, independent registry and its first receiver. */
  Receiver() : Receiver(RegistryConfig{}) {}

  explicit Receiver(const RegistryConfig& cfg)
      : registry_(std::make_shared<RegistryType>(cfg)) {
    registry_->AttachReceiver();
  }

  Receiver(const Receiver& other) : registry_(other.registry_) {
    if (registry_) registry_->AttachReceiver();
  }

  Receiver(Receiver&& other) noexcept : registry_(std::move(other.registry_)) {}

  Receiver& operator=(const Receiver& other) {
    if (this != &other) {
      Receiver tmp(other);
      Swap(tmp);
    }
    return *this;
  }

  Receiver& operator=(Receiver&& other) noexcept {
    if (this != &other) {
      Release();
      registry_ = std::move(other.registry_);
    }
    return *this;
  }

  ~Receiver() { Release(); }

  // ======================== Receive ========================

  /** @brief Block until a message is selected. */
  T Receive() {
    MCH_ASSERT(registry_ != nullptr);
    return std::move(registry_->PopWait(nullptr, nullptr)).value();
  }

  /** @brief Block until a message is selected or @p token is cancelled. */
  expected<T, ChannelError> Receive(const CancelToken& token) {
    MCH_ASSERT(registry_ != nullptr);
    return registry_->PopWait(nullptr, &token);
  }

  /** @brief One selection pass; kEmpty if nothing is eligible right now. */
  expected<T, ChannelError> TryReceive() {
    MCH_ASSERT(registry_ != nullptr);
    return registry_->TryPop();
  }

  /**
   * @brief Timed receive.
   * @param timeout_us Maximum time to wait, in microseconds.
   * @return kTimedOut if nothing became eligible in time.
   */
  expected<T, ChannelError> ReceiveFor(uint64_t timeout_us) {
    return ReceiveUntil(RegistryType::DeadlineAfter(timeout_us));
  }

  expected<T, ChannelError> ReceiveUntil(TimePoint deadline) {
    MCH_ASSERT(registry_ != nullptr);
    return registry_->PopWait(&deadline, nullptr);
  }

  // ======================== Channel Management ========================

  /**
   * @brief Register a channel and return its producer handle.
   *
   * @param priority Greater values are served first.
   * @param weight   Relative share within the priority level; 0 is accepted
   *                 but the channel is then never selected. A level whose
   *                 ready channels all have weight 0 does not hold back
   *                 lower levels, so such a channel does not preempt them.
   * @param frozen   Start excluded from selection.
   * @param capacity Bound of the queue; empty for unbounded.
   */
  SenderType NewChannel(const P& priority, uint32_t weight, bool frozen,
                        optional<uint32_t> capacity) {
    MCH_ASSERT(registry_ != nullptr);
    return SenderType(registry_,
                      registry_->Register(priority, weight, frozen, capacity));
  }

  SenderType NewChannel(const P& priority,
                        const ChannelOptions& opts = ChannelOptions{}) {
    return NewChannel(priority, opts.weight, opts.frozen, opts.capacity);
  }

  /**
   * @brief Remove a channel: close it and discard its backlog.
   * @return kNotFound if the id is not registered (e.g. already removed).
   */
  expected<void, ChannelError> RemoveChannel(ChannelId id) {
    MCH_ASSERT(registry_ != nullptr);
    return registry_->Remove(id);
  }

  expected<void, ChannelError> RemoveChannel(const SenderType& sender) {
    return RemoveChannel(sender.Id());
  }

  // ======================== Cancellation ========================

  /** @brief Token whose Cancel() interrupts waits on this registry. */
  CancelToken MakeCancelToken() const {
    MCH_ASSERT(registry_ != nullptr);
    return CancelToken(std::weak_ptr<void>(registry_),
                       &RegistryType::WakeAllThunk);
  }

  // ======================== Query ========================

  bool NoChannels() const { return registry_->Empty(); }
  size_t ChannelCount() const { return registry_->ChannelCount(); }
  size_t PriorityLevelCount() const { return registry_->PriorityLevelCount(); }

  expected<size_t, ChannelError> QueueLength(ChannelId id) const {
    return registry_->QueueLength(id);
  }

  uint32_t ReceiverCount() const { return registry_->ReceiverCount(); }

  RegistryStatistics GetStatistics() const { return registry_->GetStatistics(); }
  void ResetStatistics() { registry_->ResetStatistics(); }

  /** @brief True when both handles observe the same registry. */
  bool SharesRegistryWith(const Receiver& other) const noexcept {
    return registry_ == other.registry_;
  }

 private:
  void Release() noexcept {
    if (registry_) {
      registry_->DetachReceiver();
      registry_.reset();
    }
  }

  void Swap(Receiver& other) noexcept { registry_.swap(other.registry_); }

  std::shared_ptr<RegistryType> registry_;
};

// ============================================================================
// NewRegistry
// ============================================================================

/**
 * @brief Create an empty multi-channel system and return its first Receiver.
 *
 * Each call yields an independent registry.
 */
template <typename T, typename P>
Receiver<T, P> NewRegistry(const RegistryConfig& cfg = RegistryConfig{}) {
  return Receiver<T, P>(cfg);
}

}  // namespace mch

#endif  // MCH_RECEIVER_HPP_
