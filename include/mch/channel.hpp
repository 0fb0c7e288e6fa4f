/**
 * @file channel.hpp
 * @brief Channel<T, P> - one FIFO queue plus its selection metadata.
 *
 * A Channel carries { id, priority, weight, frozen, capacity, open } and a
 * std::deque<T>. Priority and weight decide which channel a receive picks,
 * never the order inside a channel: the queue is strict FIFO.
 *
 * Thread safety: a Channel has no mutex of its own. Every member is read and
 * written under the owning Registry's mutex (one exclusion domain per
 * registry, which is what makes the selection snapshot consistent across
 * channels). The Channel does own the "not full" condition variable that
 * blocked senders of this channel wait on; it is always waited on with the
 * registry's lock.
 */

#ifndef MCH_CHANNEL_HPP_
#define MCH_CHANNEL_HPP_

#include "mch/platform.hpp"
#include "mch/vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace mch {

template <typename T, typename P>
class Channel final {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  Channel(ChannelId id, const P& priority, uint32_t weight, bool frozen,
          optional<uint32_t> capacity)
      : id_(id),
        priority_(priority),
        weight_(weight),
        capacity_(capacity),
        frozen_(frozen) {}

  ~Channel() = default;

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;
  Channel(Channel&&) = delete;
  Channel& operator=(Channel&&) = delete;

  // ======================== Metadata ========================

  ChannelId Id() const noexcept { return id_; }
  const P& Priority() const noexcept { return priority_; }
  uint32_t Weight() const noexcept { return weight_; }
  optional<uint32_t> Capacity() const noexcept { return capacity_; }

  bool IsFrozen() const noexcept { return frozen_; }

  /**
   * @brief Toggle the frozen flag. Idempotent; never touches the queue.
   * @return true if this call unfroze a channel that has pending messages,
   *         i.e. receivers should be woken.
   */
  bool SetFrozen(bool frozen) noexcept {
    bool was_frozen = frozen_;
    frozen_ = frozen;
    return was_frozen && !frozen && !queue_.empty();
  }

  bool IsOpen() const noexcept { return open_; }
  bool IsRemoved() const noexcept { return removed_; }

  // ======================== Queue State ========================

  size_t Size() const noexcept { return queue_.size(); }
  bool Empty() const noexcept { return queue_.empty(); }

  bool Full() const noexcept {
    return capacity_.has_value() && queue_.size() >= capacity_.value();
  }

  /** @brief Ready (non-empty) and not frozen. Weight is the selector's call. */
  bool IsReady() const noexcept { return !frozen_ && !queue_.empty(); }

  // ======================== Queue Operations ========================

  /**
   * @brief Append at the tail. Caller has checked IsOpen() and !Full().
   */
  template <typename U>
  void Push(U&& msg) {
    MCH_ASSERT(open_ && !Full());
    queue_.push_back(std::forward<U>(msg));
  }

  /**
   * @brief Remove and return the head. Never blocks; caller has checked
   *        !Empty(). Wakes one blocked sender of a bounded channel.
   */
  T Pop() {
    MCH_ASSERT(!queue_.empty());
    T msg = std::move(queue_.front());
    queue_.pop_front();
    if (capacity_.has_value() && blocked_senders_ > 0U) {
      not_full_.notify_one();
    }
    return msg;
  }

  /** @brief Mark closed: later pushes fail, queued messages stay poppable. */
  void Close() noexcept {
    open_ = false;
    not_full_.notify_all();
  }

  /**
   * @brief Close, drop the backlog, and flag the channel as detached from
   *        its registry.
   * @return Number of discarded messages.
   */
  size_t Detach() {
    open_ = false;
    removed_ = true;
    size_t dropped = queue_.size();
    queue_.clear();
    not_full_.notify_all();
    return dropped;
  }

  // ======================== Sender Blocking ========================

  /**
   * @brief Wait (with the registry lock held) until space may be available.
   *
   * Returns on notification, spurious wake-up, or deadline; the caller
   * re-checks every condition afterwards.
   */
  void WaitNotFull(std::unique_lock<std::mutex>& lk, const TimePoint* deadline) {
    ++blocked_senders_;
    if (deadline != nullptr) {
      (void)not_full_.wait_until(lk, *deadline);
    } else {
      not_full_.wait(lk);
    }
    --blocked_senders_;
  }

  /** @brief Pass a possibly consumed wake-up on to another blocked sender. */
  void ForwardNotFull() noexcept {
    if (!Full() && blocked_senders_ > 0U) {
      not_full_.notify_one();
    }
  }

  void WakeAllSenders() noexcept { not_full_.notify_all(); }

 private:
  const ChannelId id_;
  const P priority_;
  const uint32_t weight_;
  const optional<uint32_t> capacity_;
  bool frozen_;
  bool open_{true};
  bool removed_{false};
  uint32_t blocked_senders_{0U};
  std::deque<T> queue_;
  std::condition_variable not_full_;
};

}  // namespace mch

#endif  // MCH_CHANNEL_HPP_
