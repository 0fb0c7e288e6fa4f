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
 * @file mch/registry.hpp
 * @brief Registry - shared store of all channels of one multi-channel system,
 *        plus the selection engine and the wait/wake substrate.
 *
 * Architecture:
 *   Sender::Send() --> Push (registry mutex) --> notify_one(ready_cv_)
 *                                                      |
 *   Receiver::Receive() --> PickLocked: groups_ highest priority first
 *                             filter: not frozen, non-empty, weight > 0
 *                             weighted draw within the first non-empty level
 *                           --> Pop head --> notify_one(channel not_full)
 *                           nothing eligible --> wait(ready_cv_) and re-run
 *
 * One mutex guards the channel map, the priority groups, and every queue.
 * A receive therefore decides on a consistent view of all channels. The
 * scan is O(number of channels): eligibility changes on push, pop and
 * freeze toggles, which a heap keyed on priority cannot track cheaply.
 *
 * Removal is destructive: the channel is closed, its backlog discarded and
 * its senders fail with kClosed from then on.
 *
 * @tparam T Message type (movable; copyable only if copy-sends are used).
 * @tparam P Priority type, compared with operator< only. Greater is served
 *           first.
 */

#ifndef MCH_REGISTRY_HPP_
#define MCH_REGISTRY_HPP_

#include "mch/cancel_token.hpp"
#include "mch/channel.hpp"
#include "mch/log.hpp"
#include "mch/platform.hpp"
#include "mch/vocabulary.hpp"
#include "mch/weighted_select.hpp"

#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mch {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Registry tunables.
 */
struct RegistryConfig {
  /// Label used in log lines.
  std::string name{"mch"};
  /// Seed of the selection RNG; 0 seeds from std::random_device.
  uint32_t seed{0U};
  /// Expected number of channels (pre-sizes lookup and scratch storage).
  uint32_t reserve_channels{16U};
  /// First channel id handed out. Ids wrap and skip ids still registered.
  uint32_t first_channel_id{0U};
};

// ============================================================================
// Statistics
// ============================================================================

struct RegistryStatistics {
  uint64_t messages_sent{0U};
  uint64_t messages_received{0U};
  uint64_t messages_discarded{0U};
  uint64_t channels_registered{0U};
  uint64_t channels_removed{0U};
  uint64_t receive_waits{0U};
  uint64_t send_waits{0U};
};

// ============================================================================
// Registry<T, P>
// ============================================================================

template <typename T, typename P>
class Registry final {
 public:
  using ChannelType = Channel<T, P>;
  using ChannelPtr = std::shared_ptr<ChannelType>;
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit Registry(const RegistryConfig& cfg)
      : name_(cfg.name),
        next_id_(cfg.first_channel_id),
        rng_(SeedFrom(cfg.seed)) {
    lookup_.reserve(cfg.reserve_channels);
    candidates_.Reserve(cfg.reserve_channels);
    MCH_LOG_DEBUG("Registry", "[%s] created (seed=%u)", name_.c_str(),
                  static_cast<unsigned>(cfg.seed));
  }

  ~Registry() {
    MCH_LOG_DEBUG("Registry", "[%s] destroyed with %zu channel(s)",
                  name_.c_str(), lookup_.size());
  }

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;
  Registry(Registry&&) = delete;
  Registry& operator=(Registry&&) = delete;

  // ======================== Structure ========================

  /**
   * @brief Create a channel and insert it into its priority group.
   *
   * Always succeeds. A capacity of 0 is normalized to 1.
   */
  ChannelPtr Register(const P& priority, uint32_t weight, bool frozen,
                      optional<uint32_t> capacity) {
    if (capacity.has_value() && capacity.value() == 0U) {
      MCH_LOG_WARN("Registry", "[%s] capacity 0 is not supported, using 1",
                   name_.c_str());
      capacity = optional<uint32_t>(1U);
    }

    ChannelPtr ch;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      const ChannelId id(NextFreeIdLocked());
      ch = std::make_shared<ChannelType>(id, priority, weight, frozen,
                                         capacity);
      lookup_.emplace(id.value(), ch);
      InsertIntoGroupLocked(ch);
      ++stats_.channels_registered;
    }
    ready_cv_.notify_all();

    MCH_LOG_DEBUG("Registry", "[%s] channel %u registered (weight=%u cap=%u%s)",
                  name_.c_str(), static_cast<unsigned>(ch->Id().value()),
                  static_cast<unsigned>(weight),
                  static_cast<unsigned>(capacity.value_or(0U)),
                  frozen ? " frozen" : "");
    return ch;
  }

  /**
   * @brief Close, discard and detach a channel.
   * @return kNotFound if no channel with this id is registered.
   */
  expected<void, ChannelError> Remove(ChannelId id) {
    size_t dropped = 0U;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = lookup_.find(id.value());
      if (it == lookup_.end()) {
        return expected<void, ChannelError>::error(ChannelError::kNotFound);
      }
      ChannelPtr ch = it->second;
      lookup_.erase(it);
      EraseFromGroupLocked(*ch);
      dropped = ch->Detach();
      stats_.messages_discarded += dropped;
      ++stats_.channels_removed;
    }
    ready_cv_.notify_all();

    if (dropped > 0U) {
      MCH_LOG_WARN("Registry", "[%s] channel %u removed, %zu message(s) discarded",
                   name_.c_str(), static_cast<unsigned>(id.value()), dropped);
    } else {
      MCH_LOG_DEBUG("Registry", "[%s] channel %u removed", name_.c_str(),
                    static_cast<unsigned>(id.value()));
    }
    return expected<void, ChannelError>::success();
  }

  /**
   * @brief Freeze or unfreeze a channel. Unfreezing a channel with a backlog
   *        wakes blocked receivers.
   */
  expected<void, ChannelError> SetFrozen(ChannelType& ch, bool frozen) {
    bool wake = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (ch.IsRemoved()) {
        return expected<void, ChannelError>::error(ChannelError::kNotFound);
      }
      wake = ch.SetFrozen(frozen);
    }
    if (wake) {
      ready_cv_.notify_all();
    }
    return expected<void, ChannelError>::success();
  }

  expected<bool, ChannelError> IsFrozen(const ChannelType& ch) const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ch.IsRemoved()) {
      return expected<bool, ChannelError>::error(ChannelError::kNotFound);
    }
    return expected<bool, ChannelError>::success(ch.IsFrozen());
  }

  /** @brief Close for sending; the backlog remains deliverable. */
  void Close(ChannelType& ch) {
    std::lock_guard<std::mutex> lk(mtx_);
    ch.Close();
  }

  bool IsClosed(const ChannelType& ch) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !ch.IsOpen();
  }

  // ======================== Send Path ========================

  /**
   * @brief Push @p msg into @p ch.
   *
   * @param blocking  Wait while the channel is full (otherwise kFull).
   * @param deadline  Give up with kTimedOut at this instant (nullptr: never).
   * @param cancel    Give up with kCancelled once cancelled (nullptr: never).
   *
   * On any error @p msg has not been moved from.
   */
  template <typename U>
  expected<void, ChannelError> Push(ChannelType& ch, U&& msg, bool blocking,
                                    const TimePoint* deadline,
                                    const CancelToken* cancel) {
    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
      if (MCH_UNLIKELY(!ch.IsOpen())) {
        return expected<void, ChannelError>::error(ChannelError::kClosed);
      }
      if (MCH_UNLIKELY(receivers_ == 0U)) {
        return expected<void, ChannelError>::error(ChannelError::kDisconnected);
      }
      if (cancel != nullptr && cancel->IsCancelled()) {
        ch.ForwardNotFull();
        return expected<void, ChannelError>::error(ChannelError::kCancelled);
      }
      if (MCH_LIKELY(!ch.Full())) {
        ch.Push(std::forward<U>(msg));
        ++stats_.messages_sent;
        const bool wake = (blocked_receivers_ > 0U) && ch.IsReady();
        lk.unlock();
        if (wake) {
          ready_cv_.notify_one();
        }
        return expected<void, ChannelError>::success();
      }
      if (!blocking) {
        return expected<void, ChannelError>::error(ChannelError::kFull);
      }
      if (deadline != nullptr && Clock::now() >= *deadline) {
        return expected<void, ChannelError>::error(ChannelError::kTimedOut);
      }
      ++stats_.send_waits;
      ch.WaitNotFull(lk, deadline);
    }
  }

  // ======================== Receive Path ========================

  /** @brief One selection pass; kEmpty if nothing is eligible. */
  expected<T, ChannelError> TryPop() {
    std::lock_guard<std::mutex> lk(mtx_);
    ChannelType* ch = PickLocked();
    if (ch == nullptr) {
      return expected<T, ChannelError>::error(ChannelError::kEmpty);
    }
    return expected<T, ChannelError>::success(TakeLocked(*ch));
  }

  /**
   * @brief Select a message, waiting while nothing is eligible.
   *
   * Every wake re-runs the full selection; nothing is reserved for a waiter.
   * Cancellation is checked before selection, so a cancelled token never
   * consumes. On timeout a final selection pass is made.
   */
  expected<T, ChannelError> PopWait(const TimePoint* deadline,
                                    const CancelToken* cancel) {
    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
      if (cancel != nullptr && cancel->IsCancelled()) {
        ForwardReadyLocked();
        return expected<T, ChannelError>::error(ChannelError::kCancelled);
      }
      ChannelType* ch = PickLocked();
      if (ch != nullptr) {
        return expected<T, ChannelError>::success(TakeLocked(*ch));
      }
      if (deadline != nullptr && Clock::now() >= *deadline) {
        return expected<T, ChannelError>::error(ChannelError::kTimedOut);
      }

      ++stats_.receive_waits;
      ++blocked_receivers_;
      if (deadline != nullptr) {
        (void)ready_cv_.wait_until(lk, *deadline);
      } else {
        ready_cv_.wait(lk);
      }
      --blocked_receivers_;
    }
  }

  // ======================== Receiver Accounting ========================

  void AttachReceiver() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    ++receivers_;
  }

  /**
   * @brief Drop one receiver. When the last one goes, blocked senders are
   *        woken and every later send fails with kDisconnected.
   */
  void DetachReceiver() noexcept {
    bool last = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      MCH_ASSERT(receivers_ > 0U);
      --receivers_;
      last = (receivers_ == 0U);
      if (last) {
        WakeAllSendersLocked();
      }
    }
    if (last) {
      MCH_LOG_INFO("Registry", "[%s] last receiver dropped, senders disconnected",
                   name_.c_str());
    }
  }

  uint32_t ReceiverCount() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return receivers_;
  }

  // ======================== Wake-up ========================

  /** @brief Wake every blocked receiver and sender (cancellation). */
  void WakeAll() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      WakeAllSendersLocked();
    }
    ready_cv_.notify_all();
  }

  static void WakeAllThunk(void* self) noexcept {
    static_cast<Registry*>(self)->WakeAll();
  }

  /** @brief now + timeout_us, saturating at TimePoint::max(). */
  static TimePoint DeadlineAfter(uint64_t timeout_us) noexcept {
    const TimePoint now = Clock::now();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::microseconds>(
            TimePoint::max() - now);
    if (timeout_us >= static_cast<uint64_t>(headroom.count())) {
      return TimePoint::max();
    }
    return now + std::chrono::microseconds(static_cast<int64_t>(timeout_us));
  }

  // ======================== Query ========================

  size_t ChannelCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lookup_.size();
  }

  bool Empty() const { return ChannelCount() == 0U; }

  size_t PriorityLevelCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return groups_.size();
  }

  expected<size_t, ChannelError> QueueLength(ChannelId id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = lookup_.find(id.value());
    if (it == lookup_.end()) {
      return expected<size_t, ChannelError>::error(ChannelError::kNotFound);
    }
    return expected<size_t, ChannelError>::success(it->second->Size());
  }

  size_t QueueLength(const ChannelType& ch) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ch.Size();
  }

  ChannelPtr Find(ChannelId id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = lookup_.find(id.value());
    return (it == lookup_.end()) ? ChannelPtr{} : it->second;
  }

  RegistryStatistics GetStatistics() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stats_;
  }

  void ResetStatistics() {
    std::lock_guard<std::mutex> lk(mtx_);
    stats_ = RegistryStatistics{};
  }

  const std::string& Name() const noexcept { return name_; }

 private:
  struct PriorityGroup {
    P priority;
    std::vector<ChannelPtr> channels;
  };

  using GroupIter = typename std::vector<PriorityGroup>::iterator;

  static std::mt19937::result_type SeedFrom(uint32_t seed) {
    if (seed != 0U) return seed;
    std::random_device rd;
    return rd();
  }

  /// First group whose priority is not greater than @p priority.
  GroupIter LowerBoundLocked(const P& priority) {
    return std::lower_bound(
        groups_.begin(), groups_.end(), priority,
        [](const PriorityGroup& g, const P& p) { return p < g.priority; });
  }

  /// Wrapping id counter; a live id is never handed out twice.
  uint32_t NextFreeIdLocked() {
    uint32_t id = next_id_++;
    while (lookup_.find(id) != lookup_.end()) {
      id = next_id_++;
    }
    return id;
  }

  static bool SamePriority(const P& a, const P& b) {
    return !(a < b) && !(b < a);
  }

  void InsertIntoGroupLocked(const ChannelPtr& ch) {
    GroupIter it = LowerBoundLocked(ch->Priority());
    if (it != groups_.end() && SamePriority(it->priority, ch->Priority())) {
      it->channels.push_back(ch);
      return;
    }
    PriorityGroup group{ch->Priority(), {}};
    group.channels.push_back(ch);
    groups_.insert(it, std::move(group));
  }

  void EraseFromGroupLocked(const ChannelType& ch) {
    GroupIter it = LowerBoundLocked(ch.Priority());
    MCH_ASSERT_MSG(it != groups_.end() && SamePriority(it->priority, ch.Priority()),
                   "channel priority group missing");
    auto& members = it->channels;
    auto pos = std::find_if(members.begin(), members.end(),
                            [&ch](const ChannelPtr& p) { return p.get() == &ch; });
    MCH_ASSERT_MSG(pos != members.end(), "channel missing from its group");
    members.erase(pos);
    if (members.empty()) {
      groups_.erase(it);
    }
  }

  /**
   * @brief Weighted choice in the highest priority level that has a ready,
   *        unfrozen, non-zero-weight channel.
   * @return nullptr if no level has one.
   */
  ChannelType* PickLocked() {
    for (const PriorityGroup& group : groups_) {
      candidates_.Clear();
      for (const ChannelPtr& ch : group.channels) {
        if (ch->IsReady()) {
          candidates_.Add(ch.get(), ch->Weight());
        }
      }
      if (!candidates_.Empty()) {
        return candidates_.Draw(rng_);
      }
    }
    return nullptr;
  }

  bool HasEligibleLocked() const {
    for (const PriorityGroup& group : groups_) {
      for (const ChannelPtr& ch : group.channels) {
        if (ch->IsReady() && ch->Weight() > 0U) return true;
      }
    }
    return false;
  }

  T TakeLocked(ChannelType& ch) {
    ++stats_.messages_received;
    return ch.Pop();
  }

  /// A receiver leaving without consuming passes a possible wake-up on.
  void ForwardReadyLocked() {
    if (blocked_receivers_ > 0U && HasEligibleLocked()) {
      ready_cv_.notify_one();
    }
  }

  void WakeAllSendersLocked() noexcept {
    for (auto& kv : lookup_) {
      kv.second->WakeAllSenders();
    }
  }

  const std::string name_;
  mutable std::mutex mtx_;
  std::condition_variable ready_cv_;

  std::unordered_map<uint32_t, ChannelPtr> lookup_;
  std::vector<PriorityGroup> groups_;  ///< Highest priority first.
  uint32_t next_id_{0U};

  uint32_t receivers_{0U};
  uint32_t blocked_receivers_{0U};

  WeightedCandidates<ChannelType*> candidates_;
  std::mt19937 rng_;
  RegistryStatistics stats_;
};

}  // namespace mch

#endif  // MCH_REGISTRY_HPP_
