/**
 * @file cancel_token.hpp
 * @brief CancelToken - external cancellation of blocking send / receive.
 *
 * A token is bound to one registry (Receiver::MakeCancelToken()). Cancel()
 * raises a shared flag and wakes every waiter of that registry; waits that
 * were given the token return ChannelError::kCancelled without consuming or
 * enqueueing anything. Copies share the same flag. Reset() re-arms it.
 *
 * A default-constructed token is not bound to any registry: its flag is
 * honoured when a wait starts or wakes for another reason, but Cancel() on
 * it cannot interrupt a wait that is already blocked.
 */

#ifndef MCH_CANCEL_TOKEN_HPP_
#define MCH_CANCEL_TOKEN_HPP_

#include <atomic>
#include <memory>
#include <utility>

namespace mch {

class CancelToken final {
 public:
  /// Wakes every waiter of the registry behind the opaque owner pointer.
  using WakeFn = void (*)(void* owner);

  CancelToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

  CancelToken(std::weak_ptr<void> owner, WakeFn wake)
      : state_(std::make_shared<std::atomic<bool>>(false)),
        owner_(std::move(owner)),
        wake_(wake) {}

  void Cancel() noexcept {
    state_->store(true, std::memory_order_release);
    if (wake_ == nullptr) return;
    std::shared_ptr<void> owner = owner_.lock();
    if (owner) {
      wake_(owner.get());
    }
  }

  bool IsCancelled() const noexcept {
    return state_->load(std::memory_order_acquire);
  }

  void Reset() noexcept { state_->store(false, std::memory_order_release); }

 private:
  std::shared_ptr<std::atomic<bool>> state_;
  std::weak_ptr<void> owner_;
  WakeFn wake_{nullptr};
};

}  // namespace mch

#endif  // MCH_CANCEL_TOKEN_HPP_
