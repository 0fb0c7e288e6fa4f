/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected<V, E>, optional<T>, NewType<T, Tag>,
 *        and the error enums shared by every mch module.
 *
 * Errors are returned as values, never thrown, so the library stays usable
 * with -fno-exceptions. expected<V, E> supports move-only V (message types
 * such as std::unique_ptr<...> are common payloads).
 *
 * Usage:
 * @code
 *   auto r = rx.TryReceive();
 *   if (!r) {
 *     // r.get_error() == mch::ChannelError::kEmpty
 *   }
 * @endcode
 */

#ifndef MCH_VOCABULARY_HPP_
#define MCH_VOCABULARY_HPP_

#include "mch/platform.hpp"

#include <cstdint>

#include <new>
#include <type_traits>
#include <utility>

namespace mch {

// ============================================================================
// Error Enums
// ============================================================================

/// Outcome codes for channel operations (send / receive / registry).
enum class ChannelError : uint8_t {
  kFull = 0,      ///< Bounded channel at capacity (non-blocking send).
  kClosed,        ///< Channel was closed or removed; sends fail from now on.
  kEmpty,         ///< Nothing eligible at the instant of a try-receive.
  kTimedOut,      ///< A bounded wait expired; nothing consumed or enqueued.
  kCancelled,     ///< A wait was cancelled through a CancelToken.
  kNotFound,      ///< Channel id not present in the registry.
  kDisconnected   ///< No receiver handle remains for this registry.
};

inline constexpr const char* ChannelErrorToString(ChannelError e) noexcept {
  switch (e) {
    case ChannelError::kFull:
      return "Full";
    case ChannelError::kClosed:
      return "Closed";
    case ChannelError::kEmpty:
      return "Empty";
    case ChannelError::kTimedOut:
      return "TimedOut";
    case ChannelError::kCancelled:
      return "Cancelled";
    case ChannelError::kNotFound:
      return "NotFound";
    case ChannelError::kDisconnected:
      return "Disconnected";
    default:
      return "Unknown";
  }
}

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kMissingKey,
  kInvalidValue
};

inline constexpr const char* ConfigErrorToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:
      return "FileNotFound";
    case ConfigError::kParseError:
      return "ParseError";
    case ConfigError::kFormatNotSupported:
      return "FormatNotSupported";
    case ConfigError::kBufferFull:
      return "BufferFull";
    case ConfigError::kMissingKey:
      return "MissingKey";
    case ConfigError::kInvalidValue:
      return "InvalidValue";
    default:
      return "Unknown";
  }
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Lightweight value-or-error holder.
 *
 * Constructed only through the named factories success() / error().
 * Accessing value() on an error (or get_error() on a value) is a bug and
 * trips MCH_ASSERT.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(SuccessTag{}, v); }
  static expected success(V&& v) {
    return expected(SuccessTag{}, std::move(v));
  }
  static expected error(E e) noexcept { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.ref());
    } else {
      error_ = other.error_;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(std::move(other.ref()));
    } else {
      error_ = other.error_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      expected tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) V(std::move(other.ref()));
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    MCH_ASSERT(has_value_);
    return ref();
  }
  const V& value() const& {
    MCH_ASSERT(has_value_);
    return ref();
  }
  V&& value() && {
    MCH_ASSERT(has_value_);
    return std::move(ref());
  }

  V value_or(V default_val) const& {
    return has_value_ ? ref() : default_val;
  }
  V value_or(V default_val) && {
    return has_value_ ? std::move(ref()) : std::move(default_val);
  }

  E get_error() const noexcept {
    MCH_ASSERT(!has_value_);
    return error_;
  }

 private:
  struct SuccessTag {};
  struct ErrorTag {};

  template <typename U>
  expected(SuccessTag, U&& v) : has_value_(true) {
    ::new (&storage_) V(std::forward<U>(v));
  }
  expected(ErrorTag, E e) noexcept : has_value_(false), error_(e) {}

  V& ref() noexcept { return *reinterpret_cast<V*>(&storage_); }
  const V& ref() const noexcept {
    return *reinterpret_cast<const V*>(&storage_);
  }

  void Destroy() noexcept {
    if (has_value_) {
      ref().~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_value_;
  E error_{};
};

/** @brief void specialization: success carries no payload. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    MCH_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E e) noexcept : has_value_(ok), error_(e) {}

  bool has_value_;
  E error_;
};

// ============================================================================
// optional<T>
// ============================================================================

/**
 * @brief Minimal optional for trivially copyable values (ids, sizes,
 *        capacities).
 */
template <typename T>
class optional final {
  static_assert(std::is_trivially_copyable<T>::value,
                "mch::optional is limited to trivially copyable types");

 public:
  constexpr optional() noexcept : value_{}, has_value_(false) {}
  constexpr optional(T v) noexcept : value_(v), has_value_(true) {}  // NOLINT

  constexpr bool has_value() const noexcept { return has_value_; }
  constexpr explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    MCH_ASSERT(has_value_);
    return value_;
  }
  const T& value() const noexcept {
    MCH_ASSERT(has_value_);
    return value_;
  }

  constexpr T value_or(T default_val) const noexcept {
    return has_value_ ? value_ : default_val;
  }

  void reset() noexcept { has_value_ = false; }

 private:
  T value_;
  bool has_value_;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: two NewTypes over the same T with different tags
 *        do not convert into each other.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : value_{} {}
  constexpr explicit NewType(T v) noexcept : value_(v) {}

  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(const NewType& rhs) const noexcept {
    return value_ == rhs.value_;
  }
  constexpr bool operator!=(const NewType& rhs) const noexcept {
    return value_ != rhs.value_;
  }
  constexpr bool operator<(const NewType& rhs) const noexcept {
    return value_ < rhs.value_;
  }

 private:
  T value_;
};

struct ChannelIdTag {};
/// Unique, monotonically issued channel identifier (never reused per registry).
using ChannelId = NewType<uint32_t, ChannelIdTag>;

}  // namespace mch

#endif  // MCH_VOCABULARY_HPP_
