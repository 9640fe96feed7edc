/**
 * @file vocabulary.hpp
 * @brief Exception-free vocabulary types: expected, optional, FixedString.
 *
 * All types are header-only, heap-free and usable with
 * -fno-exceptions -fno-rtti. Misuse (value() on an error, get_error() on a
 * value) is a programmer error caught by MIIA_ASSERT.
 */

#ifndef MIIA_VOCABULARY_HPP_
#define MIIA_VOCABULARY_HPP_

#include "miia/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace miia {

// ============================================================================
// Shared Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result.
 *
 * Constructed only through the named factories success() / error() so call
 * sites read unambiguously:
 * @code
 *   return expected<Frame, RobotError>::error(RobotError::kTimeout);
 * @endcode
 */
template <typename V, typename E>
class expected final {
  static_assert(std::is_enum<E>::value, "error type must be an enum");

 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    MIIA_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    MIIA_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    MIIA_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    MIIA_ASSERT(!has_value_);
    return storage_.err;
  }

  template <typename U>
  V value_or(U&& fallback) const& {
    return has_value_ ? storage_.value : static_cast<V>(std::forward<U>(fallback));
  }

 private:
  struct ErrorTag {};

  explicit expected(const V& v) : has_value_(true) {
    new (&storage_.value) V(v);
  }
  explicit expected(V&& v) : has_value_(true) {
    new (&storage_.value) V(std::move(v));
  }
  expected(ErrorTag, E e) noexcept : has_value_(false) { storage_.err = e; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    }
  }

  union Storage {
    Storage() noexcept : err() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/// @brief Specialization for operations that only report success or failure.
template <typename E>
class expected<void, E> final {
  static_assert(std::is_enum<E>::value, "error type must be an enum");

 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    MIIA_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    new (&storage_.value) T(v);
  }
  optional(T&& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    new (&storage_.value) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) new (&storage_.value) T(other.storage_.value);
  }
  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) new (&storage_.value) T(std::move(other.storage_.value));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        new (&storage_.value) T(other.storage_.value);
        has_value_ = true;
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        new (&storage_.value) T(std::move(other.storage_.value));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & {
    MIIA_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const& {
    MIIA_ASSERT(has_value_);
    return storage_.value;
  }

  template <typename U>
  T value_or(U&& fallback) const& {
    return has_value_ ? storage_.value : static_cast<T>(std::forward<U>(fallback));
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept : dummy(0) {}
    ~Storage() {}
    uint8_t dummy;
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// Tag selecting the truncating constructor / assign overload.
struct TruncateToCapacity_t {
  explicit constexpr TruncateToCapacity_t() = default;
};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Stack-allocated, always null-terminated string of at most
 *        Capacity characters.
 */
template <uint32_t Capacity>
class FixedString final {
  static_assert(Capacity > 0U, "FixedString capacity must be non-zero");

 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  /// Construct from a literal that is known to fit.
  template <uint32_t N>
  FixedString(const char (&literal)[N]) noexcept  // NOLINT(runtime/explicit)
      : size_(0U) {
    static_assert(N - 1U <= Capacity, "literal exceeds FixedString capacity");
    CopyFrom(literal, N - 1U);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    uint32_t n = 0U;
    while (n < Capacity && str[n] != '\0') ++n;
    CopyFrom(str, n);
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  template <uint32_t Other>
  bool operator==(const FixedString<Other>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }

  template <typename T>
  bool operator!=(const T& rhs) const noexcept {
    return !(*this == rhs);
  }

 private:
  void CopyFrom(const char* src, uint32_t n) noexcept {
    std::memcpy(buf_, src, n);
    buf_[n] = '\0';
    size_ = n;
  }

  char buf_[Capacity + 1U];
  uint32_t size_;
};

}  // namespace miia

#endif  // MIIA_VOCABULARY_HPP_
