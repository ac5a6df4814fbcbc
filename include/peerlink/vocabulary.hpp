/**
 * @file vocabulary.hpp
 * @brief Error-as-value vocabulary types shared by all peerlink modules.
 *
 * expected<V, E>: value or error code, no exceptions.
 * optional<T>:    nullable value for lookups.
 *
 * Header-only, C++17.
 */

#ifndef PEERLINK_VOCABULARY_HPP_
#define PEERLINK_VOCABULARY_HPP_

#include "peerlink/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace peerlink {

// ============================================================================
// Common error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kBufferFull,
  kFormatNotSupported,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the named factories success() / error(). Accessing
 * value() on an error (or get_error() on a value) is a programming error and
 * asserts in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (&r.storage_) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (&r.storage_) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.err_ = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    } else {
      err_ = other.err_;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(std::move(other.value()));
    } else {
      err_ = other.err_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      } else {
        err_ = other.err_;
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
        ::new (&storage_) V(std::move(other.value()));
      } else {
        err_ = other.err_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    PEERLINK_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    PEERLINK_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  V&& value() && noexcept {
    PEERLINK_ASSERT(has_value_);
    return std::move(*reinterpret_cast<V*>(&storage_));
  }

  E get_error() const noexcept {
    PEERLINK_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? value() : fallback;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  E err_;
  bool has_value_;
};

/** @brief Specialization for operations that produce no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected r;
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.err_ = e;
    r.has_value_ = false;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    PEERLINK_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

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
    ::new (&storage_) T(v);
  }

  optional(T&& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_) T(other.value());
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_) T(std::move(other.value()));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(other.value());
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
        ::new (&storage_) T(std::move(other.value()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    PEERLINK_ASSERT(has_value_);
    return *reinterpret_cast<T*>(&storage_);
  }

  const T& value() const noexcept {
    PEERLINK_ASSERT(has_value_);
    return *reinterpret_cast<const T*>(&storage_);
  }

  T value_or(const T& fallback) const {
    return has_value_ ? value() : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      reinterpret_cast<T*>(&storage_)->~T();
      has_value_ = false;
    }
  }

 private:
  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

}  // namespace peerlink

#endif  // PEERLINK_VOCABULARY_HPP_
