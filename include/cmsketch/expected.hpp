#pragma once

#include <new>
#include <type_traits>
#include <utility>

#include "cmsketch/error.hpp"

namespace cmsketch {

// Value-or-error return type used across the library instead of exceptions.
template <class T, class E> class expected {
public:
  using value_type = T;
  using error_type = E;

  expected(const T& v) : has_(true) {
    ::new (&storage_.val) T(v);
  }
  expected(T&& v) noexcept(std::is_nothrow_move_constructible_v<T>) : has_(true) {
    ::new (&storage_.val) T(std::move(v));
  }
  expected(const E& e) {
    ::new (&storage_.err) E(e);
  }
  expected(E&& e) noexcept(std::is_nothrow_move_constructible_v<E>) {
    ::new (&storage_.err) E(std::move(e));
  }

  expected(const expected& other) : has_(other.has_) {
    if (has_) {
      ::new (&storage_.val) T(other.storage_.val);
    } else {
      ::new (&storage_.err) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                      std::is_nothrow_move_constructible_v<E>)
      : has_(other.has_) {
    if (has_) {
      ::new (&storage_.val) T(std::move(other.storage_.val));
    } else {
      ::new (&storage_.err) E(std::move(other.storage_.err));
    }
  }

  auto operator=(const expected& other) -> expected& {
    if (this != &other) {
      destroy();
      ::new (this) expected(other);
    }
    return *this;
  }

  auto operator=(expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                            std::is_nothrow_move_constructible_v<E>) -> expected& {
    if (this != &other) {
      destroy();
      ::new (this) expected(std::move(other));
    }
    return *this;
  }

  ~expected() {
    destroy();
  }

  template <class... Args> static auto from_error(Args&&... args) -> expected {
    return expected{E(std::forward<Args>(args)...)};
  }

  [[nodiscard]] auto has_value() const noexcept -> bool {
    return has_;
  }
  explicit operator bool() const noexcept {
    return has_;
  }

  auto value() & -> T& {
    return storage_.val;
  }
  [[nodiscard]] auto value() const& -> const T& {
    return storage_.val;
  }
  auto value() && -> T&& {
    return std::move(storage_.val);
  }
  template <class U> [[nodiscard]] auto value_or(U&& fallback) const& -> T {
    return has_ ? storage_.val : static_cast<T>(std::forward<U>(fallback));
  }

  auto operator->() noexcept -> T* {
    return &storage_.val;
  }
  auto operator->() const noexcept -> const T* {
    return &storage_.val;
  }

  auto error() & -> E& {
    return storage_.err;
  }
  [[nodiscard]] auto error() const& -> const E& {
    return storage_.err;
  }
  auto error() && -> E&& {
    return std::move(storage_.err);
  }

private:
  void destroy() noexcept {
    if (has_) {
      storage_.val.~T();
    } else {
      storage_.err.~E();
    }
  }

  bool has_{false};
  union Storage {
    T val;
    E err;
    Storage() {}
    ~Storage() {}
  } storage_;
};

template <class E> class expected<void, E> {
public:
  using value_type = void;
  using error_type = E;

  expected() : has_(true) {}
  expected(const E& e) {
    ::new (&storage_.err) E(e);
  }
  expected(E&& e) noexcept(std::is_nothrow_move_constructible_v<E>) {
    ::new (&storage_.err) E(std::move(e));
  }
  expected(const expected& other) : has_(other.has_) {
    if (!has_) {
      ::new (&storage_.err) E(other.storage_.err);
    }
  }
  expected(expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>) : has_(other.has_) {
    if (!has_) {
      ::new (&storage_.err) E(std::move(other.storage_.err));
    }
  }
  auto operator=(const expected& other) -> expected& {
    if (this != &other) {
      destroy();
      ::new (this) expected(other);
    }
    return *this;
  }
  auto operator=(expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>) -> expected& {
    if (this != &other) {
      destroy();
      ::new (this) expected(std::move(other));
    }
    return *this;
  }
  ~expected() {
    destroy();
  }

  template <class... Args> static auto from_error(Args&&... args) -> expected {
    return expected{E(std::forward<Args>(args)...)};
  }

  [[nodiscard]] auto has_value() const noexcept -> bool {
    return has_;
  }
  explicit operator bool() const noexcept {
    return has_;
  }

  void value() const noexcept {}
  auto error() & -> E& {
    return storage_.err;
  }
  [[nodiscard]] auto error() const& -> const E& {
    return storage_.err;
  }
  auto error() && -> E&& {
    return std::move(storage_.err);
  }

private:
  void destroy() noexcept {
    if (!has_) {
      storage_.err.~E();
    }
  }

  bool has_{false};
  union Storage {
    E err;
    Storage() {}
    ~Storage() {}
  } storage_;
};

template <class T> using result = expected<T, error>;

} // namespace cmsketch
