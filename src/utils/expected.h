/**
 * @file expected.h
 * @brief Minimal std::expected-like result type for C++17
 *
 * Expected<T, E> holds either a value of type T or an error of type E.
 * Functions return MakeUnexpected(error) on failure and a plain value on
 * success. Expected<void, E> carries only the error state.
 */

#pragma once

#include <cassert>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace talentvault::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(const E& error) : error_(error) {}
  explicit Unexpected(E&& error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by value() when the Expected holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  const char* what() const noexcept override { return "Bad Expected access: value() called on error"; }

  const E& error() const { return error_; }

 private:
  E error_;
};

template <typename T, typename E>
class Expected;

namespace detail {

template <typename U>
struct IsExpected : std::false_type {};

template <typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};

}  // namespace detail

template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  // NOLINTNEXTLINE(google-explicit-constructor) - Implicit success conversion is the point of this type
  Expected(const T& value) : storage_(std::in_place_index<0>, value) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

  template <typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                                    !std::is_same_v<std::decay_t<U>, Expected> &&
                                                    !std::is_same_v<std::decay_t<U>, T> &&
                                                    !std::is_same_v<std::decay_t<U>, Unexpected<E>>>>
  // NOLINTNEXTLINE(google-explicit-constructor,bugprone-forwarding-reference-overload)
  Expected(U&& value) : storage_(std::in_place_index<0>, T(std::forward<U>(value))) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<0>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<0>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::move(std::get<0>(storage_));
  }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  E& error() & {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::get<1>(storage_);
  }

  const E& error() const& {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::get<1>(storage_);
  }

  E&& error() && {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::move(std::get<1>(storage_));
  }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value, propagating the error
   */
  template <typename F>
  auto transform(F&& func) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
    using U = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Unexpected<E>(error());
    }
    if constexpr (std::is_void_v<U>) {
      func(std::get<0>(storage_));
      return Expected<void, E>();
    } else {
      return Expected<U, E>(func(std::get<0>(storage_)));
    }
  }

  /**
   * @brief Chain an operation that itself returns Expected
   */
  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
    using Result = std::invoke_result_t<F, const T&>;
    static_assert(detail::IsExpected<Result>::value, "and_then callable must return Expected");
    if (!has_value()) {
      return Unexpected<E>(error());
    }
    return func(std::get<0>(storage_));
  }

  /**
   * @brief Recover from an error with a callable returning Expected<T, E>
   */
  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return func(error());
  }

  /**
   * @brief Map the error, keeping the value
   */
  template <typename F>
  auto transform_error(F&& func) const& -> Expected<T, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<T, G>(std::get<0>(storage_));
    }
    return Unexpected<G>(func(error()));
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Expected specialization for operations without a result value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : error_(unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  E& error() & {
    assert(!has_value() && "error() called on Expected containing a value");
    return *error_;
  }

  const E& error() const& {
    assert(!has_value() && "error() called on Expected containing a value");
    return *error_;
  }

  E&& error() && {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::move(*error_);
  }

  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F> {
    using Result = std::invoke_result_t<F>;
    static_assert(detail::IsExpected<Result>::value, "and_then callable must return Expected");
    if (!has_value()) {
      return Unexpected<E>(*error_);
    }
    return func();
  }

  template <typename F>
  auto transform_error(F&& func) const& -> Expected<void, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<void, G>();
    }
    return Unexpected<G>(func(*error_));
  }

 private:
  std::optional<E> error_;
};

}  // namespace talentvault::utils
