/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * tftpkit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tftpkit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tftpkit.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file generator.hpp
 * @brief This file defines a lazily evaluated generator coroutine.
 */
#pragma once
#ifndef TFTPKIT_GENERATOR_HPP
#define TFTPKIT_GENERATOR_HPP
#include <coroutine>
#include <exception>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>
/** @brief For internal tftpkit implementation details. */
namespace tftpkit::detail {
/**
 * @brief A move-only generator that yields values through `co_yield`.
 *
 * @details The coroutine is started on the first call to begin() and
 * suspended after every yield. Exceptions thrown inside the coroutine are
 * rethrown from begin() or from the iterator increment that resumed it.
 *
 * @tparam T The type of value that the generator yields.
 */
template <typename T> class generator {
public:
  class promise_type;
  /** @brief The type of the value yielded by the generator. */
  using value_type = std::remove_reference_t<T>;
  /** @brief The reference type of the value yielded by the generator. */
  using reference_type = std::conditional_t<std::is_reference_v<T>, T, T &>;
  /** @brief The pointer type of the value yielded by the generator. */
  using pointer_type = value_type *;
  /** @brief The handle to the generator's coroutine frame. */
  using coroutine_handle = std::coroutine_handle<promise_type>;

  /** @brief The generator coroutine promise. */
  class promise_type {
  public:
    auto get_return_object() noexcept -> generator
    {
      return generator{coroutine_handle::from_promise(*this)};
    }

    [[nodiscard]] constexpr auto
    initial_suspend() const noexcept -> std::suspend_always
    {
      return {};
    }

    [[nodiscard]] constexpr auto
    final_suspend() const noexcept -> std::suspend_always
    {
      return {};
    }

    /**
     * @brief Stores the address of the yielded value.
     * @note Temporaries yielded by the coroutine live until it is resumed.
     */
    template <typename U>
      requires std::is_same_v<std::remove_cvref_t<U>,
                              std::remove_cv_t<value_type>>
    // NOLINTNEXTLINE(cppcoreguidelines-missing-std-forward)
    auto yield_value(U &&value) noexcept -> std::suspend_always
    {
      value_ = std::addressof(value);
      return {};
    }

    auto unhandled_exception() noexcept -> void
    {
      exception_ = std::current_exception();
    }

    constexpr auto return_void() const noexcept -> void {}

    [[nodiscard]] auto value() const noexcept -> reference_type
    {
      return static_cast<reference_type>(*value_);
    }

    /** @brief Generators may not co_await. */
    auto await_transform(T &&value) -> std::suspend_never = delete;

    auto rethrow_if_exception() -> void
    {
      if (exception_)
        std::rethrow_exception(std::exchange(exception_, nullptr));
    }

  private:
    std::add_pointer_t<std::remove_reference_t<T>> value_{nullptr};
    std::exception_ptr exception_{nullptr};
  };

  /** @brief An input iterator over the yielded values. */
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = generator::value_type;
    using reference = generator::reference_type;

    constexpr iterator() noexcept = default;
    explicit iterator(coroutine_handle coro) noexcept : coroutine_{coro} {}

    auto operator==(std::default_sentinel_t) const noexcept -> bool
    {
      return !coroutine_ || coroutine_.done();
    }

    auto operator++() -> iterator &
    {
      coroutine_.resume();
      coroutine_.promise().rethrow_if_exception();
      return *this;
    }

    /** @brief Post-increment can't copy shared coroutine state. */
    auto operator++(int) -> void { ++*this; }

    auto operator*() const noexcept -> reference
    {
      return coroutine_.promise().value();
    }

  private:
    coroutine_handle coroutine_{nullptr};
  };

  generator() noexcept = default;
  generator(const generator &) = delete;
  generator(generator &&other) noexcept
      : coroutine_{std::exchange(other.coroutine_, nullptr)}
  {}
  auto operator=(const generator &) -> generator & = delete;
  auto operator=(generator &&other) noexcept -> generator &
  {
    auto tmp = std::move(other);
    swap(*this, tmp);
    return *this;
  }
  ~generator()
  {
    if (coroutine_)
      coroutine_.destroy();
  }

  /** @brief Starts the coroutine and returns an iterator to the first value. */
  auto begin() -> iterator
  {
    if (coroutine_)
    {
      coroutine_.resume();
      coroutine_.promise().rethrow_if_exception();
    }
    return iterator{coroutine_};
  }

  [[nodiscard]] constexpr auto end() const noexcept -> std::default_sentinel_t
  {
    return {};
  }

private:
  friend auto swap(generator &lhs, generator &rhs) noexcept -> void
  {
    using std::swap;
    swap(lhs.coroutine_, rhs.coroutine_);
  }

  explicit generator(coroutine_handle coro) noexcept : coroutine_{coro} {}

  coroutine_handle coroutine_{nullptr};
};

} // namespace tftpkit::detail
#endif // TFTPKIT_GENERATOR_HPP
