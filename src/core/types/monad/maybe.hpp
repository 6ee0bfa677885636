/**
 *  *=============================================================================
 *  *           NVEC - N-Dimensional Vector Algebra Library
 *  *=============================================================================
 *  *
 *  * @file            maybe.hpp
 *  * @brief           Maybe monad for handling optional values
 *  * @details         Maybe<T>::just(v) silently becomes None when v is an
 *  *                  absent value (null pointer, nullptr, empty optional)
 *  *
 *  * @version         0.8.0
 *  * @date            2025-02-26
 *  * @author          Marcus DuPont
 *  * @email           marcus.dupont@princeton.edu
 *  *
 *  *==============================================================================
 *  * @build           Requirements & Dependencies
 *  *==============================================================================
 *  * @requires        C++20
 *  * @depends
 *  * @platform        Linux, MacOS
 *  *
 *  *==============================================================================
 *  * @documentation   Reference & Notes
 *  *==============================================================================
 *  * @usage           Maybe<int>::just(5)
 *  *                      .map([](int x) { return x * 2; })
 *  *                      .match(
 *  *                          [](int x) { return x; },
 *  *                          [] { return -1; }
 *  *                      );
 *  * @note
 *  * @warning         T must be default constructible
 *  * @todo
 *  * @bug
 *  * @performance
 *  *
 *  *==============================================================================
 *  * @testing        Quality Assurance
 *  *==============================================================================
 *  * @test           tests/test_maybe.cpp
 *  * @benchmark
 *  * @validation
 *  *
 *  *==============================================================================
 *  * @history        Version History
 *  *==============================================================================
 *  * 2025-02-26      v0.8.0      Initial implementation
 *  *
 *  *==============================================================================
 *  * @copyright (C) 2025 Marcus DuPont. All rights reserved.
 *  *==============================================================================
 */
#ifndef NVEC_MAYBE_HPP
#define NVEC_MAYBE_HPP

#include "io/exceptions.hpp"   // for ErrorCode
#include <cstddef>             // for nullptr_t
#include <functional>          // for invoke
#include <memory>              // for shared_ptr, unique_ptr
#include <optional>            // for optional
#include <type_traits>
#include <utility>

namespace nvec {

    struct nothing_t {
        constexpr explicit nothing_t() : error_code(ErrorCode::NONE) {}
        constexpr explicit nothing_t(ErrorCode code) : error_code(code) {}

        ErrorCode error_code;
    };

    inline constexpr nothing_t Nothing{};
    using None = nothing_t;

    template <typename T>
    class Maybe;

    namespace detail {
        template <typename T>
        struct is_maybe : std::false_type {
        };

        template <typename T>
        struct is_maybe<Maybe<T>> : std::true_type {
        };

        template <typename T>
        inline constexpr bool is_maybe_v = is_maybe<std::remove_cvref_t<T>>::value;

        // values that count as "not there" when handed to Maybe::just
        template <typename T>
        constexpr bool is_absent(const T&)
        {
            return false;
        }

        constexpr bool is_absent(std::nullptr_t) { return true; }

        template <typename T>
        constexpr bool is_absent(T* const& ptr)
        {
            return ptr == nullptr;
        }

        template <typename T>
        constexpr bool is_absent(const std::optional<T>& opt)
        {
            return !opt.has_value();
        }

        template <typename T, typename D>
        bool is_absent(const std::unique_ptr<T, D>& ptr)
        {
            return ptr == nullptr;
        }

        template <typename T>
        bool is_absent(const std::shared_ptr<T>& ptr)
        {
            return ptr == nullptr;
        }
    }   // namespace detail

    template <typename T>
    class Maybe
    {
      public:
        using value_type = T;

        constexpr Maybe()
            : valid{false}, this_value{}, error_code_(ErrorCode::NONE)
        {
        }

        constexpr Maybe(nothing_t nothing)
            : valid{false}, this_value{}, error_code_(nothing.error_code)
        {
        }

        // direct construction never coerces, use just() for that
        constexpr Maybe(const T& value)
            : valid{true}, this_value{value}, error_code_(ErrorCode::NONE)
        {
        }

        constexpr Maybe(T&& value)
            : valid{true},
              this_value{std::move(value)},
              error_code_(ErrorCode::NONE)
        {
        }

        // Just(value), or None if value is absent
        template <typename U = T>
        static constexpr Maybe just(U&& value)
        {
            if (detail::is_absent(value)) {
                return Maybe{nothing_t{ErrorCode::ABSENT_VALUE}};
            }
            return Maybe{static_cast<T>(std::forward<U>(value))};
        }

        static constexpr Maybe none() { return Maybe{Nothing}; }

        template <typename U = T>
        static constexpr Maybe from(U&& value)
        {
            return just(std::forward<U>(value));
        }

        constexpr bool has_value() const { return valid; }

        constexpr const T& value() const& { return this_value; }

        constexpr T& value() & { return this_value; }

        constexpr T value() && { return std::move(this_value); }
        constexpr ErrorCode error_code() const { return error_code_; }

        template <typename U>
        constexpr T unwrap_or(U&& default_value) const&
        {
            static_assert(
                std::is_convertible_v<U, T>,
                "U must be convertible to T"
            );
            return valid ? this_value
                         : static_cast<T>(std::forward<U>(default_value));
        }

        template <typename F>
        constexpr T unwrap_or_else(F&& f) const&
        {
            if (valid) {
                return this_value;
            }
            return std::invoke(std::forward<F>(f));
        }

        // Just(v) -> just(f(v)), so an absent result also becomes None
        template <typename F>
        constexpr auto map(F&& f) const&
        {
            using result_type =
                std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
            if (valid) {
                return Maybe<result_type>::just(
                    std::invoke(std::forward<F>(f), this_value)
                );
            }
            return Maybe<result_type>{nothing_t{error_code_}};
        }

        template <typename F>
        constexpr auto map(F&& f) &&
        {
            using result_type =
                std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
            if (valid) {
                return Maybe<result_type>::just(
                    std::invoke(std::forward<F>(f), std::move(this_value))
                );
            }
            return Maybe<result_type>{nothing_t{error_code_}};
        }

        template <typename F>
        constexpr auto flat_map(F&& f) const&
        {
            using result_type =
                std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
            static_assert(
                detail::is_maybe_v<result_type>,
                "flat_map requires a function returning a Maybe"
            );
            if (valid) {
                return std::invoke(std::forward<F>(f), this_value);
            }
            return result_type{nothing_t{error_code_}};
        }

        template <typename F>
        constexpr auto flat_map(F&& f) &&
        {
            using result_type =
                std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
            static_assert(
                detail::is_maybe_v<result_type>,
                "flat_map requires a function returning a Maybe"
            );
            if (valid) {
                return std::invoke(std::forward<F>(f), std::move(this_value));
            }
            return result_type{nothing_t{error_code_}};
        }

        template <typename F>
        constexpr Maybe or_else(F&& f) const&
        {
            if (valid) {
                return *this;
            }
            return Maybe::just(std::invoke(std::forward<F>(f)));
        }

        // eliminate the Maybe, exactly one handler runs
        template <typename JustF, typename NoneF>
        constexpr auto match(JustF&& on_just, NoneF&& on_none) const&
        {
            if (valid) {
                return std::invoke(std::forward<JustF>(on_just), this_value);
            }
            return std::invoke(std::forward<NoneF>(on_none));
        }

        template <typename JustF, typename NoneF>
        constexpr auto match(JustF&& on_just, NoneF&& on_none) &&
        {
            if (valid) {
                return std::invoke(
                    std::forward<JustF>(on_just),
                    std::move(this_value)
                );
            }
            return std::invoke(std::forward<NoneF>(on_none));
        }

        template <typename U>
        constexpr bool operator==(const Maybe<U>& other) const
        {
            if (valid != other.has_value()) {
                return false;
            }
            if (valid) {
                return this_value == other.value();
            }
            return true;
        }

        template <typename U>
        constexpr bool operator!=(const Maybe<U>& other) const
        {
            return !(*this == other);
        }

      private:
        bool valid;
        T this_value;
        ErrorCode error_code_;
    };

    // Deduction guide
    template <typename T>
    Maybe(T) -> Maybe<std::decay_t<T>>;

    template <typename T>
    constexpr Maybe<std::decay_t<T>> just(T&& value)
    {
        return Maybe<std::decay_t<T>>::just(std::forward<T>(value));
    }

    template <typename T>
    constexpr Maybe<T> none()
    {
        return Maybe<T>::none();
    }
}   // namespace nvec

#endif
