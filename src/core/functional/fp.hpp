/**
 *  *=============================================================================
 *  *           NVEC - N-Dimensional Vector Algebra Library
 *  *=============================================================================
 *  *
 *  * @file            fp.hpp
 *  * @brief           functional programming primitives for iterable types
 *  * @details
 *  *
 *  * @version         0.8.0
 *  * @date            2025-03-01
 *  * @author          Marcus DuPont
 *  * @email           marcus.dupont@princeton.edu
 *  *
 *  *==============================================================================
 *  */

#ifndef NVEC_FUNCTIONAL_PROGRAMMING_HPP
#define NVEC_FUNCTIONAL_PROGRAMMING_HPP

#include "config.hpp"
#include <algorithm>
#include <array>
#include <concepts>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>

namespace nvec::detail {
    // Primary template (fallback): anything else is rebuilt as a std::vector
    template <typename Container, typename NewValueType>
    struct rebind_container {
        using type = std::vector<NewValueType>;
    };

    template <typename T, typename Alloc, typename NewValueType>
    struct rebind_container<std::vector<T, Alloc>, NewValueType> {
        using type = std::vector<NewValueType>;
    };

    template <typename T, std::size_t Dims, typename NewValueType>
    struct rebind_container<std::array<T, Dims>, NewValueType> {
        using type = std::array<NewValueType, Dims>;
    };

    // helper alias for rebind_container
    template <typename Container, typename NewValueType>
    using rebind_container_t = typename rebind_container<
        std::remove_cvref_t<Container>,
        NewValueType>::type;

    // a container holding n value-initialized elements; fixed-size
    // containers already have their size
    template <typename Container>
    constexpr Container make_sized(size_type n)
    {
        Container result{};
        if constexpr (requires { result.resize(n); }) {
            result.resize(n);
        }
        return result;
    }
}   // namespace nvec::detail

namespace nvec::fp {

    // concepts to constrain function inputs

    // concept for iterable types that support begin/end
    template <typename T>
    concept Iterable = requires(T t) {
        { std::begin(t) } -> std::input_iterator;
        { std::end(t) } -> std::sentinel_for<decltype(std::begin(t))>;
    };

    // concept for containers that support indexing and size
    template <typename T>
    concept Indexable = requires(T t, size_type i) {
        { t[i] } -> std::convertible_to<typename T::value_type>;
        { t.size() } -> std::convertible_to<size_type>;
    };

    // concept for containers that support both iterating and indexing
    template <typename T>
    concept Container = Iterable<T> && Indexable<T>;

    // -------------------------------------------------------------
    // core functional operations
    // -------------------------------------------------------------

    // map: transform each element with a function, returning a new
    // container of the same kind
    template <Container C, typename F>
    constexpr auto map(const C& container, F&& f)
    {
        using T        = typename C::value_type;
        using result_t = std::remove_cvref_t<std::invoke_result_t<F, T>>;
        using result_container_t = detail::rebind_container_t<C, result_t>;

        auto result = detail::make_sized<result_container_t>(container.size());
        for (size_type ii = 0; ii < container.size(); ++ii) {
            result[ii] = std::invoke(f, container[ii]);
        }

        return result;
    }

    // map_indexed: like map, but f also receives the element's index
    template <Container C, typename F>
    constexpr auto map_indexed(const C& container, F&& f)
    {
        using T = typename C::value_type;
        using result_t =
            std::remove_cvref_t<std::invoke_result_t<F, T, size_type>>;
        using result_container_t = detail::rebind_container_t<C, result_t>;

        auto result = detail::make_sized<result_container_t>(container.size());
        for (size_type ii = 0; ii < container.size(); ++ii) {
            result[ii] = std::invoke(f, container[ii], ii);
        }

        return result;
    }

    // reduce: combine elements using a binary function, with optional
    // initial value
    template <Container C, typename F>
    constexpr auto
    reduce(const C& container, F&& f, typename C::value_type init = {})
    {
        using value_t  = typename C::value_type;
        value_t result = init;

        for (size_type ii = 0; ii < container.size(); ++ii) {
            result = std::invoke(f, result, container[ii]);
        }

        return result;
    }

    // fold: like reduce but with explicit initial value of possibly
    // different type. elements are visited in index order
    template <Container C, typename F, typename U>
    constexpr auto fold(const C& container, F&& f, U init)
    {
        U result = init;

        for (size_type ii = 0; ii < container.size(); ++ii) {
            result = std::invoke(f, result, container[ii]);
        }

        return result;
    }

    // zip_with: combine containers element-wise. element ii of the result is
    // f(c1[ii], c2[ii], ...), for every ii below the shortest input size,
    // so a single empty input gives an empty result
    template <typename F, Container... Cs>
        requires(sizeof...(Cs) > 0)
    constexpr auto zip_with(F&& f, const Cs&... containers)
    {
        using result_t = std::remove_cvref_t<
            std::invoke_result_t<F, typename Cs::value_type...>>;

        const size_type min_size =
            std::min({static_cast<size_type>(containers.size())...});

        std::vector<result_t> result;
        result.reserve(min_size);
        for (size_type ii = 0; ii < min_size; ++ii) {
            result.push_back(std::invoke(f, containers[ii]...));
        }

        return result;
    }

    // -------------------------------------------------------------
    // higher-order functions
    // -------------------------------------------------------------

    // curry: transform a function that takes multiple arguments into a
    // sequence of functions that each take a single argument
    template <typename F>
    constexpr auto curry(F&& f)
    {
        return [f = std::forward<F>(f)]<typename T>(T&& t) {
            return [f, t = std::forward<T>(t)]<typename... Args>(
                       Args&&... args
                   ) { return f(t, std::forward<Args>(args)...); };
        };
    }

    // flip: swap the two arguments of a binary function
    template <typename F>
    constexpr auto flip(F&& f)
    {
        return [f = std::forward<F>(f)]<typename A, typename B>(A&& a, B&& b) {
            return f(std::forward<B>(b), std::forward<A>(a));
        };
    }

    // -------------------------------------------------------------
    // common functional operations
    // -------------------------------------------------------------

    // sum: add all elements in a container, zero when empty
    template <Container C>
    constexpr auto sum(const C& container)
    {
        return reduce(container, std::plus<>{});
    }

    template <Container C>
    constexpr bool is_empty(const C& container)
    {
        return container.size() == 0;
    }

    // all_same: true when every element equals the first. an empty
    // container has no common element, so it is false
    template <Container C>
    constexpr bool all_same(const C& container)
    {
        if (is_empty(container)) {
            return false;
        }
        for (size_type ii = 1; ii < container.size(); ++ii) {
            if (!(container[ii] == container[0])) {
                return false;
            }
        }
        return true;
    }

    // all: check if all elements satisfy a predicate
    template <Container C, typename F>
    constexpr bool all_of(const C& container, F&& pred)
    {
        for (size_type i = 0; i < container.size(); ++i) {
            if (!std::invoke(pred, container[i])) {
                return false;
            }
        }
        return true;
    }
}   // namespace nvec::fp

#endif
