/**
 *  *=============================================================================
 *  *           NVEC - N-Dimensional Vector Algebra Library
 *  *=============================================================================
 *  *
 *  * @file            scalar_ops.hpp
 *  * @brief           scalar arithmetic and its curried forms
 *  * @details         division follows IEEE-754: x / 0 is +-inf and 0 / 0 is
 *  *                  nan, nothing is trapped
 *  *
 *  * @version         0.8.0
 *  * @date            2025-03-01
 *  * @author          Marcus DuPont
 *  * @email           marcus.dupont@princeton.edu
 *  *
 *  *==============================================================================
 *  */
#ifndef NVEC_SCALAR_OPS_HPP
#define NVEC_SCALAR_OPS_HPP

#include "config.hpp"                // for real
#include "core/functional/fp.hpp"   // for curry, flip, fold, Container

namespace nvec::scalar {
    constexpr real add(real l, real r) { return l + r; }
    constexpr real sub(real l, real r) { return l - r; }
    constexpr real mul(real l, real r) { return l * r; }
    constexpr real div(real l, real r) { return l / r; }

    constexpr real square(real n) { return n * n; }

    // sum of the elements, 0 for an empty sequence
    template <fp::Container C>
    constexpr real sum(const C& ns)
    {
        return fp::fold(ns, add, real{0});
    }

    // arithmetic mean; an empty sequence gives 0 / 0 = nan
    template <fp::Container C>
    constexpr real avg(const C& ns)
    {
        return div(sum(ns), static_cast<real>(ns.size()));
    }

    // -------------------------------------------------------------
    // curried forms. the name says which operand is fixed:
    //   sub_from(m)(s) = m - s      sub_by(s)(m) = m - s
    //   div_into(n)(d) = n / d      div_by(d)(n) = n / d
    // -------------------------------------------------------------
    inline auto add_to(real l) { return fp::curry(add)(l); }
    inline auto mul_by(real l) { return fp::curry(mul)(l); }

    inline auto sub_from(real minuend) { return fp::curry(sub)(minuend); }
    inline auto sub_by(real subtrahend)
    {
        return fp::curry(fp::flip(sub))(subtrahend);
    }

    inline auto div_into(real dividend) { return fp::curry(div)(dividend); }
    inline auto div_by(real divisor)
    {
        return fp::curry(fp::flip(div))(divisor);
    }
}   // namespace nvec::scalar

#endif
