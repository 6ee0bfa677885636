/**
 *  *=============================================================================
 *  *           NVEC - N-Dimensional Vector Algebra Library
 *  *=============================================================================
 *  *
 *  * @file            vector_algebra.hpp
 *  * @brief           pure vector algebra on fixed-length component sequences
 *  * @details         every binary operation first checks that both operands
 *  *                  have the same dimension and throws
 *  *                  DimensionMismatchException otherwise. numeric
 *  *                  degeneracy (division by zero, normalizing the zero
 *  *                  vector, acos outside [-1, 1]) yields inf / nan
 *  *
 *  * @version         0.8.0
 *  * @date            2025-03-01
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
 *  * @usage           const auto mid = vecops::midpoint({0, 0}, {2, 4});
 *  * @note            results are never clamped or guarded
 *  * @warning
 *  * @todo
 *  * @bug
 *  * @performance
 *  *
 *  *==============================================================================
 *  * @testing        Quality Assurance
 *  *==============================================================================
 *  * @test           tests/test_vector_algebra.cpp
 *  * @benchmark
 *  * @validation
 *  *
 *  *==============================================================================
 *  * @history        Version History
 *  *==============================================================================
 *  * 2025-03-01      v0.8.0      Initial implementation
 *  *
 *  *==============================================================================
 *  * @copyright (C) 2025 Marcus DuPont. All rights reserved.
 *  *==============================================================================
 */
#ifndef NVEC_VECTOR_ALGEBRA_HPP
#define NVEC_VECTOR_ALGEBRA_HPP

#include "config.hpp"                // for real, size_type
#include "core/functional/fp.hpp"   // for map_indexed
#include <functional>                // for invoke
#include <string_view>               // for string_view
#include <vector>                    // for vector

namespace nvec {
    // the components of one vector, its size is the dimension
    using components_t = std::vector<real>;

    namespace vecops {
        // throws DimensionMismatchException naming the operation when
        // lhs and rhs differ in length
        void check_dimensions(
            std::string_view operation,
            const components_t& lhs,
            const components_t& rhs
        );

        // apply fn(component, index) to every component
        template <typename F>
        components_t map(F&& fn, const components_t& vector)
        {
            return fp::map_indexed(vector, [&fn](real n, size_type ii) {
                return static_cast<real>(std::invoke(fn, n, ii));
            });
        }

        components_t add(const components_t& augend, const components_t& addend);
        components_t
        sub(const components_t& minuend, const components_t& subtrahend);

        components_t mul(const components_t& vector, real factor);
        components_t div(const components_t& vector, real divisor);

        // sum of the component products, accumulated in index order
        real dot(const components_t& lhs, const components_t& rhs);

        real magnitude_squared(const components_t& vector);
        real magnitude(const components_t& vector);

        // vector / |vector|; the zero vector gives nan components
        components_t unit(const components_t& vector);

        // angle in radians, acos(a.b / (|a||b|)) without clamping
        real angle(const components_t& lhs, const components_t& rhs);

        components_t midpoint(const components_t& lhs, const components_t& rhs);
    }   // namespace vecops
}   // namespace nvec

#endif
