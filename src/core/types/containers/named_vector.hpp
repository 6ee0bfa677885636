/**
 *  *=============================================================================
 *  *           NVEC - N-Dimensional Vector Algebra Library
 *  *=============================================================================
 *  *
 *  * @file            named_vector.hpp
 *  * @brief           vector with named x, y, z, w component access
 *  * @details         owns one component sequence; the named accessors and
 *  *                  index access are views of that same storage
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
 *  * @usage           NamedVector v{3, 4};
 *  *                  v.x() = 6;              // writes component 0
 *  *                  auto len = v.magnitude();
 *  * @note            arithmetic returns a new vector, only index or named
 *  *                  assignment changes the receiver
 *  * @warning         binary operations with a plain braced list are
 *  *                  ambiguous, spell out components_t{...}
 *  * @todo
 *  * @bug
 *  * @performance
 *  *
 *  *==============================================================================
 *  * @testing        Quality Assurance
 *  *==============================================================================
 *  * @test           tests/test_named_vector.cpp
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
#ifndef NVEC_NAMED_VECTOR_HPP
#define NVEC_NAMED_VECTOR_HPP

#include "config.hpp"                       // for real, size_type
#include "core/math/vector_algebra.hpp"     // for components_t, vecops
#include "core/types/monad/maybe.hpp"       // for Maybe
#include <initializer_list>                 // for initializer_list
#include <iosfwd>                           // for ostream
#include <map>                              // for map
#include <string>                           // for string

namespace nvec {
    class NamedVector
    {
      public:
        // type definitions for type traits and functional interfaces
        using value_type      = real;
        using reference       = real&;
        using const_reference = const real&;
        using iterator        = components_t::iterator;
        using const_iterator  = components_t::const_iterator;

        // names of the first axes, in order
        static constexpr const char* axis_labels[build::constants::named_axes] =
            {"x", "y", "z", "w"};

        NamedVector() = default;
        explicit NamedVector(components_t components);
        NamedVector(std::initializer_list<real> components);

        static NamedVector from(components_t components);

        // raw components of either a NamedVector or a plain sequence
        static const components_t& get_components(const NamedVector& vector);
        static const components_t& get_components(const components_t& vector);

        const components_t& components() const { return components_; }
        size_type length() const { return components_.size(); }
        size_type size() const { return components_.size(); }

        real* data() { return components_.data(); }
        const real* data() const { return components_.data(); }

        iterator begin() { return components_.begin(); }
        iterator end() { return components_.end(); }
        const_iterator begin() const { return components_.begin(); }
        const_iterator end() const { return components_.end(); }

        // named axes; throw IndexOutOfRangeException when the vector has
        // fewer dimensions than the axis needs
        reference x() { return axis(0); }
        reference y() { return axis(1); }
        reference z() { return axis(2); }
        reference w() { return axis(3); }
        const_reference x() const { return axis(0); }
        const_reference y() const { return axis(1); }
        const_reference z() const { return axis(2); }
        const_reference w() const { return axis(3); }

        // element access, checked only with NVEC_BOUNDS_CHECKING
        reference operator[](size_type idx);
        const_reference operator[](size_type idx) const;

        // always checked
        real get_item(size_type idx) const;
        real set_item(size_type idx, real value);

        // None carrying ErrorCode::INDEX_OUT_OF_RANGE past the end
        Maybe<real> at(size_type idx) const;

        // label -> value for every named axis the vector has
        std::map<std::string, real> named_components() const;

        // new vector of fn(component, index)
        template <typename F>
        NamedVector map(F&& fn) const
        {
            return NamedVector(vecops::map(std::forward<F>(fn), components_));
        }

        NamedVector add(const NamedVector& other) const;
        NamedVector add(const components_t& other) const;
        NamedVector sub(const NamedVector& other) const;
        NamedVector sub(const components_t& other) const;
        NamedVector mul(real factor) const;
        NamedVector div(real divisor) const;

        real dot(const NamedVector& other) const;
        real dot(const components_t& other) const;

        real magnitude() const;
        real magnitude_squared() const;
        NamedVector unit() const;

        real angle(const NamedVector& other) const;
        real angle(const components_t& other) const;

        NamedVector midpoint(const NamedVector& other) const;
        NamedVector midpoint(const components_t& other) const;

        NamedVector operator-() const { return mul(-1); }
        NamedVector operator+(const NamedVector& other) const
        {
            return add(other);
        }
        NamedVector operator-(const NamedVector& other) const
        {
            return sub(other);
        }
        NamedVector operator*(real factor) const { return mul(factor); }
        NamedVector operator/(real divisor) const { return div(divisor); }

        bool operator==(const NamedVector& other) const
        {
            return components_ == other.components_;
        }
        bool operator!=(const NamedVector& other) const
        {
            return !(*this == other);
        }

      private:
        reference axis(size_type idx);
        const_reference axis(size_type idx) const;

        components_t components_;
    };

    // scalar multiplication from the left
    inline NamedVector operator*(real factor, const NamedVector& vec)
    {
        return vec * factor;
    }

    std::ostream& operator<<(std::ostream& os, const NamedVector& vec);
}   // namespace nvec

#endif
