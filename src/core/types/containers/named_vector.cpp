#include "named_vector.hpp"
#include "io/exceptions.hpp"   // for IndexOutOfRangeException
#include <algorithm>           // for min
#include <ostream>             // for ostream
#include <utility>             // for move

namespace nvec {
    NamedVector::NamedVector(components_t components)
        : components_(std::move(components))
    {
    }

    NamedVector::NamedVector(std::initializer_list<real> components)
        : components_(components)
    {
    }

    NamedVector NamedVector::from(components_t components)
    {
        return NamedVector(std::move(components));
    }

    const components_t& NamedVector::get_components(const NamedVector& vector)
    {
        return vector.components_;
    }

    const components_t& NamedVector::get_components(const components_t& vector)
    {
        return vector;
    }

    NamedVector::reference NamedVector::axis(size_type idx)
    {
        if (idx >= components_.size()) {
            throw exception::IndexOutOfRangeException(idx, components_.size());
        }
        return components_[idx];
    }

    NamedVector::const_reference NamedVector::axis(size_type idx) const
    {
        if (idx >= components_.size()) {
            throw exception::IndexOutOfRangeException(idx, components_.size());
        }
        return components_[idx];
    }

    NamedVector::reference NamedVector::operator[](size_type idx)
    {
        if constexpr (global::bounds_checking) {
            return axis(idx);
        }
        return components_[idx];
    }

    NamedVector::const_reference NamedVector::operator[](size_type idx) const
    {
        if constexpr (global::bounds_checking) {
            return axis(idx);
        }
        return components_[idx];
    }

    real NamedVector::get_item(size_type idx) const { return axis(idx); }

    real NamedVector::set_item(size_type idx, real value)
    {
        axis(idx) = value;
        return components_[idx];
    }

    Maybe<real> NamedVector::at(size_type idx) const
    {
        if (idx < components_.size()) {
            return Maybe<real>(components_[idx]);
        }
        return nothing_t{ErrorCode::INDEX_OUT_OF_RANGE};
    }

    std::map<std::string, real> NamedVector::named_components() const
    {
        std::map<std::string, real> result;
        const auto count =
            std::min(components_.size(), build::constants::named_axes);
        for (size_type ii = 0; ii < count; ++ii) {
            result.emplace(axis_labels[ii], components_[ii]);
        }
        return result;
    }

    // ********************** Math Helpers *****************************

    NamedVector NamedVector::add(const NamedVector& other) const
    {
        return add(other.components_);
    }

    NamedVector NamedVector::add(const components_t& other) const
    {
        return NamedVector(vecops::add(components_, other));
    }

    NamedVector NamedVector::sub(const NamedVector& other) const
    {
        return sub(other.components_);
    }

    NamedVector NamedVector::sub(const components_t& other) const
    {
        return NamedVector(vecops::sub(components_, other));
    }

    NamedVector NamedVector::mul(real factor) const
    {
        return NamedVector(vecops::mul(components_, factor));
    }

    NamedVector NamedVector::div(real divisor) const
    {
        return NamedVector(vecops::div(components_, divisor));
    }

    real NamedVector::dot(const NamedVector& other) const
    {
        return dot(other.components_);
    }

    real NamedVector::dot(const components_t& other) const
    {
        return vecops::dot(components_, other);
    }

    real NamedVector::magnitude() const { return vecops::magnitude(components_); }

    real NamedVector::magnitude_squared() const
    {
        return vecops::magnitude_squared(components_);
    }

    NamedVector NamedVector::unit() const
    {
        return NamedVector(vecops::unit(components_));
    }

    real NamedVector::angle(const NamedVector& other) const
    {
        return angle(other.components_);
    }

    real NamedVector::angle(const components_t& other) const
    {
        return vecops::angle(components_, other);
    }

    NamedVector NamedVector::midpoint(const NamedVector& other) const
    {
        return midpoint(other.components_);
    }

    NamedVector NamedVector::midpoint(const components_t& other) const
    {
        return NamedVector(vecops::midpoint(components_, other));
    }

    std::ostream& operator<<(std::ostream& os, const NamedVector& vec)
    {
        os << "(";
        for (size_type ii = 0; ii < vec.length(); ++ii) {
            if (ii > 0) {
                os << ", ";
            }
            os << vec[ii];
        }
        return os << ")";
    }
}   // namespace nvec
