#include "vector_algebra.hpp"
#include "core/math/scalar_ops.hpp"   // for mul_by, div_by, square, add
#include "io/console/logger.hpp"      // for debug
#include "io/exceptions.hpp"          // for DimensionMismatchException
#include <cmath>                      // for sqrt, acos
#include <string>                     // for string

namespace nvec::vecops {
    void check_dimensions(
        std::string_view operation,
        const components_t& lhs,
        const components_t& rhs
    )
    {
        if (lhs.size() == rhs.size()) {
            return;
        }
        io::logger::debug(
            "{}: dimension mismatch, lhs has {} components, rhs has {}",
            operation,
            lhs.size(),
            rhs.size()
        );
        throw exception::DimensionMismatchException(
            std::string(operation),
            lhs.size(),
            rhs.size()
        );
    }

    components_t add(const components_t& augend, const components_t& addend)
    {
        check_dimensions("add", augend, addend);
        return fp::zip_with(scalar::add, augend, addend);
    }

    components_t sub(const components_t& minuend, const components_t& subtrahend)
    {
        check_dimensions("sub", minuend, subtrahend);
        return fp::zip_with(scalar::sub, minuend, subtrahend);
    }

    components_t mul(const components_t& vector, real factor)
    {
        return fp::map(vector, scalar::mul_by(factor));
    }

    components_t div(const components_t& vector, real divisor)
    {
        return fp::map(vector, scalar::div_by(divisor));
    }

    real dot(const components_t& lhs, const components_t& rhs)
    {
        check_dimensions("dot", lhs, rhs);
        const auto products = fp::zip_with(scalar::mul, lhs, rhs);
        return fp::fold(products, scalar::add, real{0});
    }

    real magnitude_squared(const components_t& vector)
    {
        return fp::fold(
            vector,
            [](real acc, real n) { return acc + scalar::square(n); },
            real{0}
        );
    }

    real magnitude(const components_t& vector)
    {
        return std::sqrt(magnitude_squared(vector));
    }

    components_t unit(const components_t& vector)
    {
        return div(vector, magnitude(vector));
    }

    real angle(const components_t& lhs, const components_t& rhs)
    {
        check_dimensions("angle", lhs, rhs);
        return std::acos(dot(lhs, rhs) / (magnitude(lhs) * magnitude(rhs)));
    }

    components_t midpoint(const components_t& lhs, const components_t& rhs)
    {
        check_dimensions("midpoint", lhs, rhs);
        return fp::zip_with(
            [](real l, real r) { return (l + r) / 2; },
            lhs,
            rhs
        );
    }
}   // namespace nvec::vecops
