/**
 *  *=============================================================================
 *  *           NVEC - N-Dimensional Vector Algebra Library
 *  *=============================================================================
 *  *
 *  * @file            exceptions.hpp
 *  * @brief           assortment of exception classes
 *  * @details
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
 *  * @depends         GoogleTest (tests), pybind11 (python bindings)
 *  * @platform        Linux, MacOS
 *  *
 *  *==============================================================================
 *  * @documentation   Reference & Notes
 *  *==============================================================================
 *  * @usage
 *  * @note            floating point degeneracy (inf, nan) is never an
 *  *                  exception in this library, only shape errors are
 *  * @warning
 *  * @todo
 *  * @bug
 *  * @performance
 *  *
 *  *==============================================================================
 *  * @testing        Quality Assurance
 *  *==============================================================================
 *  * @test           tests/test_exceptions.cpp
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
#ifndef NVEC_EXCEPTIONS_HPP
#define NVEC_EXCEPTIONS_HPP

#include "config.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <type_traits>

namespace nvec {
    enum class ErrorCode : std::uint32_t {
        NONE               = 0,
        DIMENSION_MISMATCH = 1 << 0,
        INDEX_OUT_OF_RANGE = 1 << 1,
        ABSENT_VALUE       = 1 << 2,
        UNDEFINED          = 1 << 3,
    };

    namespace helpers {
        std::string error_code_to_string(ErrorCode code);
    }

    namespace exception {
        // two vector operands of a binary operation differ in length
        class DimensionMismatchException : public std::exception
        {
          public:
            DimensionMismatchException(
                std::string operation,
                size_type lhs_dims,
                size_type rhs_dims
            );

            const char* what() const noexcept override;

            const std::string& operation() const { return operation_; }
            size_type lhs_dims() const { return lhs_dims_; }
            size_type rhs_dims() const { return rhs_dims_; }
            ErrorCode error_code() const { return ErrorCode::DIMENSION_MISMATCH; }

          private:
            std::string operation_;
            size_type lhs_dims_;
            size_type rhs_dims_;
            std::string what_message_;
        };

        // checked component access past the vector's dimension
        class IndexOutOfRangeException : public std::exception
        {
          public:
            IndexOutOfRangeException(size_type index, size_type dims);

            const char* what() const noexcept override;

            size_type index() const { return index_; }
            size_type dims() const { return dims_; }
            ErrorCode error_code() const { return ErrorCode::INDEX_OUT_OF_RANGE; }

          private:
            size_type index_;
            size_type dims_;
            std::string what_message_;
        };
    }   // namespace exception

    inline constexpr ErrorCode operator|(ErrorCode lhs, ErrorCode rhs)
    {
        return static_cast<ErrorCode>(
            static_cast<std::underlying_type_t<ErrorCode>>(lhs) |
            static_cast<std::underlying_type_t<ErrorCode>>(rhs)
        );
    }

    inline constexpr ErrorCode operator&(ErrorCode lhs, ErrorCode rhs)
    {
        return static_cast<ErrorCode>(
            static_cast<std::underlying_type_t<ErrorCode>>(lhs) &
            static_cast<std::underlying_type_t<ErrorCode>>(rhs)
        );
    }

    inline constexpr bool has_error(ErrorCode code, ErrorCode error)
    {
        return (static_cast<std::uint32_t>(code) &
                static_cast<std::uint32_t>(error)) != 0;
    }

}   // namespace nvec

#endif
