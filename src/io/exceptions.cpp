#include "exceptions.hpp"   // for DimensionMismatchException, IndexOutOfRangeException
#include <array>            // for array
#include <utility>          // for move, pair

namespace nvec::helpers {
    std::string error_code_to_string(ErrorCode code)
    {
        if (code == ErrorCode::NONE) {
            return "NONE";
        }

        static constexpr std::array<std::pair<ErrorCode, const char*>, 4>
            names = {{
              {ErrorCode::DIMENSION_MISMATCH, "DIMENSION_MISMATCH"},
              {ErrorCode::INDEX_OUT_OF_RANGE, "INDEX_OUT_OF_RANGE"},
              {ErrorCode::ABSENT_VALUE, "ABSENT_VALUE"},
              {ErrorCode::UNDEFINED, "UNDEFINED"},
            }};

        // a code may carry several flags, list every one of them
        std::string result;
        for (const auto& [flag, name] : names) {
            if (has_error(code, flag)) {
                if (!result.empty()) {
                    result += " | ";
                }
                result += name;
            }
        }
        return result.empty() ? "UNKNOWN" : result;
    }
}   // namespace nvec::helpers

namespace nvec::exception {
    DimensionMismatchException::DimensionMismatchException(
        std::string operation,
        size_type lhs_dims,
        size_type rhs_dims
    )
        : operation_(std::move(operation)),
          lhs_dims_(lhs_dims),
          rhs_dims_(rhs_dims),
          what_message_(
              "Dimension mismatch in '" + operation_ + "': " +
              std::to_string(lhs_dims_) + " != " + std::to_string(rhs_dims_)
          )
    {
    }

    const char* DimensionMismatchException::what() const noexcept
    {
        return what_message_.c_str();
    }

    IndexOutOfRangeException::IndexOutOfRangeException(
        size_type index,
        size_type dims
    )
        : index_(index),
          dims_(dims),
          what_message_(
              "Index " + std::to_string(index_) +
              " out of range for vector of dimension " + std::to_string(dims_)
          )
    {
    }

    const char* IndexOutOfRangeException::what() const noexcept
    {
        return what_message_.c_str();
    }
}   // namespace nvec::exception
