/**
 *  *=============================================================================
 *  *           NVEC - N-Dimensional Vector Algebra Library
 *  *=============================================================================
 *  *
 *  * @file            printb.hpp
 *  * @brief           brace-formatted, colored console printing
 *  * @details         placeholders are "{}" or "{:spec}" where spec is any of
 *  *                  ">W" (right align to width W), ".P" (fixed precision P)
 *  *                  and ".Pe" (scientific precision P), e.g. "{:>8.2e}"
 *  *
 *  * @version         0.8.0
 *  * @date            2025-02-26
 *  * @author          Marcus DuPont
 *  * @email           marcus.dupont@princeton.edu
 *  *
 *  *==============================================================================
 *  */
#ifndef NVEC_PRINTB_HPP
#define NVEC_PRINTB_HPP

#include "core/types/utility/enums.hpp"   // for Color, color_map
#include <iomanip>                        // for scientific, precision
#include <iostream>                       // for operator <<
#include <sstream>       // for operator>>, ws, basic_istream, basic_istringstream
#include <string>        // for string
#include <string_view>   // for string_view

namespace nvec {
    namespace util {

        // render the placeholders of fmt with args, throws
        // std::invalid_argument on a malformed format string
        template <typename... ARGS>
        std::string format(std::string_view fmt, const ARGS&... args);

        template <Color C = Color::DEFAULT, typename... ARGS>
        void write_to(std::ostream& os, std::string_view fmt, ARGS... args);

        template <Color C = Color::DEFAULT, typename... ARGS>
        void write(std::string_view fmt, ARGS... args);

        template <Color C = Color::DEFAULT, typename... ARGS>
        void writeln(std::string_view fmt, ARGS... args);
    }   // namespace util

}   // namespace nvec

#include "printb.ipp"
#endif
