/**
 *  *=============================================================================
 *  *           NVEC - N-Dimensional Vector Algebra Library
 *  *=============================================================================
 *  *
 *  * @file            enums.hpp
 *  * @brief           enumerations shared across the library
 *  * @details
 *  *
 *  * @version         0.8.0
 *  * @date            2025-02-26
 *  * @author          Marcus DuPont
 *  * @email           marcus.dupont@princeton.edu
 *  *
 *  *==============================================================================
 *  */
#ifndef NVEC_ENUMS_HPP
#define NVEC_ENUMS_HPP

#include <map>
#include <string>

namespace nvec {
    enum class Color {
        DEFAULT,
        BLACK,
        BLUE,
        LIGHT_GREY,
        DARK_GREY,
        LIGHT_RED,
        LIGHT_GREEN,
        LIGHT_YELLOW,
        LIGHT_BLUE,
        LIGHT_MAGENTA,
        LIGHT_CYAN,
        WHITE,
        RED,
        GREEN,
        YELLOW,
        CYAN,
        MAGENTA,
        BOLD,
        RESET,
    };

    // ansi escape sequence for every color
    inline const std::map<Color, std::string> color_map = {
      {Color::DEFAULT, "\x1B[0;39m"},
      {Color::BLACK, "\x1B[0;30m"},
      {Color::BLUE, "\x1B[0;34m"},
      {Color::LIGHT_GREY, "\x1B[0;37m"},
      {Color::DARK_GREY, "\x1B[0;90m"},
      {Color::LIGHT_RED, "\x1B[0;91m"},
      {Color::LIGHT_GREEN, "\x1B[0;92m"},
      {Color::LIGHT_YELLOW, "\x1B[0;93m"},
      {Color::LIGHT_BLUE, "\x1B[0;94m"},
      {Color::LIGHT_MAGENTA, "\x1B[0;95m"},
      {Color::LIGHT_CYAN, "\x1B[0;96m"},
      {Color::WHITE, "\x1B[0;97m"},
      {Color::RED, "\x1B[0;31m"},
      {Color::GREEN, "\x1B[1;32m"},
      {Color::YELLOW, "\x1B[1;33m"},
      {Color::CYAN, "\x1B[0;36m"},
      {Color::MAGENTA, "\x1B[0;35m"},
      {Color::BOLD, "\x1B[1m"},
      {Color::RESET, "\x1B[0m"}
    };
}   // namespace nvec
#endif
