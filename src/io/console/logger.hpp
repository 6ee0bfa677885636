/**
 *  *=============================================================================
 *  *           NVEC - N-Dimensional Vector Algebra Library
 *  *=============================================================================
 *  *
 *  * @file            logger.hpp
 *  * @brief           leveled console logging on top of printb
 *  * @details         messages above global::log_level are dropped; errors
 *  *                  and warnings go to std::cerr, the rest to std::cout
 *  *
 *  * @version         0.8.0
 *  * @date            2025-02-26
 *  * @author          Marcus DuPont
 *  * @email           marcus.dupont@princeton.edu
 *  *
 *  *==============================================================================
 *  */
#ifndef NVEC_LOGGER_HPP
#define NVEC_LOGGER_HPP

#include "config.hpp"              // for LogLevel, global::log_level
#include "io/console/printb.hpp"   // for write_to
#include <iostream>                // for cout, cerr
#include <string>                  // for string
#include <string_view>             // for string_view

namespace nvec {
    namespace io {
        namespace logger {
            void set_level(LogLevel level);
            LogLevel level();
            bool enabled(LogLevel level);

            std::string_view level_name(LogLevel level);
            LogLevel level_from_string(std::string_view name);

            template <Color C, typename... ARGS>
            void emit(LogLevel lvl, std::string_view fmt, ARGS... args)
            {
                if (!enabled(lvl)) {
                    return;
                }
                auto& os = lvl <= LogLevel::WARN ? std::cerr : std::cout;
                os << "[nvec:" << level_name(lvl) << "] ";
                util::write_to<C>(os, fmt, args...);
                os << '\n';
            }

            template <typename... ARGS>
            void error(std::string_view fmt, ARGS... args)
            {
                emit<Color::RED>(LogLevel::ERROR, fmt, args...);
            }

            template <typename... ARGS>
            void warn(std::string_view fmt, ARGS... args)
            {
                emit<Color::YELLOW>(LogLevel::WARN, fmt, args...);
            }

            template <typename... ARGS>
            void info(std::string_view fmt, ARGS... args)
            {
                emit<Color::DEFAULT>(LogLevel::INFO, fmt, args...);
            }

            template <typename... ARGS>
            void debug(std::string_view fmt, ARGS... args)
            {
                emit<Color::DARK_GREY>(LogLevel::DEBUG, fmt, args...);
            }
        }   // namespace logger
    }   // namespace io

}   // namespace nvec
#endif
