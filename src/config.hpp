/**
 * config.hpp - configuration system for NVEC
 *
 * Turns the preprocessor defines of the CMake-generated build_options.hpp
 * into typed compile-time constants, plus the few knobs that can be changed
 * at runtime.
 *
 * Design principles:
 * - Minimize preprocessor usage
 * - Favor compile-time constants over runtime checks
 * - Create clear namespaces with logical grouping
 */
#ifndef NVEC_CONFIG_HPP
#define NVEC_CONFIG_HPP

#include "build_options.hpp"   // include the CMake-generated configuration
#include <cstddef>             // for std::size_t

namespace nvec {
    namespace build {

        /**
         * features - compile-time feature flags
         *
         * usage:
         *   if constexpr (features::bounds_checking) {
         *       // checked access
         *   }
         */
        namespace features {
            inline constexpr bool debug =
#if NVEC_DEBUG
                true;
#else
                false;
#endif

            inline constexpr bool bounds_checking =
#if NVEC_BOUNDS_CHECKING
                true;
#else
                false;
#endif
        }   // namespace features

        /**
         * types - compile-time type definitions based on configuration
         *
         * usage:
         *   types::real value = 3.14;
         */
        namespace types {
            using real =
#if NVEC_FLOAT_PRECISION
                float;
#else
                double;
#endif
            using size_type = std::size_t;
        }   // namespace types

        namespace constants {
            // axes 0..3 have the names x, y, z, w
            inline constexpr types::size_type named_axes = 4;

            inline constexpr const char* version = NVEC_VERSION_STRING;
        }   // namespace constants
    }   // namespace build

    // severity of console log messages, lowest value is most severe
    enum class LogLevel : int {
        ERROR = 0,
        WARN  = 1,
        INFO  = 2,
        DEBUG = 3,
    };

    /**
     * global - runtime configuration
     *
     * Everything here is plain mutable state; set it once at start-up
     * before any vector work happens.
     */
    namespace global {
        inline LogLevel log_level =
            build::features::debug ? LogLevel::DEBUG : LogLevel::WARN;

        constexpr bool bounds_checking = build::features::bounds_checking;
    }   // namespace global

    using real      = build::types::real;
    using size_type = build::types::size_type;
}   // namespace nvec

#endif
