// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Verbose stderr logging helpers.
///
/// All helpers compile to no-ops when DEEPEQ_VERBOSE_LOG is 0.

#pragma once

#include <deepeq/deepeq_config.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace deepeq {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEPEQ_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEPEQ_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEPEQ_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

/// Trace a divergence found by deep_equal (requested via CompareOptions::log_divergence)
inline void log_divergence(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEPEQ_VERBOSE_LOG
    std::cerr << "[" << func << "] not deeply equal: " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

} // namespace deepeq
