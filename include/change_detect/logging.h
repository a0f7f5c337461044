// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file logging.h
/// @brief stderr diagnostics gated by CHANGE_DETECT_VERBOSE_LOG.
///
/// Output format:
///   [function] message (called from file:line)
///
/// With CHANGE_DETECT_VERBOSE_LOG == 0 every helper compiles to nothing.

#pragma once

#include <change_detect/change_detect_config.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace change_detect {
namespace detail {

inline void log_message(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CHANGE_DETECT_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_selector_error(
    std::string_view func,
    std::string_view selector,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CHANGE_DETECT_VERBOSE_LOG
    std::cerr << "[" << func << "] selector '" << selector << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)selector;
    (void)reason;
    (void)loc;
#endif
}

inline void log_record_error(
    std::string_view func,
    std::size_t slot,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CHANGE_DETECT_VERBOSE_LOG
    std::cerr << "[" << func << "] record #" << slot << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)slot;
    (void)reason;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CHANGE_DETECT_VERBOSE_LOG
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

} // namespace detail
} // namespace change_detect
