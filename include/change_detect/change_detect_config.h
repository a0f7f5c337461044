// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change_detect_config.h
/// @brief Compile-time configuration for change_detect and its dependencies
///
/// Settings for:
///   - immer: persistent containers backing Value
///   - lager / zug: reader integration (lager_adapters.h)
///   - change_detect itself: verbose diagnostics
///
/// Every public change_detect header includes this file first. Code that
/// includes immer or lager directly must include a change_detect header
/// before them so that all translation units agree on these settings.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(CHANGE_DETECT_CONFIGURED)
#error "immer headers were included before change_detect/change_detect_config.h. " \
       "Please include change_detect headers before any direct immer includes."
#endif

#define CHANGE_DETECT_CONFIGURED 1

// ============================================================
// Immer
// ============================================================

/// Digest passes run on a single logical thread, so the containers use
/// non-atomic reference counts and an unlocked free list.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// No per-node type tags (smaller nodes, no tag assertions)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Lager / Zug
// ============================================================

#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

/// Use std::variant inside zug so that no boost::variant is pulled in
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Verbose diagnostics
//
// When CHANGE_DETECT_VERBOSE_LOG is 1 the engine reports selector
// validation failures, handled evaluation errors and aborted digest
// passes on stderr (see logging.h).
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef CHANGE_DETECT_VERBOSE_LOG
#  if defined(NDEBUG)
#    define CHANGE_DETECT_VERBOSE_LOG 0
#  else
#    define CHANGE_DETECT_VERBOSE_LOG 1
#  endif
#endif

#ifdef CHANGE_DETECT_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("change_detect: immer thread safety DISABLED")
#else
#pragma message("change_detect: immer thread safety ENABLED")
#endif
#if CHANGE_DETECT_VERBOSE_LOG
#pragma message("change_detect: verbose diagnostics ENABLED")
#endif
#endif // CHANGE_DETECT_CONFIG_VERBOSE
