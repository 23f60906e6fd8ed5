// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file deepeq_config.h
/// @brief Centralized compile-time configuration for deepeq and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by deepeq:
///   - immer: persistent containers backing arrays, structs, slices and maps
///   - boost: hashing utilities (container_hash)
///
/// It MUST be included before any immer header to ensure consistent settings.
/// All deepeq public headers already include this file, so users who only use
/// deepeq headers don't need to do anything special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DEEPEQ_CONFIGURED)
#error "immer headers were included before deepeq/deepeq_config.h. " \
       "Please include deepeq headers before any direct immer includes."
#endif

#define DEEPEQ_CONFIGURED 1

// ============================================================
// Reference Counting Mode
//
// DEEPEQ_THREAD_SAFE = 1 (default):
//   Values use immer::default_memory_policy (atomic refcounts). Separate
//   top-level comparisons may run concurrently on different threads as long
//   as nobody mutates the compared heaps meanwhile.
//
// DEEPEQ_THREAD_SAFE = 0:
//   Non-atomic refcounts and an unlocked free list. Faster, but values must
//   never be shared across threads.
// ============================================================

#ifndef DEEPEQ_THREAD_SAFE
#define DEEPEQ_THREAD_SAFE 1
#endif

#if !DEEPEQ_THREAD_SAFE && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes, no assertion overhead)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_STATS
#define IMMER_DEBUG_STATS 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

/// @brief Don't throw on invalid state (use assertions instead)
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Boost Settings
// ============================================================

/// @brief Disable Boost auto-linking (MSVC); deepeq only uses header-only parts
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When DEEPEQ_VERBOSE_LOG is 1, misused accessors (out-of-range index,
// lookup on the wrong kind) and requested divergence traces are written
// to stderr. Enabled in debug builds, disabled under NDEBUG.
// ============================================================

#ifndef DEEPEQ_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DEEPEQ_VERBOSE_LOG 0
#  else
#    define DEEPEQ_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Formatting
// ============================================================

/// @brief Nesting depth after which value_to_string() prints "..."
#ifndef DEEPEQ_DEFAULT_PRINT_DEPTH
#define DEEPEQ_DEFAULT_PRINT_DEPTH 4
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef DEEPEQ_CONFIG_VERBOSE
#if DEEPEQ_THREAD_SAFE
#pragma message("deepeq: atomic reference counting ENABLED")
#else
#pragma message("deepeq: atomic reference counting DISABLED (single-thread only)")
#endif

#if DEEPEQ_VERBOSE_LOG
#pragma message("deepeq: verbose logging ENABLED")
#endif
#endif // DEEPEQ_CONFIG_VERBOSE
