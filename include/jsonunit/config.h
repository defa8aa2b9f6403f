// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Centralized compile-time configuration for jsonunit and its dependencies
///
/// This file defines the configuration for the third-party libraries used
/// by jsonunit:
///   - immer: Immutable containers backing Value arrays and objects
///   - boost: Multiprecision decimals backing Value numbers
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All jsonunit public headers already include it.
///
/// Value trees are shared read-only between concurrent comparisons, so unlike
/// single-threaded builds we keep immer's atomic reference counting enabled.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSONUNIT_CONFIGURED)
#error "immer headers were included before jsonunit/config.h. " \
       "Please include jsonunit headers before any direct immer includes."
#endif

#define JSONUNIT_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

#ifdef IMMER_NO_THREAD_SAFETY
#if IMMER_NO_THREAD_SAFETY
#error "jsonunit requires immer's thread-safe reference counting"
#endif
#endif

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

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Boost Settings
// ============================================================

/// @brief Multiprecision is header-only; disable MSVC auto-linking
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Diagnostic Logging
//
// When JSONUNIT_VERBOSE_LOG is non-zero, path resolution and
// configuration failures are logged to stderr before they are thrown.
//
// Default: enabled in debug builds, disabled with NDEBUG.
// ============================================================

#ifndef JSONUNIT_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSONUNIT_VERBOSE_LOG 0
#  else
#    define JSONUNIT_VERBOSE_LOG 1
#  endif
#endif

#ifdef JSONUNIT_CONFIG_VERBOSE
#if JSONUNIT_VERBOSE_LOG
#pragma message("jsonunit: verbose diagnostics ENABLED")
#else
#pragma message("jsonunit: verbose diagnostics DISABLED")
#endif
#endif // JSONUNIT_CONFIG_VERBOSE
