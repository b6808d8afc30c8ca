// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file deep_delta_config.h
/// @brief Centralized compile-time configuration for deep_delta and immer.
///
/// It MUST be included before any immer header so that every translation unit
/// sees the same immer settings. All deep_delta public headers include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DEEP_DELTA_CONFIGURED)
#error "immer headers were included before deep_delta/deep_delta_config.h. " \
       "Please include deep_delta headers before any direct immer includes."
#endif

#define DEEP_DELTA_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// Delta documents and dynamic values are handed across threads by callers,
/// so immer keeps its default atomic reference counting. Define
/// IMMER_NO_THREAD_SAFETY=1 before including deep_delta for single-threaded use.

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
// deep_delta Settings
// ============================================================

/// @brief Default seed for hashed stable member indices
#ifndef DEEP_DELTA_STABLE_HASH_SEED
#define DEEP_DELTA_STABLE_HASH_SEED 0x9E3779B9u
#endif

/// @brief Verbose diagnostics on stderr (see logging.h)
///
/// Enabled by default in debug builds, disabled when NDEBUG is defined.
#ifndef DEEP_DELTA_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DEEP_DELTA_VERBOSE_LOG 0
#  else
#    define DEEP_DELTA_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (for debugging)
// ============================================================

#ifdef DEEP_DELTA_PRINT_CONFIG
#pragma message("deep_delta configuration:")
#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#pragma message("  IMMER_NO_THREAD_SAFETY = 1 (single-threaded)")
#else
#pragma message("  IMMER_NO_THREAD_SAFETY = 0 (thread-safe)")
#endif
#if DEEP_DELTA_VERBOSE_LOG
#pragma message("  DEEP_DELTA_VERBOSE_LOG = 1")
#else
#pragma message("  DEEP_DELTA_VERBOSE_LOG = 0")
#endif
#endif
