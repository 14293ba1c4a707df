// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file faunadb_config.h
/// @brief Centralized compile-time configuration for faunadb and immer.
///
/// It MUST be included before any immer header so every translation unit
/// sees the same container settings. All faunadb public headers include it
/// first, so users who only include faunadb headers don't need to do anything.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(FAUNADB_CONFIGURED)
#error "immer headers were included before faunadb/faunadb_config.h. " \
       "Please include faunadb headers before any direct immer includes."
#endif

#define FAUNADB_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// Value trees may be read from several threads at once, so reference
/// counting stays atomic. Do not define IMMER_NO_THREAD_SAFETY here.
#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#error "faunadb values are shared across threads; IMMER_NO_THREAD_SAFETY must be 0"
#endif

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
// Verbose Logging
//
// When FAUNADB_VERBOSE_LOG is 1, traversal and decode failures are
// also reported on stderr (they are always returned to the caller).
// Enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef FAUNADB_VERBOSE_LOG
#  if defined(NDEBUG)
#    define FAUNADB_VERBOSE_LOG 0
#  else
#    define FAUNADB_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Wire Codec Limits
// ============================================================

/// Maximum array/object nesting accepted by the JSON parser.
#ifndef FAUNADB_MAX_JSON_DEPTH
#define FAUNADB_MAX_JSON_DEPTH 512
#endif
