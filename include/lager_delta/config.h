// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Compile-time configuration for lager_delta and the libraries it sits on.
///
/// lager_delta stores every document as an immer persistent value and exposes
/// path access through lager lenses (which pull in zug). The settings below
/// must be seen before any immer, lager or zug header, so every public
/// lager_delta header includes this file first.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(LAGER_DELTA_CONFIGURED)
#error "immer headers were included before lager_delta/config.h. " \
       "Include lager_delta headers before any direct immer includes."
#endif

#define LAGER_DELTA_CONFIGURED 1

// ============================================================
// immer
// ============================================================

/// @brief Documents, patches and replicas are owned by one thread at a time.
///
/// Replica serializes access with its own mutex; immer nodes therefore use
/// non-atomic reference counts and an unlocked free list.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
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

/// @brief Invalid container access is reported by lager_delta itself
/// (PathError / ApplyError), never by immer.
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// lager / zug
// ============================================================

/// @brief Only lenses are used; store dependency checks are irrelevant.
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Feature toggles
// ============================================================

/// @brief Diagnostics for failed navigation and best-effort apply.
///
/// Enabled in debug builds, disabled with NDEBUG. Override with
/// -Dlager_delta_VERBOSE_LOG=0/1.
#ifndef lager_delta_VERBOSE_LOG
#  if defined(NDEBUG)
#    define lager_delta_VERBOSE_LOG 0
#  else
#    define lager_delta_VERBOSE_LOG 1
#  endif
#endif
