// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_CONFIG_HPP
#define LZC_CONFIG_HPP

// Configuration and feature-detection for lzc.
//
// Baseline: C++20 (std::span, concepts)
//
// This header intentionally contains only preprocessor logic and small helpers.

#ifndef LZC_DEBUG_ACCESS_CHECKS
// When enabled, lzc::lazy_concat instruments every public member with runtime
// checks that detect unsafe access patterns (read/write, write/write, and any
// access after the container has been moved from or finalised with done()).
//
// This is a *debugging aid* only. It does not make lazy_concat thread-safe.
#define LZC_DEBUG_ACCESS_CHECKS 0
#endif

#ifndef LZC_DEBUG_ACCESS_HISTORY
// Number of recent access events retained per object for diagnostics.
// Set to 0 to disable history recording (still reports basic conflicts).
#define LZC_DEBUG_ACCESS_HISTORY 32
#endif

#ifndef LZC_ACCESS_ABORT
#include <cstdlib>
#define LZC_ACCESS_ABORT() std::abort()
#endif

#ifndef LZC_DEFAULT_FRAGMENT_RESERVE
// Fragment slots reserved by a default-constructed lazy_concat.  Zero keeps
// construction allocation-free.
#define LZC_DEFAULT_FRAGMENT_RESERVE 0
#endif

// -------- Language version detection --------

#if defined(_MSVC_LANG)
#define LZC_CPP_LANG _MSVC_LANG
#else
#define LZC_CPP_LANG __cplusplus
#endif

#if LZC_CPP_LANG >= 202302L
#define LZC_HAS_CPP23 1
#else
#define LZC_HAS_CPP23 0
#endif

#if LZC_CPP_LANG >= 202002L
#define LZC_HAS_CPP20 1
#else
#define LZC_HAS_CPP20 0
#endif

#if !LZC_HAS_CPP20
#error "lzc requires C++20 (std::span and concepts)"
#endif

// Source-location-ish helper.
#if LZC_DEBUG_ACCESS_CHECKS
#define LZC_STRINGIFY_IMPL(x) #x
#define LZC_STRINGIFY(x) LZC_STRINGIFY_IMPL(x)
#define LZC_LOC (__FILE__ ":" LZC_STRINGIFY(__LINE__))
#else
#define LZC_LOC nullptr
#endif

#endif  // LZC_CONFIG_HPP
