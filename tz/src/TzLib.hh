//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// tzlib main header

// why no namespace for the main types?
// - consistency with the pre-processor and with the Tz macro prefix
// - TzTime, TzZone, ... are unambiguous with a short prefix
// - the Tz namespace holds free functions (Tz::findZone(), Tz::init())
// - TzXxx_ namespaces hold internals

#ifndef TzLib_HH
#define TzLib_HH

#include <assert.h>
#include <limits.h>
#include <stdint.h>
#include <stddef.h>
#include <stdlib.h>

#ifdef _WIN32

#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#ifdef TZ_EXPORTS
#define TzAPI __declspec(dllexport)
#define TzExplicit
#else
#define TzAPI __declspec(dllimport)
#define TzExplicit extern
#endif
#define TzExtern extern TzAPI

#else /* _WIN32 */

#define TzAPI
#define TzExplicit
#define TzExtern extern

#endif /* _WIN32 */

// sanity check platform
#if CHAR_BIT != 8
#error "Broken platform - CHAR_BIT is not 8 - a byte is not 8 bits!"
#endif
#if UINT_MAX < 0xffffffff
#error "Broken platform - UINT_MAX < 0xffffffff - int < 32 bits!"
#endif

#ifdef __GNUC__
#define TzLikely(x) __builtin_expect(!!(x), 1)
#define TzUnlikely(x) __builtin_expect(!!(x), 0)
#else
#define TzLikely(x) (x)
#define TzUnlikely(x) (x)
#endif

// type checking without dragging in <type_traits> everywhere
template <bool B, typename R = void> struct TzIfT_ { };
template <typename R> struct TzIfT_<true, R> { using T = R; };
template <bool B, typename R = void>
using TzIfT = typename TzIfT_<B, R>::T;

// safe bool idiom, given operator !()
#define TzOpBool \
  operator const void *() const { \
    return !*this ? \
      reinterpret_cast<const void *>(0) : \
      static_cast<const void *>(this); \
  }

#endif /* TzLib_HH */
