// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Macros Header - Various useful macro definitions

   Visibility, format checking and branch hint helpers shared by the
   automark-pkg library and its users.

   This file had this historic note, but now includes further changes
   under the GPL-2.0+:

   This source is placed in the Public Domain, do with it what you will
   It was originally written by Brian C. White.

   ##################################################################### */
									/*}}}*/
// Private header
#ifndef AUTOMARK_MACROS_H
#define AUTOMARK_MACROS_H

#ifdef __GNUC__
#define AUTOMARK_GCC_VERSION (__GNUC__ << 8 | __GNUC_MINOR__)
#else
#define AUTOMARK_GCC_VERSION 0
#endif

#ifdef AUTOMARK_COMPILING_AUTOMARK
/* likely() and unlikely() can be used to mark boolean expressions
   as (not) likely true which will help the compiler to optimise */
#if AUTOMARK_GCC_VERSION >= 0x0300
	#define likely(x)	__builtin_expect (!!(x), 1)
	#define unlikely(x)	__builtin_expect (!!(x), 0)
#else
	#define likely(x)	(x)
	#define unlikely(x)	(x)
#endif
#endif

#if AUTOMARK_GCC_VERSION >= 0x0300
	#define AUTOMARK_PURE	__attribute__((pure))
	#define AUTOMARK_PRINTF(n)	__attribute__((format(printf, n, n + 1)))
	#define AUTOMARK_UNUSED	__attribute__((unused))
	#define AUTOMARK_MUSTCHECK	__attribute__((warn_unused_result))
#else
	#define AUTOMARK_PURE
	#define AUTOMARK_PRINTF(n)
	#define AUTOMARK_UNUSED
	#define AUTOMARK_MUSTCHECK
#endif

#if AUTOMARK_GCC_VERSION > 0x0302
	#define AUTOMARK_NONNULL(...)	__attribute__((nonnull(__VA_ARGS__)))
#else
	#define AUTOMARK_NONNULL(...)
#endif

#if AUTOMARK_GCC_VERSION >= 0x0400
	#define AUTOMARK_PUBLIC __attribute__ ((visibility ("default")))
	#define AUTOMARK_HIDDEN __attribute__ ((visibility ("hidden")))
#else
	#define AUTOMARK_PUBLIC
	#define AUTOMARK_HIDDEN
#endif

// cold functions are unlikely() to be called
#if AUTOMARK_GCC_VERSION >= 0x0403
	#define AUTOMARK_COLD	__attribute__ ((__cold__))
#else
	#define AUTOMARK_COLD
#endif

// These lines are read by CMakeLists.txt for the SONAME of the library.
// Increasing MAJOR or MINOR results in the need of recompiling all
// reverse-dependencies of libautomark-pkg.
#define AUTOMARK_PKG_MAJOR 1
#define AUTOMARK_PKG_MINOR 0
#define AUTOMARK_PKG_RELEASE 0

#endif
