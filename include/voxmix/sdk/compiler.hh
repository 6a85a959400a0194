/**
 * @file compiler.hh
 * @brief Compiler detection and feature macros
 */
#pragma once

#if !defined(__EMSCRIPTEN__)
#if defined(__clang__)
#define VOXMIX_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
#define VOXMIX_COMPILER_GCC
#elif defined(_MSC_VER)
#define VOXMIX_COMPILER_MSVC
#endif
#else
#define VOXMIX_COMPILER_WASM
#endif

// Vectorization hint for the inner mixing loops
#ifndef VOXMIX_PRAGMA_IVDEP
#if defined(VOXMIX_COMPILER_MSVC)
#define VOXMIX_PRAGMA_IVDEP __pragma(loop(ivdep))
#elif defined(__INTEL_COMPILER)
#define VOXMIX_PRAGMA_IVDEP _Pragma("ivdep")
#elif defined(VOXMIX_COMPILER_CLANG)
#define VOXMIX_PRAGMA_IVDEP _Pragma("clang loop vectorize(enable) interleave(enable)")
#elif defined(VOXMIX_COMPILER_GCC)
#define VOXMIX_PRAGMA_IVDEP _Pragma("GCC ivdep")
#else
#define VOXMIX_PRAGMA_IVDEP
#endif
#endif
