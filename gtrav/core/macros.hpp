#pragma once

#include "gtrav/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: gtrav/core/macros.hpp
// BRIEF: Cross-platform compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define GTRAV_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define GTRAV_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define GTRAV_LIKELY(x)   (x)
    #define GTRAV_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define GTRAV_FORCE_INLINE __forceinline
    #define GTRAV_RESTRICT __restrict
    #define GTRAV_EXPORT __declspec(dllexport)
#else
    #define GTRAV_FORCE_INLINE inline __attribute__((always_inline))
    #define GTRAV_RESTRICT __restrict__
    #define GTRAV_EXPORT __attribute__((visibility("default")))
#endif

// Hot path: frequently called, optimize for speed
#if defined(__clang__) || defined(__GNUC__)
    #define GTRAV_HOT __attribute__((hot))
    #define GTRAV_COLD __attribute__((cold))
#else
    #define GTRAV_HOT
    #define GTRAV_COLD
#endif

// =============================================================================
// SECTION 3: Memory Alignment & Prefetching
// =============================================================================

#define GTRAV_ALIGNMENT 64

#if defined(__clang__) || defined(__GNUC__)
    #define GTRAV_PREFETCH_READ(ptr, locality) __builtin_prefetch((ptr), 0, (locality))
    #define GTRAV_PREFETCH_WRITE(ptr, locality) __builtin_prefetch((ptr), 1, (locality))
#elif defined(_MSC_VER)
    #include <xmmintrin.h>
    #define GTRAV_PREFETCH_READ(ptr, locality) \
        _mm_prefetch(reinterpret_cast<const char*>(ptr), \
                     (locality) == 0 ? _MM_HINT_NTA : \
                     (locality) == 1 ? _MM_HINT_T2  : \
                     (locality) == 2 ? _MM_HINT_T1  : _MM_HINT_T0)
    #define GTRAV_PREFETCH_WRITE(ptr, locality) GTRAV_PREFETCH_READ(ptr, locality)
#else
    #define GTRAV_PREFETCH_READ(ptr, locality) ((void)0)
    #define GTRAV_PREFETCH_WRITE(ptr, locality) ((void)0)
#endif

// =============================================================================
// SECTION 4: Cache Line and Memory Layout
// =============================================================================

#define GTRAV_CACHE_LINE_SIZE 64

// Pad structure to cache line boundary to avoid false sharing
#define GTRAV_CACHE_ALIGNED alignas(GTRAV_CACHE_LINE_SIZE)

// Spin-wait hint for busy polling loops
#if defined(__x86_64__) || defined(__i386__)
    #define GTRAV_CPU_RELAX() __builtin_ia32_pause()
#elif defined(__aarch64__)
    #define GTRAV_CPU_RELAX() __asm__ __volatile__("yield")
#else
    #define GTRAV_CPU_RELAX() ((void)0)
#endif

// =============================================================================
// SECTION 5: Compile-Time Utilities
// =============================================================================

#define GTRAV_STRINGIFY(x) #x
#define GTRAV_STRINGIFY_VALUE(x) GTRAV_STRINGIFY(x)
