#pragma once

#include <cstddef>
#include <cstdint>

// =============================================================================
// FILE: gtrav/config.hpp
// BRIEF: gtrav Core Configuration Header
// =============================================================================

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define GTRAV_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define GTRAV_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define GTRAV_OS_LINUX
#else
    #define GTRAV_OS_UNKNOWN
#endif

// =============================================================================
// Threading Backend Selection
// =============================================================================

// Auto-select backend based on platform if none specified
#if !defined(GTRAV_BACKEND_SERIAL) && !defined(GTRAV_BACKEND_TBB) && \
    !defined(GTRAV_BACKEND_OPENMP) && !defined(GTRAV_BACKEND_BS)
    #if defined(GTRAV_OS_MAC)
        // macOS: BS::thread_pool unless OpenMP is forced
        #if defined(GTRAV_MAC_USE_OPENMP)
            #define GTRAV_BACKEND_OPENMP
        #else
            #define GTRAV_BACKEND_BS
        #endif
    #elif defined(GTRAV_OS_WINDOWS) || defined(GTRAV_OS_LINUX)
        #define GTRAV_BACKEND_OPENMP
    #else
        #define GTRAV_BACKEND_BS
    #endif
#endif

// Exactly one backend must be selected
#if !defined(GTRAV_BACKEND_SERIAL) && !defined(GTRAV_BACKEND_TBB) && \
    !defined(GTRAV_BACKEND_OPENMP) && !defined(GTRAV_BACKEND_BS)
    #error "gtrav Configuration Error: No threading backend selected! " \
           "Please define exactly one backend: GTRAV_BACKEND_SERIAL, " \
           "GTRAV_BACKEND_TBB, GTRAV_BACKEND_OPENMP, or GTRAV_BACKEND_BS."
#endif

#if (defined(GTRAV_BACKEND_SERIAL) && (defined(GTRAV_BACKEND_TBB) || defined(GTRAV_BACKEND_OPENMP) || defined(GTRAV_BACKEND_BS))) || \
    (defined(GTRAV_BACKEND_TBB) && (defined(GTRAV_BACKEND_OPENMP) || defined(GTRAV_BACKEND_BS))) || \
    (defined(GTRAV_BACKEND_OPENMP) && defined(GTRAV_BACKEND_BS))
    #error "gtrav Configuration Error: Multiple threading backends defined! " \
           "Please define only one backend."
#endif

#if defined(GTRAV_OS_MAC) && defined(GTRAV_BACKEND_OPENMP)
    #pragma GCC warning "GTRAV_WARNING: OpenMP enabled on macOS. " \
                        "Ensure 'libomp' is installed and linker flags are correct."
#endif

// =============================================================================
// Feature Flags (Public API)
// =============================================================================

#if defined(GTRAV_BACKEND_OPENMP)
    #define GTRAV_USE_OPENMP 1
#elif defined(GTRAV_BACKEND_TBB)
    #define GTRAV_USE_TBB 1
#elif defined(GTRAV_BACKEND_BS)
    #define GTRAV_USE_BS 1
#elif defined(GTRAV_BACKEND_SERIAL)
    #define GTRAV_USE_SERIAL 1
#endif

// =============================================================================
// Memory Configuration
// =============================================================================

namespace gtrav::memory {
    inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;
    inline constexpr std::size_t CACHE_LINE_SIZE = 64;
}

// =============================================================================
// Sketch Configuration
// =============================================================================

namespace gtrav::sketch::config {
    // Supported HyperLogLog precisions (number of registers = 2^precision)
    inline constexpr std::uint8_t MIN_PRECISION = 4;
    inline constexpr std::uint8_t MAX_PRECISION = 16;
    inline constexpr std::uint8_t DEFAULT_PRECISION = 6;
    // Supported register widths in bits
    inline constexpr std::uint8_t DEFAULT_BITS = 6;
}
