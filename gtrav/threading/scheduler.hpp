#pragma once

#include <memory>
#include <thread>
#include <cstddef>

#include "gtrav/config.hpp"
#include "gtrav/core/macros.hpp"

// =============================================================================
// FILE: gtrav/threading/scheduler.hpp
// BRIEF: Unified thread pool scheduler interface across multiple backends
// =============================================================================

// =============================================================================
// Backend Headers
// =============================================================================

#if defined(GTRAV_USE_BS)
    #include "BS_thread_pool.hpp"
#elif defined(GTRAV_USE_OPENMP)
    #include <omp.h>
#elif defined(GTRAV_USE_TBB)
    #include <tbb/global_control.h>
#endif

namespace gtrav::threading {

// =============================================================================
// Internal State
// =============================================================================

namespace detail {
#if defined(GTRAV_USE_BS)
    // Process-wide pool, never destroyed
    inline BS::thread_pool& get_global_pool() {
        static BS::thread_pool pool;
        return pool;
    }
#endif
}

// =============================================================================
// Public Scheduler API
// =============================================================================

class Scheduler {
public:
    static constexpr size_t MAX_THREADS = 1024;

    // At least 1 even when detection fails
    GTRAV_FORCE_INLINE static size_t hardware_concurrency() noexcept {
        size_t hw = std::thread::hardware_concurrency();
        return (hw > 0) ? hw : 1;
    }

    // n == 0 selects hardware_concurrency()
    // Note: For BS backend, this recreates the thread pool
    static void set_num_threads(size_t n) {
        if (n == 0) {
            n = hardware_concurrency();
        }
        if (n > MAX_THREADS) {
            n = MAX_THREADS;
        }

#if defined(GTRAV_USE_SERIAL)
        (void)n;

#elif defined(GTRAV_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(n));

#elif defined(GTRAV_USE_BS)
        detail::get_global_pool().reset(n);

#elif defined(GTRAV_USE_TBB)
        // global_control lives as long as the static holder
        static ::std::unique_ptr<tbb::global_control> gc;
        gc = ::std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, static_cast<int>(n));

#else
        (void)n;
#endif
    }

    // Number of threads used by parallel loops, at least 1
    static size_t get_num_threads() noexcept {
#if defined(GTRAV_USE_SERIAL)
        return 1;

#elif defined(GTRAV_USE_OPENMP)
        int n = omp_get_max_threads();
        return (n > 0) ? static_cast<size_t>(n) : 1;

#elif defined(GTRAV_USE_BS)
        size_t n = detail::get_global_pool().get_thread_count();
        return (n > 0) ? n : 1;

#elif defined(GTRAV_USE_TBB)
        int n = static_cast<int>(
            tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism));
        return (n > 0) ? static_cast<size_t>(n) : 1;

#else
        return 1;
#endif
    }

    static void init(size_t n = 0) {
        set_num_threads(n);
    }
};

} // namespace gtrav::threading
