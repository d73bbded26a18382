#pragma once

#include "gtrav/config.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/threading/scheduler.hpp"

#include <cstddef>
#include <utility>
#include <type_traits>
#include <vector>
#include <future>
#include <thread>
#include <atomic>
#include <cstdio>
#include <system_error>

// =============================================================================
// Backend Specific Headers
// =============================================================================

#if defined(GTRAV_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
    #include <tbb/task_arena.h>
#elif defined(GTRAV_USE_OPENMP)
    #include <omp.h>
#endif

namespace gtrav::threading {

// =============================================================================
// Parallel Loop Interface
// =============================================================================

// Unified parallel loop supporting both single-arg and dual-arg (with thread rank) lambdas
// Usage:
//   parallel_for(0, n, [&](size_t i) { ... });
//   parallel_for(0, n, [&](size_t i, size_t thread_rank) { ... });
// thread_rank is always < Scheduler::get_num_threads().
template <typename Func>
inline void parallel_for(size_t start, size_t end, Func&& func) {
    if (GTRAV_UNLIKELY(start >= end)) {
        return;
    }

    constexpr bool has_rank_arg = std::is_invocable_v<Func, size_t, size_t>;

#if defined(GTRAV_USE_SERIAL)
    for (size_t i = start; i < end; ++i) {
        if constexpr (has_rank_arg) {
            func(i, 0);
        } else {
            func(i);
        }
    }

#elif defined(GTRAV_USE_OPENMP)
    if (omp_in_parallel()) {
        for (size_t i = start; i < end; ++i) {
            if constexpr (has_rank_arg) {
                func(i, static_cast<size_t>(omp_get_thread_num()));
            } else {
                func(i);
            }
        }
    } else {
        #pragma omp parallel for schedule(dynamic, 64)
        for (size_t i = start; i < end; ++i) {
            if constexpr (has_rank_arg) {
                func(i, static_cast<size_t>(omp_get_thread_num()));
            } else {
                func(i);
            }
        }
    }

#elif defined(GTRAV_USE_TBB)
    const size_t n_threads = Scheduler::get_num_threads();
    tbb::task_arena arena(static_cast<int>(n_threads));
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<size_t>(start, end),
            [&](const tbb::blocked_range<size_t>& r) {
                const auto thread_rank = static_cast<size_t>(tbb::this_task_arena::current_thread_index());
                for (size_t i = r.begin(); i != r.end(); ++i) {
                    if constexpr (has_rank_arg) {
                        func(i, thread_rank);
                    } else {
                        func(i);
                    }
                }
            });
    });

#elif defined(GTRAV_USE_BS)
    auto& pool = detail::get_global_pool();
    const size_t num_threads = pool.get_thread_count();
    const size_t range_size = end - start;
    const size_t chunk_size = (range_size + num_threads - 1) / num_threads;

    if (chunk_size == 0) return;

    std::vector<std::future<void>> futures;
    futures.reserve(num_threads);

    size_t thread_rank = 0;
    for (size_t chunk_start = start; chunk_start < end; chunk_start += chunk_size) {
        const size_t chunk_end = (chunk_start + chunk_size < end) ? (chunk_start + chunk_size) : end;
        const size_t rank = thread_rank++;

        futures.push_back(pool.submit([&func, chunk_start, chunk_end, rank]() {
            for (size_t i = chunk_start; i < chunk_end; ++i) {
                if constexpr (has_rank_arg) {
                    func(i, rank);
                } else {
                    func(i);
                }
            }
        }));
    }

    for (auto& future : futures) {
        future.get();
    }

#else
    for (size_t i = start; i < end; ++i) {
        if constexpr (has_rank_arg) {
            func(i, 0);
        } else {
            func(i);
        }
    }
#endif
}

// =============================================================================
// Parallel Region
// =============================================================================

// Runs func(thread_rank, team_size) on a team of simultaneously live threads.
// Unlike parallel_for, every member is guaranteed to run concurrently with
// the others, so members may spin-wait on each other. The team may be smaller
// than n_threads when the backend cannot provide that many threads; callers
// must use team_size, never n_threads, when counting members.
// func must not throw.
template <typename Func>
inline void parallel_region(size_t n_threads, Func&& func) {
    if (n_threads == 0) {
        n_threads = 1;
    }

#if defined(GTRAV_USE_SERIAL)
    (void)n_threads;
    func(size_t(0), size_t(1));

#elif defined(GTRAV_USE_OPENMP)
    if (n_threads == 1 || omp_in_parallel()) {
        func(size_t(0), size_t(1));
        return;
    }
    #pragma omp parallel num_threads(static_cast<int>(n_threads))
    {
        const auto rank = static_cast<size_t>(omp_get_thread_num());
        const auto team = static_cast<size_t>(omp_get_num_threads());
        func(rank, team);
    }

#else
    // Pool backends (TBB, BS) do not guarantee that submitted tasks run
    // concurrently, so spin-waiting members get dedicated threads.
    if (n_threads == 1) {
        func(size_t(0), size_t(1));
        return;
    }
    // Members wait until the team size is published, so a failed spawn only
    // shrinks the team.
    std::atomic<size_t> team{0};
    std::vector<std::thread> workers;
    workers.reserve(n_threads - 1);
    try {
        for (size_t rank = 1; rank < n_threads; ++rank) {
            workers.emplace_back([&func, &team, rank]() {
                size_t team_size = 0;
                while ((team_size = team.load(std::memory_order_acquire)) == 0) {
                    GTRAV_CPU_RELAX();
                }
                func(rank, team_size);
            });
        }
    } catch (const std::system_error& e) {
        std::fprintf(stderr, "WARNING: parallel_region: started %zu of %zu threads (%s)\n",
                     workers.size() + 1, n_threads, e.what());
    }
    const size_t team_size = workers.size() + 1;
    team.store(team_size, std::memory_order_release);
    func(size_t(0), team_size);
    for (auto& worker : workers) {
        worker.join();
    }
#endif
}

} // namespace gtrav::threading
