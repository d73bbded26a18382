#pragma once

#include "gtrav/config.hpp"
#include "gtrav/core/type.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/core/memory.hpp"

#include <cstring>

// =============================================================================
// FILE: gtrav/threading/workspace.hpp
// BRIEF: Per-thread workspaces that remove per-iteration allocations
// =============================================================================

namespace gtrav::threading {

// =============================================================================
// Thread-Local Buffer Pool
// =============================================================================

// One contiguous allocation, sliced into one buffer per thread rank.
template <typename T>
class WorkspacePool {
public:
    WorkspacePool() = default;

    WorkspacePool(size_t n_threads, size_t capacity) {
        init(n_threads, capacity);
    }

    void init(size_t n_threads, size_t capacity) {
        n_threads_ = n_threads;
        capacity_ = capacity;
        data_ = gtrav::memory::aligned_alloc<T>(n_threads * capacity, GTRAV_ALIGNMENT);
    }

    WorkspacePool(const WorkspacePool&) = delete;
    WorkspacePool& operator=(const WorkspacePool&) = delete;
    WorkspacePool(WorkspacePool&&) noexcept = default;
    WorkspacePool& operator=(WorkspacePool&&) noexcept = default;

    GTRAV_FORCE_INLINE T* get(size_t thread_rank) noexcept {
        return data_.get() + thread_rank * capacity_;
    }

    GTRAV_FORCE_INLINE const T* get(size_t thread_rank) const noexcept {
        return data_.get() + thread_rank * capacity_;
    }

    GTRAV_FORCE_INLINE Array<T> span(size_t thread_rank) noexcept {
        return Array<T>(get(thread_rank), capacity_);
    }

    GTRAV_FORCE_INLINE void fill(size_t thread_rank, T value) noexcept {
        gtrav::memory::fill(get(thread_rank), capacity_, value);
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t n_threads() const noexcept { return n_threads_; }

private:
    gtrav::memory::AlignedPtr<T> data_{nullptr, gtrav::memory::AlignedDeleter<T>()};
    size_t n_threads_ = 0;
    size_t capacity_ = 0;
};

} // namespace gtrav::threading
