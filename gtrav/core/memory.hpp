#pragma once

#include "gtrav/config.hpp"
#include "gtrav/core/type.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/core/error.hpp"
#include <cstring>
#include <cstdlib>
#include <new>
#include <memory>
#include <algorithm>

// =============================================================================
// FILE: gtrav/core/memory.hpp
// BRIEF: Aligned buffers for traversal state (frontiers, queues, workspaces)
// =============================================================================

namespace gtrav::memory {

// =============================================================================
// Aligned Memory Allocation
// =============================================================================

template <typename T>
struct AlignedDeleter {
    std::size_t alignment_;

    explicit AlignedDeleter(std::size_t alignment = DEFAULT_ALIGNMENT) noexcept
        : alignment_(alignment) {}

    void operator()(T* ptr) const noexcept {
        if (GTRAV_UNLIKELY(!ptr)) return;

        if constexpr (std::is_arithmetic_v<T>) {
            operator delete[](ptr, std::align_val_t(alignment_));
        } else {
#if defined(_WIN32) || defined(_WIN64)
            _aligned_free(ptr);
#else
            std::free(ptr);
#endif
        }
    }
};

template <typename T>
using AlignedPtr = std::unique_ptr<T[], AlignedDeleter<T>>;  // NOLINT(modernize-avoid-c-arrays)

// Zero-initialized aligned array. Throws OutOfMemoryError on failure.
template <typename T>
GTRAV_FORCE_INLINE auto aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) -> AlignedPtr<T> {
    static_assert(std::is_trivially_destructible_v<T>,
                  "aligned_alloc: Type must be trivially destructible");

    if (GTRAV_UNLIKELY(count == 0)) {
        return AlignedPtr<T>(nullptr, AlignedDeleter<T>(alignment));
    }

    T* raw_ptr = nullptr;

    if constexpr (std::is_arithmetic_v<T>) {
        try {
            raw_ptr = new (std::align_val_t(alignment)) T[count]();
        } catch (const std::bad_alloc&) {
            throw OutOfMemoryError("aligned_alloc: failed to allocate " +
                                   std::to_string(count * sizeof(T)) + " bytes");
        }
    } else {
        const std::size_t byte_size = count * sizeof(T);
        void* ptr = nullptr;

#if defined(_WIN32) || defined(_WIN64)
        ptr = _aligned_malloc(byte_size, alignment);
#else
        if (GTRAV_UNLIKELY(posix_memalign(&ptr, alignment, byte_size) != 0)) {
            ptr = nullptr;
        }
#endif

        if (GTRAV_UNLIKELY(!ptr)) {
            throw OutOfMemoryError("aligned_alloc: failed to allocate " +
                                   std::to_string(byte_size) + " bytes");
        }
        raw_ptr = static_cast<T*>(ptr);
        for (Size i = 0; i < count; ++i) {
            new (raw_ptr + i) T();
        }
    }

    return AlignedPtr<T>(raw_ptr, AlignedDeleter<T>(alignment));
}

// =============================================================================
// Fill Helpers
// =============================================================================

template <typename T>
GTRAV_FORCE_INLINE void fill(T* ptr, Size n, T value) noexcept {
    std::fill(ptr, ptr + n, value);
}

template <typename T>
GTRAV_FORCE_INLINE void zero(T* ptr, Size n) noexcept {
    static_assert(std::is_trivially_copyable_v<T>, "zero: Type must be trivially copyable");
    std::memset(static_cast<void*>(ptr), 0, n * sizeof(T));
}

} // namespace gtrav::memory
