#pragma once

#include "gtrav/config.hpp"
#include "gtrav/core/macros.hpp"
#include <cstdint>
#include <cstddef>
#include <limits>
#include <type_traits>
#include <concepts>
#include <cassert>
#include <iterator>

// =============================================================================
// FILE: gtrav/core/type.hpp
// BRIEF: Graph id types, weight type and zero-overhead array views
// =============================================================================

namespace gtrav {

// =============================================================================
// SECTION 1: Basic Types
// =============================================================================

using NodeId = std::uint32_t;
using EdgeId = std::uint64_t;
using Real = float;

using Size = std::size_t;
using Byte = std::uint8_t;

// Marks an unreached node in distance arrays and "no predecessor" in Dijkstra
// predecessor arrays.
inline constexpr NodeId NOT_PRESENT = std::numeric_limits<NodeId>::max();

inline constexpr Real REAL_INFINITY = std::numeric_limits<Real>::infinity();

// =============================================================================
// SECTION 2: Array View
// =============================================================================

template <typename T>
struct Array {
    using value_type = T;
    using pointer = T*;
    using const_pointer = const T*;
    using reference = T&;
    using const_reference = const T&;
    using size_type = Size;
    using difference_type = std::ptrdiff_t;
    using iterator = T*;
    using const_iterator = const T*;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size s) noexcept : ptr(p), len(s) {}

    // Conversion from non-const to const
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    GTRAV_FORCE_INLINE constexpr auto operator[](Size i) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(i < len && "Array index out of bounds");
#endif
        return ptr[i];
    }

    [[nodiscard]] GTRAV_FORCE_INLINE constexpr auto data() const noexcept -> T* { return ptr; }
    [[nodiscard]] GTRAV_FORCE_INLINE constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] GTRAV_FORCE_INLINE constexpr auto empty() const noexcept -> bool { return len == 0; }

    [[nodiscard]] GTRAV_FORCE_INLINE constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] GTRAV_FORCE_INLINE constexpr auto end() const noexcept -> T* { return ptr + len; }
};

static_assert(std::is_trivially_copyable_v<Array<Real>>);
static_assert(std::is_trivially_copyable_v<Array<const NodeId>>);
static_assert(std::is_standard_layout_v<Array<NodeId>>);

// =============================================================================
// SECTION 3: ArrayLike Concept
// =============================================================================

template <typename A>
concept ArrayLike = requires(const A& a, Size i) {
    typename A::value_type;
    { a.size() } -> std::convertible_to<Size>;
    { a[i] } -> std::convertible_to<const typename A::value_type&>;
    { a.begin() };
    { a.end() };
};

static_assert(ArrayLike<Array<Real>>);
static_assert(ArrayLike<Array<const NodeId>>);

} // namespace gtrav
