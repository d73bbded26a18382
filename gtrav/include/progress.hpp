#pragma once

#include <cstddef>
#include <atomic>
#include <cstdint>

// =============================================================================
/// @file progress.hpp
/// @brief Asynchronous Progress Tracking
///
/// Long-running verbose kernels (naive diameter, all-nodes Dijkstra
/// centralities) publish a 0-100 progress value into a pre-allocated slot.
/// Updates are lock-free relaxed stores so that tracking never contends with
/// the computation; observers poll the slot from another thread.
///
/// @section Usage
///
/// @code{.cpp}
/// gtrav::progress::ProgressGuard progress(verbose);
/// for (size_t i = 0; i < size; ++i) {
///     // Computation...
///     progress.update(i + 1, size);
/// }
/// @endcode
// =============================================================================

namespace gtrav {
namespace progress {

/// @brief Progress value type (0-100, representing percentage)
using ProgressValue = std::uint8_t;

struct ProgressSlot {
    std::atomic<ProgressValue> value{0};
    std::atomic<bool> active{false};
};

/// @brief Process-wide pool of progress slots
class ProgressPool {
public:
    static ProgressPool& instance();

    /// @return Pointer to an acquired slot, or nullptr when the pool is exhausted
    ProgressSlot* acquire();

    void release(ProgressSlot* slot);

    ProgressValue get_value(const ProgressSlot* slot) const;

    bool is_active(const ProgressSlot* slot) const;

    /// @brief Number of slots currently acquired
    std::size_t active_count() const;

private:
    static constexpr std::size_t POOL_SIZE = 64;
    ProgressSlot slots_[POOL_SIZE];
    std::atomic<std::size_t> next_index_{0};

    ProgressPool() = default;
    ~ProgressPool() = default;
    ProgressPool(const ProgressPool&) = delete;
    ProgressPool& operator=(const ProgressPool&) = delete;
};

/// @brief Scoped slot ownership. A disabled guard holds no slot and
/// ignores updates.
class ProgressGuard {
public:
    explicit ProgressGuard(bool enabled = true)
        : slot_(enabled ? ProgressPool::instance().acquire() : nullptr) {}

    ~ProgressGuard() {
        ProgressPool::instance().release(slot_);
    }

    ProgressGuard(const ProgressGuard&) = delete;
    ProgressGuard& operator=(const ProgressGuard&) = delete;

    void update(std::size_t done, std::size_t total) noexcept {
        if (slot_ == nullptr || total == 0) {
            return;
        }
        slot_->value.store(static_cast<ProgressValue>((done * 100) / total),
                           std::memory_order_relaxed);
    }

    [[nodiscard]] ProgressSlot* slot() const noexcept { return slot_; }

private:
    ProgressSlot* slot_;
};

} // namespace progress
} // namespace gtrav
