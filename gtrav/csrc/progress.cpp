#include "gtrav/include/progress.hpp"

namespace gtrav {
namespace progress {

// =============================================================================
// ProgressPool Implementation
// =============================================================================

ProgressPool& ProgressPool::instance() {
    static ProgressPool pool;
    return pool;
}

ProgressSlot* ProgressPool::acquire() {
    // Round-robin scan, lock-free in the common case
    std::size_t start_index = next_index_.load(std::memory_order_relaxed);

    for (std::size_t i = 0; i < POOL_SIZE; ++i) {
        std::size_t index = (start_index + i) % POOL_SIZE;
        ProgressSlot& slot = slots_[index];

        bool expected = false;
        if (slot.active.compare_exchange_strong(
                expected, true,
                std::memory_order_acquire,
                std::memory_order_relaxed)) {
            slot.value.store(0, std::memory_order_relaxed);
            next_index_.store((index + 1) % POOL_SIZE, std::memory_order_relaxed);
            return &slot;
        }
    }

    // Progress tracking is optional: callers run untracked
    return nullptr;
}

void ProgressPool::release(ProgressSlot* slot) {
    if (slot == nullptr) {
        return;
    }

    const ProgressSlot* pool_start = slots_;
    const ProgressSlot* pool_end = slots_ + POOL_SIZE;
    if (slot < pool_start || slot >= pool_end) {
        return;
    }

    slot->value.store(0, std::memory_order_relaxed);
    slot->active.store(false, std::memory_order_release);
}

ProgressValue ProgressPool::get_value(const ProgressSlot* slot) const {
    if (slot == nullptr) {
        return 0;
    }
    return slot->value.load(std::memory_order_acquire);
}

bool ProgressPool::is_active(const ProgressSlot* slot) const {
    if (slot == nullptr) {
        return false;
    }
    return slot->active.load(std::memory_order_acquire);
}

std::size_t ProgressPool::active_count() const {
    std::size_t count = 0;
    for (const auto& slot : slots_) {
        count += slot.active.load(std::memory_order_relaxed) ? 1 : 0;
    }
    return count;
}

} // namespace progress
} // namespace gtrav
