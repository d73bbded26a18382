#pragma once

#include "gtrav/config.hpp"
#include "gtrav/core/type.hpp"
#include "gtrav/core/macros.hpp"

#include <array>
#include <bit>
#include <cmath>
#include <cstdint>

// =============================================================================
// FILE: gtrav/core/hyperloglog.hpp
// BRIEF: Fixed-precision HyperLogLog counter with bit-packed registers
//
// 2^PRECISION registers of BITS bits each are packed into 32-bit words,
// (32 / BITS) registers per word. Union is the per-register maximum, which is
// commutative and idempotent. Equality is structural.
// =============================================================================

namespace gtrav::sketch {

namespace detail {

// splitmix64 finalizer
GTRAV_FORCE_INLINE constexpr std::uint64_t mix64(std::uint64_t x) noexcept {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

constexpr double alpha(std::size_t m) noexcept {
    if (m == 16) return 0.673;
    if (m == 32) return 0.697;
    if (m == 64) return 0.709;
    return 0.7213 / (1.0 + 1.079 / static_cast<double>(m));
}

} // namespace detail

template <std::uint8_t PRECISION, std::uint8_t BITS>
class HyperLogLog {
    static_assert(PRECISION >= config::MIN_PRECISION && PRECISION <= config::MAX_PRECISION,
                  "HyperLogLog: precision must be in [4, 16]");
    static_assert(BITS == 5 || BITS == 6, "HyperLogLog: register width must be 5 or 6 bits");

public:
    static constexpr std::size_t NUMBER_OF_REGISTERS = std::size_t(1) << PRECISION;
    static constexpr std::size_t REGISTERS_PER_WORD = 32 / BITS;
    static constexpr std::size_t NUMBER_OF_WORDS =
        (NUMBER_OF_REGISTERS + REGISTERS_PER_WORD - 1) / REGISTERS_PER_WORD;
    static constexpr std::uint32_t REGISTER_MASK = (std::uint32_t(1) << BITS) - 1;

    HyperLogLog() noexcept : words_{} {}

    // -------------------------------------------------------------------------
    // Register Access
    // -------------------------------------------------------------------------

    [[nodiscard]] GTRAV_FORCE_INLINE std::uint32_t get_register(std::size_t index) const noexcept {
        const std::size_t word = index / REGISTERS_PER_WORD;
        const std::size_t shift = (index % REGISTERS_PER_WORD) * BITS;
        return (words_[word] >> shift) & REGISTER_MASK;
    }

    GTRAV_FORCE_INLINE void set_register(std::size_t index, std::uint32_t value) noexcept {
        const std::size_t word = index / REGISTERS_PER_WORD;
        const std::size_t shift = (index % REGISTERS_PER_WORD) * BITS;
        words_[word] = (words_[word] & ~(REGISTER_MASK << shift)) | ((value & REGISTER_MASK) << shift);
    }

    // -------------------------------------------------------------------------
    // Insertion
    // -------------------------------------------------------------------------

    GTRAV_FORCE_INLINE void insert(std::uint64_t value) noexcept {
        const std::uint64_t hash = detail::mix64(value);
        const auto index = static_cast<std::size_t>(hash >> (64 - PRECISION));
        // Sentinel bit bounds the run of leading zeros to 64 - PRECISION
        const std::uint64_t rest = (hash << PRECISION) | (std::uint64_t(1) << (PRECISION - 1));
        auto rank = static_cast<std::uint32_t>(std::countl_zero(rest)) + 1;
        if (rank > REGISTER_MASK) {
            rank = REGISTER_MASK;
        }
        if (rank > get_register(index)) {
            set_register(index, rank);
        }
    }

    // -------------------------------------------------------------------------
    // Union
    // -------------------------------------------------------------------------

    HyperLogLog& operator|=(const HyperLogLog& other) noexcept {
        for (std::size_t w = 0; w < NUMBER_OF_WORDS; ++w) {
            if (words_[w] == other.words_[w]) continue;
            std::uint32_t merged = 0;
            for (std::size_t r = 0; r < REGISTERS_PER_WORD; ++r) {
                const std::size_t shift = r * BITS;
                const std::uint32_t a = (words_[w] >> shift) & REGISTER_MASK;
                const std::uint32_t b = (other.words_[w] >> shift) & REGISTER_MASK;
                merged |= (a > b ? a : b) << shift;
            }
            words_[w] = merged;
        }
        return *this;
    }

    friend HyperLogLog operator|(HyperLogLog lhs, const HyperLogLog& rhs) noexcept {
        lhs |= rhs;
        return lhs;
    }

    friend bool operator==(const HyperLogLog& lhs, const HyperLogLog& rhs) noexcept {
        return lhs.words_ == rhs.words_;
    }

    // -------------------------------------------------------------------------
    // Estimation
    // -------------------------------------------------------------------------

    [[nodiscard]] bool is_empty() const noexcept {
        for (std::uint32_t w : words_) {
            if (w != 0) return false;
        }
        return true;
    }

    [[nodiscard]] std::size_t number_of_zero_registers() const noexcept {
        std::size_t zeros = 0;
        for (std::size_t i = 0; i < NUMBER_OF_REGISTERS; ++i) {
            zeros += get_register(i) == 0;
        }
        return zeros;
    }

    /// Raw harmonic-mean estimate, switching to linear counting in the small
    /// range while empty registers remain.
    [[nodiscard]] Real estimate_cardinality() const noexcept {
        constexpr double m = static_cast<double>(NUMBER_OF_REGISTERS);
        double inverse_sum = 0.0;
        std::size_t zeros = 0;
        for (std::size_t i = 0; i < NUMBER_OF_REGISTERS; ++i) {
            const std::uint32_t reg = get_register(i);
            inverse_sum += std::ldexp(1.0, -static_cast<int>(reg));
            zeros += reg == 0;
        }
        const double raw = detail::alpha(NUMBER_OF_REGISTERS) * m * m / inverse_sum;
        if (raw <= 2.5 * m && zeros > 0) {
            return static_cast<Real>(m * std::log(m / static_cast<double>(zeros)));
        }
        return static_cast<Real>(raw);
    }

private:
    std::array<std::uint32_t, NUMBER_OF_WORDS> words_;
};

} // namespace gtrav::sketch
