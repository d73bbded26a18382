#pragma once

#include "gtrav/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <cstdint>

// =============================================================================
// FILE: gtrav/core/error.hpp
// BRIEF: gtrav Core Exception System
// =============================================================================

namespace gtrav {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    DOMAIN_ERROR = 12,
    INDEX_OUT_OF_BOUNDS = 14,

    // Graph errors
    MISSING_DATA = 20,
    UNREACHABLE_NODE = 21,
    SELF_LOOP = 22,

    // Feature errors
    NOT_IMPLEMENTED = 40,
    FEATURE_UNAVAILABLE = 41,
    CONFIGURATION_ERROR = 42,
};

// =============================================================================
// Base Exception Class
// =============================================================================

class GTRAV_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& msg)
        : Exception(ErrorCode::UNKNOWN, msg) {}

    explicit RuntimeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class OutOfMemoryError : public RuntimeError {
public:
    explicit OutOfMemoryError(const std::string& msg = "Out of memory")
        : RuntimeError(ErrorCode::OUT_OF_MEMORY, msg) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "Internal gtrav Error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class DomainError : public ValueError {
public:
    explicit DomainError(const std::string& msg)
        : ValueError(ErrorCode::DOMAIN_ERROR, msg) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(const std::string& msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, msg) {}
};

// =============================================================================
// Graph Errors
// =============================================================================

// Requested data was not computed or is not stored (distances, predecessors,
// edge weights).
class MissingDataError : public ValueError {
public:
    explicit MissingDataError(const std::string& msg)
        : ValueError(ErrorCode::MISSING_DATA, msg) {}
};

class UnreachableNodeError : public ValueError {
public:
    UnreachableNodeError(std::uint64_t src, std::uint64_t dst)
        : ValueError(ErrorCode::UNREACHABLE_NODE,
                     "There is no path starting from the given source node " +
                     std::to_string(src) + " and reaching the given destination node " +
                     std::to_string(dst) + ".") {}

    explicit UnreachableNodeError(const std::string& msg)
        : ValueError(ErrorCode::UNREACHABLE_NODE, msg) {}
};

class SelfLoopError : public ValueError {
public:
    explicit SelfLoopError(std::uint64_t node)
        : ValueError(ErrorCode::SELF_LOOP,
                     "The minimum path on a self-loop is not defined (node " +
                     std::to_string(node) + ").") {}
};

class NotImplementedError : public Exception {
public:
    explicit NotImplementedError(const std::string& msg = "Not implemented yet")
        : Exception(ErrorCode::NOT_IMPLEMENTED, msg) {}
};

class FeatureUnavailableError : public Exception {
public:
    explicit FeatureUnavailableError(const std::string& msg)
        : Exception(ErrorCode::FEATURE_UNAVAILABLE, msg) {}
};

class ConfigurationError : public Exception {
public:
    explicit ConfigurationError(const std::string& msg)
        : Exception(ErrorCode::CONFIGURATION_ERROR, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

// Internal invariants, active in all builds
#define GTRAV_ASSERT(condition, msg) \
    do { \
        if (GTRAV_UNLIKELY(!(condition))) { \
            throw gtrav::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

// Internal invariants on unchecked hot paths, compiled out in release builds
#if !defined(NDEBUG)
    #define GTRAV_DEBUG_ASSERT(condition, msg) GTRAV_ASSERT(condition, msg)
#else
    #define GTRAV_DEBUG_ASSERT(condition, msg) ((void)0)
#endif

#define GTRAV_CHECK_ARG(condition, msg) \
    do { \
        if (GTRAV_UNLIKELY(!(condition))) { \
            throw gtrav::ValueError(msg); \
        } \
    } while(0)

#define GTRAV_CHECK_DIM(condition, msg) \
    do { \
        if (GTRAV_UNLIKELY(!(condition))) { \
            throw gtrav::DimensionError(msg); \
        } \
    } while(0)

// Index type is unsigned throughout, so only the upper bound is tested
#define GTRAV_CHECK_BOUNDS(index, size, msg) \
    do { \
        if (GTRAV_UNLIKELY(static_cast<std::size_t>(index) >= static_cast<std::size_t>(size))) { \
            throw gtrav::IndexOutOfBoundsError(msg); \
        } \
    } while(0)

#define GTRAV_CHECK_DATA(condition, msg) \
    do { \
        if (GTRAV_UNLIKELY(!(condition))) { \
            throw gtrav::MissingDataError(msg); \
        } \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace gtrav
