#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <array>
#include <vector>
#include <optional>
#include <variant>
#include <stdexcept>

// ============================================================================
// Fundamental Type Aliases & Error Handling
// SplitWindow - C++20 type definitions shared by every module
// ============================================================================

namespace splitwindow {

// ============================================================================
// Integer Types (explicit width)
// ============================================================================
using i32 = std::int32_t;
using u32 = std::uint32_t;

using usize = std::size_t;

// ============================================================================
// Floating-Point Types
// ============================================================================
using f64 = double;

// Brightness temperature / LST (Kelvin)
using Kelvin = f64;

// ============================================================================
// String Types
// ============================================================================
using String = std::string;
using StringView = std::string_view;

// ============================================================================
// Container Type Aliases
// ============================================================================
template<typename T, usize N>
using Array = std::array<T, N>;

template<typename T>
using Vector = std::vector<T>;

template<typename T>
using Optional = std::optional<T>;

// ============================================================================
// Error Handling (C++20-compatible Result type)
// ============================================================================

/// Simple Result type using std::variant
/// Usage: Result<T, E> func() { return T{...}; } or { return Result<T, E>::Err(msg); }
/// T and E must be distinct types.
template<typename T, typename E = String>
class Result {
public:
    // Construct from success value
    Result(T&& value) : m_data(std::move(value)) {}
    Result(const T& value) : m_data(value) {}

    // Construct from error
    struct Err {
        E error;
        explicit Err(E&& e) : error(std::move(e)) {}
        explicit Err(const E& e) : error(e) {}
    };

    Result(Err&& err) : m_data(std::move(err.error)) {}

    // Check if result holds a value
    bool has_value() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return has_value(); }

    // Access value (throws if error)
    T& value() & { return std::get<T>(m_data); }
    const T& value() const & { return std::get<T>(m_data); }
    T&& value() && { return std::get<T>(std::move(m_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const & { return value(); }
    T&& operator*() && { return std::move(value()); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    // Access error (throws if value)
    const E& error() const & { return std::get<E>(m_data); }
    E& error() & { return std::get<E>(m_data); }
    E&& error() && { return std::get<E>(std::move(m_data)); }

private:
    std::variant<T, E> m_data;
};

/// Error codes for SplitWindow operations
enum class ErrorCode : u32 {
    // Coefficient table errors (200-299)
    NoMatchingSubrange = 200,
    AmbiguousSubrange = 201,
    CoefficientTableCorrupted = 202,

    // Estimator input errors (300-399)
    OutOfRangeInput = 300,
    InvalidEmissivity = 301
};

/// Convert ErrorCode to human-readable string
constexpr const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NoMatchingSubrange:        return "No matching CWV subrange";
        case ErrorCode::AmbiguousSubrange:         return "Ambiguous CWV subrange";
        case ErrorCode::CoefficientTableCorrupted: return "Coefficient table corrupted";
        case ErrorCode::OutOfRangeInput:           return "Input out of range";
        case ErrorCode::InvalidEmissivity:         return "Invalid emissivity";
    }
    return "Unknown error";
}

/// Exception raised by the estimator for invalid inputs or unresolvable coefficients
class SplitWindowError : public std::runtime_error {
public:
    SplitWindowError(ErrorCode code, const String& message)
        : std::runtime_error(String(ErrorCodeToString(code)) + ": " + message)
        , m_code(code) {}

    ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    // Digital number domain of TIRS bands (16-bit packed, 12-bit quantised)
    inline constexpr f64 DN_MIN = 1.0;
    inline constexpr f64 DN_MAX = 65535.0;
}

} // namespace splitwindow
