// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_errors.hpp
 * @brief Exception kinds, pending-exception state and error mapping.
 *
 * Failure crosses the host boundary as "exception pending + sentinel".
 * raise() sets the host exception and hands back an ErrorPending marker
 * that converts into every sentinel form native code returns: an empty
 * std::optional, an empty Result<T>, or nullptr through sentinel().
 */

#pragma once

#include "pf_core.hpp"
#include "pf_ffi.hpp"

#include <initializer_list>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace pyforge {

// ============================================================================
// Exception kinds
// ============================================================================

enum class ExceptionKind : uint8_t {
    TypeError,
    ValueError,
    RuntimeError,
    ZeroDivisionError,
    OverflowError,
    AttributeError,
    IndexError,
    KeyError,
    MemoryError,
    StopIteration,  // ends iteration from a bound __next__
    InternalError,  // contract violation or unmapped native error
};

// Host exception type for a kind (borrowed)
PyObject* exception_type(ExceptionKind kind);

// Printable name ("TypeError", ...)
const char* exception_kind_name(ExceptionKind kind);

// ============================================================================
// Sentinel marker
// ============================================================================

// Returned by raise(). Carries no data: the exception lives in host state.
struct ErrorPending {
    template<typename T>
    operator std::optional<T>() const noexcept { return std::nullopt; }

    // Raw-handle sentinel for C-level slots
    PyObject* sentinel() const noexcept { return nullptr; }
};

// Set the host exception for kind and return the sentinel marker.
ErrorPending raise(ExceptionKind kind, const char* message);
ErrorPending raise(ExceptionKind kind, const std::string& message);

// Raise InternalError unless an exception is already pending. Used where
// a callee reported failure; `where` names the callee for diagnostics.
ErrorPending raise_fallback(const char* where);

// Translate the in-flight C++ exception into a pending host exception.
// Must be called from inside a catch block.
ErrorPending raise_current_exception();

// Pending-state queries
bool error_occurred() noexcept;
void clear_error() noexcept;
bool exception_matches(ExceptionKind kind) noexcept;

// ============================================================================
// Error mapping
// ============================================================================

template<typename E>
struct ErrorMapEntry {
    E error;
    ExceptionKind kind;
    const char* message;
};

template<typename E>
using ErrorMapping = std::span<const ErrorMapEntry<E>>;

namespace detail {

ErrorPending raise_unmapped(long long code);

template<typename E>
long long error_code(E err) {
    if constexpr (std::is_enum_v<E>) {
        return static_cast<long long>(static_cast<std::underlying_type_t<E>>(err));
    } else if constexpr (std::is_integral_v<E>) {
        return static_cast<long long>(err);
    } else {
        return -1;
    }
}

} // namespace detail

// Look up err in declared order; the first matching entry is raised.
// No match raises InternalError, never a silent success.
template<typename E>
ErrorPending raise_error(E err, std::type_identity_t<ErrorMapping<E>> mapping) {
    for (const auto& entry : mapping) {
        if (entry.error == err) {
            return raise(entry.kind, entry.message);
        }
    }
    return detail::raise_unmapped(detail::error_code(err));
}

template<typename E>
ErrorPending raise_error(E err, std::initializer_list<std::type_identity_t<ErrorMapEntry<E>>> mapping) {
    return raise_error(err, ErrorMapping<E>(mapping.begin(), mapping.size()));
}

// ============================================================================
// Native-side exception
// ============================================================================

// Thrown inside bound code; the dispatch adapter turns it into a host
// exception of the same kind at the boundary.
class Exception : public std::runtime_error {
public:
    Exception(ExceptionKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ExceptionKind kind() const noexcept { return kind_; }

private:
    ExceptionKind kind_;
};

// ============================================================================
// Result<T>
// ============================================================================

// Failable return type for bound functions. An empty Result means an
// exception is pending.
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(ErrorPending) noexcept {}

    bool ok() const noexcept { return value_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    T& value() & { return *value_; }
    const T& value() const& { return *value_; }
    T&& value() && { return std::move(*value_); }

    T& operator*() & { return *value_; }
    const T& operator*() const& { return *value_; }
    T* operator->() { return &*value_; }
    const T* operator->() const { return &*value_; }

private:
    std::optional<T> value_;
};

template<>
class Result<void> {
public:
    Result() noexcept : ok_(true) {}
    Result(ErrorPending) noexcept : ok_(false) {}

    bool ok() const noexcept { return ok_; }
    explicit operator bool() const noexcept { return ok_; }

private:
    bool ok_;
};

template<typename T>
struct IsResult : std::false_type {};

template<typename T>
struct IsResult<Result<T>> : std::true_type {
    using value_type = T;
};

} // namespace pyforge
