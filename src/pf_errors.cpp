// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_errors.cpp
 * @brief Exception kind table, raise() and C++ exception translation.
 */

#include "pch.h"
#include "pyforge/pf_errors.hpp"

namespace pyforge {

PyObject* exception_type(ExceptionKind kind) {
    switch (kind) {
        case ExceptionKind::TypeError:         return PyExc_TypeError;
        case ExceptionKind::ValueError:        return PyExc_ValueError;
        case ExceptionKind::RuntimeError:      return PyExc_RuntimeError;
        case ExceptionKind::ZeroDivisionError: return PyExc_ZeroDivisionError;
        case ExceptionKind::OverflowError:     return PyExc_OverflowError;
        case ExceptionKind::AttributeError:    return PyExc_AttributeError;
        case ExceptionKind::IndexError:        return PyExc_IndexError;
        case ExceptionKind::KeyError:          return PyExc_KeyError;
        case ExceptionKind::MemoryError:       return PyExc_MemoryError;
        case ExceptionKind::StopIteration:     return PyExc_StopIteration;
        case ExceptionKind::InternalError:     return PyExc_SystemError;
    }
    return PyExc_SystemError;
}

const char* exception_kind_name(ExceptionKind kind) {
    switch (kind) {
        case ExceptionKind::TypeError:         return "TypeError";
        case ExceptionKind::ValueError:        return "ValueError";
        case ExceptionKind::RuntimeError:      return "RuntimeError";
        case ExceptionKind::ZeroDivisionError: return "ZeroDivisionError";
        case ExceptionKind::OverflowError:     return "OverflowError";
        case ExceptionKind::AttributeError:    return "AttributeError";
        case ExceptionKind::IndexError:        return "IndexError";
        case ExceptionKind::KeyError:          return "KeyError";
        case ExceptionKind::MemoryError:       return "MemoryError";
        case ExceptionKind::StopIteration:     return "StopIteration";
        case ExceptionKind::InternalError:     return "InternalError";
    }
    return "InternalError";
}

ErrorPending raise(ExceptionKind kind, const char* message) {
    PF_TRACE("raise %s: %s", exception_kind_name(kind), message);
    if (kind == ExceptionKind::MemoryError && message == nullptr) {
        PyErr_NoMemory();
        return {};
    }
    PyErr_SetString(exception_type(kind), message ? message : "");
    return {};
}

ErrorPending raise(ExceptionKind kind, const std::string& message) {
    return raise(kind, message.c_str());
}

ErrorPending raise_fallback(const char* where) {
    if (PyErr_Occurred()) {
        return {};
    }
    if (runtime_config().warn_on_fallback) {
        std::fprintf(stderr, "ERROR: %s reported failure without setting an exception\n", where);
    }
    PyErr_Format(PyExc_SystemError, "%s reported failure without setting an exception", where);
    return {};
}

ErrorPending raise_current_exception() {
    try {
        throw;
    } catch (const Exception& e) {
        return raise(e.kind(), e.what());
    } catch (const std::bad_alloc&) {
        PyErr_NoMemory();
        return {};
    } catch (const std::exception& e) {
        return raise(ExceptionKind::RuntimeError, e.what());
    } catch (...) {
        return raise(ExceptionKind::RuntimeError, "unknown native exception");
    }
}

bool error_occurred() noexcept {
    return PyErr_Occurred() != nullptr;
}

void clear_error() noexcept {
    PyErr_Clear();
}

bool exception_matches(ExceptionKind kind) noexcept {
    return PyErr_Occurred() != nullptr && PyErr_ExceptionMatches(exception_type(kind));
}

namespace detail {

ErrorPending raise_unmapped(long long code) {
    PF_TRACE("unmapped native error %lld", code);
    PyErr_Format(PyExc_SystemError, "unmapped native error (code %lld)", code);
    return {};
}

} // namespace detail

} // namespace pyforge
