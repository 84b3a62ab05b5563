// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_convert.cpp
 * @brief String, bytes and integer conversion implementations.
 */

#include "pch.h"
#include "pyforge/pf_convert.hpp"

namespace pyforge {

namespace detail {

std::optional<long long> long_to_signed(PyObject* obj) {
    if (!PyLong_Check(obj)) {
        return raise(ExceptionKind::TypeError, "expected int");
    }
    int overflow = 0;
    long long v = PyLong_AsLongLongAndOverflow(obj, &overflow);
    if (overflow != 0) {
        return raise(ExceptionKind::OverflowError, "integer out of range");
    }
    if (v == -1 && PyErr_Occurred()) return std::nullopt;
    return v;
}

std::optional<unsigned long long> long_to_unsigned(PyObject* obj) {
    if (!PyLong_Check(obj)) {
        return raise(ExceptionKind::TypeError, "expected int");
    }
    unsigned long long v = PyLong_AsUnsignedLongLong(obj);
    if (v == static_cast<unsigned long long>(-1) && PyErr_Occurred()) {
        // Negative values and values above 2^64-1 both land here
        if (PyErr_ExceptionMatches(PyExc_OverflowError)) {
            return raise(ExceptionKind::OverflowError, "integer out of range");
        }
        return std::nullopt;
    }
    return v;
}

} // namespace detail

// ============================================================================
// Host -> C++
// ============================================================================

std::optional<std::string> FromPy<std::string>::convert(PyObject* obj) {
    auto view = FromPy<std::string_view>::convert(obj);
    if (!view) return std::nullopt;
    return std::string(*view);
}

std::optional<std::string_view> FromPy<std::string_view>::convert(PyObject* obj) {
    if (!PyUnicode_Check(obj)) {
        return raise(ExceptionKind::TypeError, "expected str");
    }
    Py_ssize_t size = 0;
    const char* data = ffi::utf8(obj, &size);
    if (!data) {
        // Surrogates cannot be exposed as contiguous UTF-8
        return std::nullopt;
    }
    return std::string_view(data, static_cast<size_t>(size));
}

std::optional<std::vector<std::byte>> FromPy<std::vector<std::byte>>::convert(PyObject* obj) {
    if (!PyBytes_Check(obj)) {
        return raise(ExceptionKind::TypeError, "expected bytes");
    }
    const auto* data = reinterpret_cast<const std::byte*>(PyBytes_AS_STRING(obj));
    return std::vector<std::byte>(data, data + PyBytes_GET_SIZE(obj));
}

// ============================================================================
// C++ -> Host
// ============================================================================

PyObject* ToPy<std::string>::convert(const std::string& value) {
    return ffi::from_utf8(value);
}

PyObject* ToPy<std::string_view>::convert(std::string_view value) {
    return ffi::from_utf8(value);
}

PyObject* ToPy<const char*>::convert(const char* value) {
    if (value == nullptr) {
        return ffi::none_owned();
    }
    return ffi::from_cstring(value);
}

PyObject* ToPy<std::vector<std::byte>>::convert(const std::vector<std::byte>& value) {
    return PyBytes_FromStringAndSize(reinterpret_cast<const char*>(value.data()),
                                     static_cast<Py_ssize_t>(value.size()));
}

} // namespace pyforge
