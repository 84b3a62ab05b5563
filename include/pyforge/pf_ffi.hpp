// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_ffi.hpp
 * @brief Raw host interface: CPython object header and primitives.
 *
 * Nothing here enforces ownership. Every function is a thin, unchecked
 * forwarder to the C API; the handle types in pf_object.hpp build the
 * safety on top.
 */

#pragma once

#ifndef PY_SSIZE_T_CLEAN
#define PY_SSIZE_T_CLEAN
#endif
#include <Python.h>
#include <structmember.h>

#include <cstddef>
#include <string_view>

namespace pyforge::ffi {

using Handle = PyObject*;
using Size = Py_ssize_t;

// ============================================================================
// Reference counting
// ============================================================================

inline void incref(Handle obj) { Py_INCREF(obj); }
inline void decref(Handle obj) { Py_DECREF(obj); }
inline void xincref(Handle obj) { Py_XINCREF(obj); }
inline void xdecref(Handle obj) { Py_XDECREF(obj); }
inline Size refcount(Handle obj) { return Py_REFCNT(obj); }

// ============================================================================
// Singletons
// ============================================================================

// Borrowed None
inline Handle none() { return Py_None; }

// New reference to None
inline Handle none_owned() {
    Py_INCREF(Py_None);
    return Py_None;
}

inline bool is_none(Handle obj) { return obj == Py_None; }

// ============================================================================
// Calls and attributes (all return new references or nullptr)
// ============================================================================

inline Handle call(Handle callable, Handle args, Handle kwargs) {
    return PyObject_Call(callable, args, kwargs);
}

inline Handle call_noargs(Handle callable) {
    return PyObject_CallNoArgs(callable);
}

inline Handle get_attr(Handle obj, const char* name) {
    return PyObject_GetAttrString(obj, name);
}

inline int set_attr(Handle obj, const char* name, Handle value) {
    return PyObject_SetAttrString(obj, name, value);
}

inline int has_attr(Handle obj, const char* name) {
    return PyObject_HasAttrString(obj, name);
}

// ============================================================================
// String helpers
// ============================================================================

// UTF-8 view of a str object, owned by the object. nullptr on failure.
inline const char* utf8(Handle str, Size* size) {
    return PyUnicode_AsUTF8AndSize(str, size);
}

inline Handle from_utf8(const char* data, Size size) {
    return PyUnicode_FromStringAndSize(data, size);
}

inline Handle from_utf8(std::string_view text) {
    return PyUnicode_FromStringAndSize(text.data(), static_cast<Size>(text.size()));
}

inline Handle from_cstring(const char* text) {
    return PyUnicode_FromString(text);
}

inline Handle intern(const char* text) {
    return PyUnicode_InternFromString(text);
}

inline const char* type_name(Handle obj) {
    return Py_TYPE(obj)->tp_name;
}

} // namespace pyforge::ffi
