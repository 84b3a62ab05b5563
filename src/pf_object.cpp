// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_object.cpp
 * @brief Non-template handle and view operations.
 */

#include "pch.h"
#include "pyforge/pf_object.hpp"

namespace pyforge {

namespace detail {

ErrorPending raise_empty_handle() {
    if (PyErr_Occurred()) return {};
    return raise(ExceptionKind::TypeError, "missing argument");
}

} // namespace detail

// ============================================================================
// Object
// ============================================================================

Object Object::acquire(PyObject* ptr) noexcept {
    if (ptr) {
        Py_INCREF(ptr);
        PF_DEBUG_RC("acquire %p (%s) rc=%zd", static_cast<void*>(ptr), Py_TYPE(ptr)->tp_name, Py_REFCNT(ptr));
    }
    return Object(ptr, true);
}

void Object::release() noexcept {
    if (ptr_ && owned_) {
        PF_DEBUG_RC("release %p (%s) rc=%zd", static_cast<void*>(ptr_), Py_TYPE(ptr_)->tp_name, Py_REFCNT(ptr_));
        Py_DECREF(ptr_);
    }
    ptr_ = nullptr;
    owned_ = false;
}

Object Object::incref() const noexcept {
    return acquire(ptr_);
}

PyObject* Object::steal() noexcept {
    PyObject* p = ptr_;
    if (p && !owned_) {
        Py_INCREF(p);
    }
    ptr_ = nullptr;
    owned_ = false;
    return p;
}

Object Object::get_attr(const char* name) const {
    if (!ptr_) {
        detail::raise_empty_handle();
        return Object();
    }
    return Object::owned(PyObject_GetAttrString(ptr_, name));
}

Object Object::get_attr_or_null(const char* name) const {
    if (!ptr_) {
        detail::raise_empty_handle();
        return Object();
    }
    PyObject* value = PyObject_GetAttrString(ptr_, name);
    if (!value && PyErr_ExceptionMatches(PyExc_AttributeError)) {
        PyErr_Clear();
    }
    return Object::owned(value);
}

Object Object::str() const {
    if (!ptr_) {
        detail::raise_empty_handle();
        return Object();
    }
    return Object::owned(PyObject_Str(ptr_));
}

std::optional<bool> Object::is_true() const {
    if (!ptr_) return detail::raise_empty_handle();
    int r = PyObject_IsTrue(ptr_);
    if (r < 0) return std::nullopt;
    return r != 0;
}

std::optional<std::string_view> Object::unicode_view() const {
    if (!ptr_) return detail::raise_empty_handle();
    if (!PyUnicode_Check(ptr_)) {
        return raise(ExceptionKind::TypeError, "expected str");
    }
    Py_ssize_t size = 0;
    const char* data = ffi::utf8(ptr_, &size);
    if (!data) return std::nullopt;
    return std::string_view(data, static_cast<size_t>(size));
}

std::optional<std::span<const std::byte>> Object::bytes_view() const {
    if (!ptr_) return detail::raise_empty_handle();
    if (!PyBytes_Check(ptr_)) {
        return raise(ExceptionKind::TypeError, "expected bytes");
    }
    return std::span<const std::byte>(reinterpret_cast<const std::byte*>(PyBytes_AS_STRING(ptr_)),
                                      static_cast<size_t>(PyBytes_GET_SIZE(ptr_)));
}

Object ImportModule(const char* name) {
    return Object::owned(PyImport_ImportModule(name));
}

// ============================================================================
// Views
// ============================================================================

std::optional<Bytes> Bytes::cast(Object obj) {
    if (!obj || !PyBytes_Check(obj.ptr())) {
        obj.release();
        return raise(ExceptionKind::TypeError, "expected bytes");
    }
    return Bytes(std::move(obj));
}

std::optional<Bytes> Bytes::from_data(std::span<const std::byte> data) {
    PyObject* b = PyBytes_FromStringAndSize(reinterpret_cast<const char*>(data.data()),
                                            static_cast<Py_ssize_t>(data.size()));
    if (!b) return std::nullopt;
    return Bytes(Object::owned(b));
}

std::optional<Bytes> Bytes::from_data(std::string_view data) {
    return from_data(std::as_bytes(std::span<const char>(data.data(), data.size())));
}

std::optional<BufferView> BufferView::get(const Object& obj) {
    if (!obj) return detail::raise_empty_handle();
    BufferView view;
    if (PyObject_GetBuffer(obj.ptr(), &view.buffer_, PyBUF_SIMPLE) != 0) {
        return std::nullopt;
    }
    view.held_ = true;
    return std::optional<BufferView>(std::move(view));
}

void BufferView::release() noexcept {
    if (held_) {
        PyBuffer_Release(&buffer_);
        held_ = false;
    }
}

std::optional<List> List::cast(Object obj) {
    if (!obj || !PyList_Check(obj.ptr())) {
        obj.release();
        return raise(ExceptionKind::TypeError, "expected list");
    }
    return List(std::move(obj));
}

std::optional<List> List::create(Py_ssize_t size) {
    PyObject* list = PyList_New(size);
    if (!list) return std::nullopt;
    return List(Object::owned(list));
}

Object List::get(Py_ssize_t index) const {
    return Object::borrowed(PyList_GetItem(ptr(), index));
}

std::optional<Tuple> Tuple::cast(Object obj) {
    if (!obj || !PyTuple_Check(obj.ptr())) {
        obj.release();
        return raise(ExceptionKind::TypeError, "expected tuple");
    }
    return Tuple(std::move(obj));
}

std::optional<Tuple> Tuple::create(Py_ssize_t size) {
    PyObject* tuple = PyTuple_New(size);
    if (!tuple) return std::nullopt;
    return Tuple(Object::owned(tuple));
}

Object Tuple::get(Py_ssize_t index) const {
    return Object::borrowed(PyTuple_GetItem(ptr(), index));
}

std::optional<DictEntry> DictIterator::next() noexcept {
    if (done_) return std::nullopt;
    PyObject* key = nullptr;
    PyObject* value = nullptr;
    if (!PyDict_Next(dict_, &pos_, &key, &value)) {
        done_ = true;
        return std::nullopt;
    }
    return DictEntry{ Object::borrowed(key), Object::borrowed(value) };
}

std::optional<Dict> Dict::cast(Object obj) {
    if (!obj || !PyDict_Check(obj.ptr())) {
        obj.release();
        return raise(ExceptionKind::TypeError, "expected dict");
    }
    return Dict(std::move(obj));
}

std::optional<Dict> Dict::create() {
    PyObject* dict = PyDict_New();
    if (!dict) return std::nullopt;
    return Dict(Object::owned(dict));
}

Object Dict::get_item(const char* key) const {
    ScopedRef k(Object::owned(PyUnicode_FromString(key)));
    if (!k) return Object();
    return get_item(k.get());
}

Object Dict::get_item(const Object& key) const {
    if (!key) {
        detail::raise_empty_handle();
        return Object();
    }
    return Object::borrowed(PyDict_GetItemWithError(ptr(), key.ptr()));
}

std::optional<Long> Long::cast(Object obj) {
    if (!obj || !PyLong_Check(obj.ptr())) {
        obj.release();
        return raise(ExceptionKind::TypeError, "expected int");
    }
    return Long(std::move(obj));
}

IntegerClass Long::classify() const {
    int overflow = 0;
    PyLong_AsLongLongAndOverflow(ptr(), &overflow);
    if (overflow == 0) return IntegerClass::Signed;
    if (overflow < 0) return IntegerClass::Overflow;

    PyLong_AsUnsignedLongLong(ptr());
    if (PyErr_Occurred()) {
        PyErr_Clear();
        return IntegerClass::Overflow;
    }
    return IntegerClass::Unsigned;
}

std::optional<int64_t> Long::as_signed() const {
    long long v = PyLong_AsLongLong(ptr());
    if (v == -1 && PyErr_Occurred()) {
        if (PyErr_ExceptionMatches(PyExc_OverflowError)) {
            return raise(ExceptionKind::OverflowError, "integer out of range");
        }
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

std::optional<uint64_t> Long::as_unsigned() const {
    unsigned long long v = PyLong_AsUnsignedLongLong(ptr());
    if (v == static_cast<unsigned long long>(-1) && PyErr_Occurred()) {
        if (PyErr_ExceptionMatches(PyExc_OverflowError)) {
            return raise(ExceptionKind::OverflowError, "integer out of range");
        }
        return std::nullopt;
    }
    return static_cast<uint64_t>(v);
}

std::optional<uint64_t> Long::unsigned_mask() const {
    unsigned long long v = PyLong_AsUnsignedLongLongMask(ptr());
    if (v == static_cast<unsigned long long>(-1) && PyErr_Occurred()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(v);
}

} // namespace pyforge
