// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_object.hpp
 * @brief Owned/borrowed object handles and typed container views.
 *
 * Object is a plain {pointer, owned} value. It has no destructor: an owned
 * handle must reach release() exactly once on every path out of the scope
 * that created it, and a borrowed handle is never released. ScopedRef is
 * the scoped helper that guarantees the release.
 *
 * An empty handle is the failure result of get_attr, call, str and the
 * other host operations. Operations on it fail with the exception that
 * produced it still pending (TypeError when nothing is).
 *
 * The conversion templates (as, call, set_attr, List::append, ...) are
 * defined in pf_convert.hpp.
 */

#pragma once

#include "pf_core.hpp"
#include "pf_ffi.hpp"
#include "pf_errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace pyforge {

namespace detail {

// Failure of an operation on an empty handle. Keeps the exception that
// produced the empty handle; raises TypeError when nothing is pending.
ErrorPending raise_empty_handle();

} // namespace detail

// ============================================================================
// Object (handle)
// ============================================================================

class Object {
public:
    Object() noexcept = default;

    // Non-owning view; no refcount change
    static Object borrowed(PyObject* ptr) noexcept { return Object(ptr, false); }

    // Adopt a new reference (e.g. the result of a host call)
    static Object owned(PyObject* ptr) noexcept { return Object(ptr, true); }

    // Take a new strong reference to a borrowed pointer
    static Object acquire(PyObject* ptr) noexcept;

    Object(Object&& other) noexcept
        : ptr_(other.ptr_), owned_(other.owned_) {
        other.ptr_ = nullptr;
        other.owned_ = false;
    }

    // An owned target is released before taking over other
    Object& operator=(Object&& other) noexcept {
        if (this == &other) return *this;
        release();
        ptr_ = other.ptr_;
        owned_ = other.owned_;
        other.ptr_ = nullptr;
        other.owned_ = false;
        return *this;
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    PyObject* ptr() const noexcept { return ptr_; }
    bool valid() const noexcept { return ptr_ != nullptr; }
    bool is_owned() const noexcept { return owned_; }
    explicit operator bool() const noexcept { return ptr_ != nullptr; }

    // Decrement once if owned; the handle is empty afterwards.
    void release() noexcept;

    // New owned handle to the same object
    Object incref() const noexcept;

    // Borrowed view of the same object
    Object borrow() const noexcept { return Object(ptr_, false); }

    // Hand the reference to a stealing host API. Owned handles give up
    // their reference; borrowed handles produce a new one.
    PyObject* steal() noexcept;

    // -- conversion (pf_convert.hpp) --
    template<typename T>
    std::optional<T> as() const;

    template<typename... Args>
    Object call(Args&&... args) const;

    template<typename... Args>
    Object call_method(const char* name, Args&&... args) const;

    template<typename V>
    bool set_attr(const char* name, V&& value) const;

    // -- attribute access --
    Object get_attr(const char* name) const;

    // Absent attribute: empty handle and no pending exception
    Object get_attr_or_null(const char* name) const;

    Object str() const;
    std::optional<bool> is_true() const;

    // -- predicates (false for an empty handle) --
    bool is_none() const noexcept { return ptr_ == Py_None; }
    bool is_callable() const noexcept { return ptr_ && PyCallable_Check(ptr_) != 0; }
    bool is_unicode() const noexcept { return ptr_ && PyUnicode_Check(ptr_); }
    bool is_bytes() const noexcept { return ptr_ && PyBytes_Check(ptr_); }
    bool is_bool() const noexcept { return ptr_ && PyBool_Check(ptr_); }
    bool is_long() const noexcept { return ptr_ && PyLong_Check(ptr_); }
    bool is_float() const noexcept { return ptr_ && PyFloat_Check(ptr_); }
    bool is_list() const noexcept { return ptr_ && PyList_Check(ptr_); }
    bool is_tuple() const noexcept { return ptr_ && PyTuple_Check(ptr_); }
    bool is_dict() const noexcept { return ptr_ && PyDict_Check(ptr_); }

    // Zero-copy UTF-8, valid while the object lives
    std::optional<std::string_view> unicode_view() const;

    // Zero-copy bytes content, valid while the object lives
    std::optional<std::span<const std::byte>> bytes_view() const;

    Py_ssize_t refcount() const noexcept { return ptr_ ? Py_REFCNT(ptr_) : 0; }

private:
    Object(PyObject* ptr, bool owned) noexcept : ptr_(ptr), owned_(owned) {}

    PyObject* ptr_ = nullptr;
    bool owned_ = false;
};

// Borrowed None singleton
inline Object None() noexcept { return Object::borrowed(Py_None); }

// Borrowed NotImplemented singleton, returned by operator methods that do
// not handle the other operand
inline Object NotImplemented() noexcept { return Object::borrowed(Py_NotImplemented); }

// Import a host module by dotted name. Empty handle on failure.
Object ImportModule(const char* name);

// ============================================================================
// ScopedRef
// ============================================================================

// Releases the held handle on scope exit.
class ScopedRef {
public:
    explicit ScopedRef(Object obj) noexcept : obj_(std::move(obj)) {}
    ~ScopedRef() { obj_.release(); }

    ScopedRef(const ScopedRef&) = delete;
    ScopedRef& operator=(const ScopedRef&) = delete;

    Object& get() noexcept { return obj_; }
    const Object& get() const noexcept { return obj_; }
    Object* operator->() noexcept { return &obj_; }
    const Object& operator*() const noexcept { return obj_; }
    PyObject* ptr() const noexcept { return obj_.ptr(); }
    explicit operator bool() const noexcept { return obj_.valid(); }

    // Give up the handle without releasing it
    Object take() noexcept { return std::move(obj_); }

private:
    Object obj_;
};

// ============================================================================
// Typed views
// ============================================================================

// Base of every typed view: holds the handle and its ownership tag.
class View {
public:
    const Object& object() const noexcept { return obj_; }
    PyObject* ptr() const noexcept { return obj_.ptr(); }
    bool is_owned() const noexcept { return obj_.is_owned(); }
    void release() noexcept { obj_.release(); }

    Object take() noexcept { return std::move(obj_); }

protected:
    View() noexcept = default;
    explicit View(Object obj) noexcept : obj_(std::move(obj)) {}

    Object obj_;
};

// ---- Bytes ----

class Bytes : public View {
public:
    Bytes() noexcept = default;

    // Type-checked view; consumes obj (released on mismatch)
    static std::optional<Bytes> cast(Object obj);

    // Copy data into a new bytes object
    static std::optional<Bytes> from_data(std::span<const std::byte> data);
    static std::optional<Bytes> from_data(std::string_view data);

    Py_ssize_t size() const noexcept { return PyBytes_GET_SIZE(ptr()); }

    std::span<const std::byte> view() const noexcept {
        return { reinterpret_cast<const std::byte*>(PyBytes_AS_STRING(ptr())),
                 static_cast<size_t>(PyBytes_GET_SIZE(ptr())) };
    }

private:
    explicit Bytes(Object obj) noexcept : View(std::move(obj)) {}
};

// ---- BufferView ----

// Zero-copy access to any buffer-protocol object. Holds the exporter's
// buffer until release() (or destruction).
class BufferView {
public:
    BufferView() noexcept = default;
    ~BufferView() { release(); }

    BufferView(BufferView&& other) noexcept : buffer_(other.buffer_), held_(other.held_) {
        other.held_ = false;
    }
    BufferView& operator=(BufferView&& other) noexcept {
        if (this != &other) {
            release();
            buffer_ = other.buffer_;
            held_ = other.held_;
            other.held_ = false;
        }
        return *this;
    }

    BufferView(const BufferView&) = delete;
    BufferView& operator=(const BufferView&) = delete;

    static std::optional<BufferView> get(const Object& obj);

    std::span<const std::byte> data() const noexcept {
        if (!held_) return {};
        return { static_cast<const std::byte*>(buffer_.buf), static_cast<size_t>(buffer_.len) };
    }
    Py_ssize_t size() const noexcept { return held_ ? buffer_.len : 0; }
    bool readonly() const noexcept { return held_ && buffer_.readonly != 0; }
    bool held() const noexcept { return held_; }

    void release() noexcept;

private:
    Py_buffer buffer_{};
    bool held_ = false;
};

// ---- List ----

class List : public View {
public:
    List() noexcept = default;

    static std::optional<List> cast(Object obj);
    static std::optional<List> create(Py_ssize_t size = 0);

    Py_ssize_t size() const noexcept { return PyList_GET_SIZE(ptr()); }

    // Borrowed item; IndexError on a bad index
    Object get(Py_ssize_t index) const;

    // Replace item (the converted value is stolen by the list)
    template<typename V>
    bool set(Py_ssize_t index, V&& value) const;

    template<typename V>
    bool append(V&& value) const;

private:
    explicit List(Object obj) noexcept : View(std::move(obj)) {}
};

// ---- Tuple ----

class Tuple : public View {
public:
    Tuple() noexcept = default;

    static std::optional<Tuple> cast(Object obj);
    static std::optional<Tuple> create(Py_ssize_t size);

    template<typename... Args>
    static std::optional<Tuple> from_values(Args&&... args);

    Py_ssize_t size() const noexcept { return PyTuple_GET_SIZE(ptr()); }

    Object get(Py_ssize_t index) const;

    // Fill a slot of a freshly created tuple (stolen)
    template<typename V>
    bool set(Py_ssize_t index, V&& value) const;

private:
    explicit Tuple(Object obj) noexcept : View(std::move(obj)) {}
};

// ---- Dict ----

struct DictEntry {
    Object key;    // borrowed
    Object value;  // borrowed
};

// Single pass over a dict. Once exhausted it stays exhausted; obtain a
// fresh iterator from Dict::iter() for another pass.
class DictIterator {
public:
    explicit DictIterator(PyObject* dict) noexcept : dict_(dict) {}

    std::optional<DictEntry> next() noexcept;
    bool done() const noexcept { return done_; }

private:
    PyObject* dict_;
    Py_ssize_t pos_ = 0;
    bool done_ = false;
};

class Dict : public View {
public:
    Dict() noexcept = default;

    static std::optional<Dict> cast(Object obj);
    static std::optional<Dict> create();

    Py_ssize_t size() const noexcept { return PyDict_GET_SIZE(ptr()); }

    // Borrowed value; absent key yields an empty handle with no error. An
    // unhashable key leaves the host's TypeError pending.
    Object get_item(const char* key) const;
    Object get_item(const Object& key) const;

    template<typename K, typename V>
    bool set_item(K&& key, V&& value) const;

    DictIterator iter() const noexcept { return DictIterator(ptr()); }

private:
    explicit Dict(Object obj) noexcept : View(std::move(obj)) {}
};

// ---- Long ----

enum class IntegerClass : uint8_t {
    Signed,    // fits int64_t
    Unsigned,  // fits uint64_t but not int64_t
    Overflow,  // fits neither
};

class Long : public View {
public:
    Long() noexcept = default;

    static std::optional<Long> cast(Object obj);

    IntegerClass classify() const;

    std::optional<int64_t> as_signed() const;
    std::optional<uint64_t> as_unsigned() const;

    // Value modulo 2^64 (the host's `value & 0xFFFFFFFFFFFFFFFF`)
    std::optional<uint64_t> unsigned_mask() const;

private:
    explicit Long(Object obj) noexcept : View(std::move(obj)) {}
};

// ============================================================================
// Interpreter lock
// ============================================================================

// Acquire the host lock from a thread that may not hold it.
class GilGuard {
public:
    GilGuard() noexcept : state_(PyGILState_Ensure()) {}
    ~GilGuard() { PyGILState_Release(state_); }

    GilGuard(const GilGuard&) = delete;
    GilGuard& operator=(const GilGuard&) = delete;

private:
    PyGILState_STATE state_;
};

// Release the host lock for native work that touches no host objects.
// reacquire() blocks until the lock is available again; the destructor
// reacquires if that has not happened yet.
class AllowThreads {
public:
    AllowThreads() noexcept : save_(PyEval_SaveThread()) {}
    ~AllowThreads() { reacquire(); }

    AllowThreads(const AllowThreads&) = delete;
    AllowThreads& operator=(const AllowThreads&) = delete;

    void reacquire() noexcept {
        if (save_) {
            PyEval_RestoreThread(save_);
            save_ = nullptr;
        }
    }

    bool released() const noexcept { return save_ != nullptr; }

private:
    PyThreadState* save_;
};

} // namespace pyforge
