// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_convert.hpp
 * @brief Two-way marshaling between native values and host handles.
 *
 * FromPy<T>::convert(PyObject*) returns std::optional<T>; an empty result
 * means a TypeError/OverflowError is pending. ToPy<T>::convert returns a
 * new reference or nullptr with an exception pending. Both are resolved at
 * compile time, with integral and floating-point categories as the
 * fallback for widths that have no exact specialization.
 */

#pragma once

#include "pf_object.hpp"

#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pyforge {

// Marker for "no value" in both directions (None)
struct NoneType {};

namespace detail {

std::optional<long long> long_to_signed(PyObject* obj);
std::optional<unsigned long long> long_to_unsigned(PyObject* obj);

template<typename T> struct IsOptional : std::false_type {};
template<typename T> struct IsOptional<std::optional<T>> : std::true_type { using value_type = T; };

template<typename T> struct IsVector : std::false_type {};
template<typename T, typename A> struct IsVector<std::vector<T, A>> : std::true_type { using value_type = T; };

template<typename T> struct IsStringMap : std::false_type {};
template<typename V> struct IsStringMap<std::map<std::string, V>> : std::true_type { using mapped_type = V; };
template<typename V> struct IsStringMap<std::unordered_map<std::string, V>> : std::true_type { using mapped_type = V; };

template<typename T> struct IsPair : std::false_type {};
template<typename A, typename B> struct IsPair<std::pair<A, B>> : std::true_type {};

} // namespace detail

// ============================================================================
// Host -> C++ (FromPy)
// ============================================================================

// Primary template (will fail for unsupported types)
template<typename T, typename = void>
struct FromPy {
    static std::optional<T> convert(PyObject*) {
        static_assert(sizeof(T) == 0, "No FromPy conversion defined for this type");
        return std::nullopt;
    }
};

// Specialization for bool (host truthiness)
template<>
struct FromPy<bool> {
    static std::optional<bool> convert(PyObject* obj) {
        int r = PyObject_IsTrue(obj);
        if (r < 0) return std::nullopt;
        return r != 0;
    }
};

// Specialization for integral types
template<typename T>
struct FromPy<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static std::optional<T> convert(PyObject* obj) {
        if constexpr (std::is_signed_v<T>) {
            auto v = detail::long_to_signed(obj);
            if (!v) return std::nullopt;
            if (*v < static_cast<long long>(std::numeric_limits<T>::min()) ||
                *v > static_cast<long long>(std::numeric_limits<T>::max())) {
                return raise(ExceptionKind::OverflowError, "integer out of range");
            }
            return static_cast<T>(*v);
        } else {
            auto v = detail::long_to_unsigned(obj);
            if (!v) return std::nullopt;
            if (*v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
                return raise(ExceptionKind::OverflowError, "integer out of range");
            }
            return static_cast<T>(*v);
        }
    }
};

// Specialization for floating point types
template<typename T>
struct FromPy<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static std::optional<T> convert(PyObject* obj) {
        if (!PyFloat_Check(obj) && !PyLong_Check(obj)) {
            return raise(ExceptionKind::TypeError, "expected float");
        }
        double v = PyFloat_AsDouble(obj);
        if (v == -1.0 && PyErr_Occurred()) return std::nullopt;
        return static_cast<T>(v);
    }
};

template<>
struct FromPy<std::string> {
    static std::optional<std::string> convert(PyObject* obj);
};

// Zero-copy; valid while the source object lives
template<>
struct FromPy<std::string_view> {
    static std::optional<std::string_view> convert(PyObject* obj);
};

template<>
struct FromPy<std::vector<std::byte>> {
    static std::optional<std::vector<std::byte>> convert(PyObject* obj);
};

template<>
struct FromPy<NoneType> {
    static std::optional<NoneType> convert(PyObject* obj) {
        if (obj != Py_None) return raise(ExceptionKind::TypeError, "expected None");
        return NoneType{};
    }
};

// Handles and views borrow the argument
template<>
struct FromPy<Object> {
    static std::optional<Object> convert(PyObject* obj) {
        return Object::borrowed(obj);
    }
};

template<>
struct FromPy<Bytes> {
    static std::optional<Bytes> convert(PyObject* obj) { return Bytes::cast(Object::borrowed(obj)); }
};

template<>
struct FromPy<List> {
    static std::optional<List> convert(PyObject* obj) { return List::cast(Object::borrowed(obj)); }
};

template<>
struct FromPy<Tuple> {
    static std::optional<Tuple> convert(PyObject* obj) { return Tuple::cast(Object::borrowed(obj)); }
};

template<>
struct FromPy<Dict> {
    static std::optional<Dict> convert(PyObject* obj) { return Dict::cast(Object::borrowed(obj)); }
};

template<>
struct FromPy<Long> {
    static std::optional<Long> convert(PyObject* obj) { return Long::cast(Object::borrowed(obj)); }
};

template<>
struct FromPy<BufferView> {
    static std::optional<BufferView> convert(PyObject* obj) { return BufferView::get(Object::borrowed(obj)); }
};

// None <-> nullopt
template<typename T>
struct FromPy<std::optional<T>> {
    static std::optional<std::optional<T>> convert(PyObject* obj) {
        if (obj == Py_None) {
            return std::optional<std::optional<T>>(std::in_place);
        }
        auto inner = FromPy<T>::convert(obj);
        if (!inner) return std::nullopt;
        return std::optional<std::optional<T>>(std::in_place, std::move(*inner));
    }
};

// List or tuple, element-wise
template<typename T>
struct FromPy<T, std::enable_if_t<detail::IsVector<T>::value &&
                                  !std::is_same_v<T, std::vector<std::byte>>>> {
    using Elem = typename detail::IsVector<T>::value_type;

    static std::optional<T> convert(PyObject* obj) {
        if (!PyList_Check(obj) && !PyTuple_Check(obj)) {
            return raise(ExceptionKind::TypeError, "expected list");
        }
        Py_ssize_t n = PySequence_Fast_GET_SIZE(obj);
        PyObject** items = PySequence_Fast_ITEMS(obj);
        T out;
        out.reserve(static_cast<size_t>(n));
        for (Py_ssize_t i = 0; i < n; ++i) {
            auto elem = FromPy<Elem>::convert(items[i]);
            if (!elem) return std::nullopt;
            out.push_back(std::move(*elem));
        }
        return out;
    }
};

template<typename T>
struct FromPy<T, std::enable_if_t<detail::IsStringMap<T>::value>> {
    using Mapped = typename detail::IsStringMap<T>::mapped_type;

    static std::optional<T> convert(PyObject* obj) {
        if (!PyDict_Check(obj)) {
            return raise(ExceptionKind::TypeError, "expected dict");
        }
        T out;
        PyObject* key = nullptr;
        PyObject* value = nullptr;
        Py_ssize_t pos = 0;
        while (PyDict_Next(obj, &pos, &key, &value)) {
            auto k = FromPy<std::string>::convert(key);
            if (!k) return std::nullopt;
            auto v = FromPy<Mapped>::convert(value);
            if (!v) return std::nullopt;
            out.emplace(std::move(*k), std::move(*v));
        }
        return out;
    }
};

template<typename A, typename B>
struct FromPy<std::pair<A, B>> {
    static std::optional<std::pair<A, B>> convert(PyObject* obj) {
        if (!PyTuple_Check(obj) || PyTuple_GET_SIZE(obj) != 2) {
            return raise(ExceptionKind::TypeError, "expected tuple of length 2");
        }
        auto first = FromPy<A>::convert(PyTuple_GET_ITEM(obj, 0));
        if (!first) return std::nullopt;
        auto second = FromPy<B>::convert(PyTuple_GET_ITEM(obj, 1));
        if (!second) return std::nullopt;
        return std::pair<A, B>(std::move(*first), std::move(*second));
    }
};

// Convenience function. A null obj fails like an empty handle; an
// optional target reads it as None when nothing is pending.
template<typename T>
std::optional<std::decay_t<T>> from_py(PyObject* obj) {
    using Target = std::decay_t<T>;
    if (!obj) {
        if constexpr (detail::IsOptional<Target>::value) {
            if (!PyErr_Occurred()) return std::optional<Target>(std::in_place);
        }
        return detail::raise_empty_handle();
    }
    return FromPy<Target>::convert(obj);
}

// ============================================================================
// C++ -> Host (ToPy)
// ============================================================================

// Primary template (will fail for unsupported types)
template<typename T, typename = void>
struct ToPy {
    static PyObject* convert(const T&) {
        static_assert(sizeof(T) == 0, "No ToPy conversion defined for this type");
        return nullptr;
    }
};

template<>
struct ToPy<bool> {
    static PyObject* convert(bool value) { return PyBool_FromLong(value ? 1 : 0); }
};

template<typename T>
struct ToPy<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static PyObject* convert(T value) {
        if constexpr (std::is_signed_v<T>) {
            return PyLong_FromLongLong(static_cast<long long>(value));
        } else {
            return PyLong_FromUnsignedLongLong(static_cast<unsigned long long>(value));
        }
    }
};

template<typename T>
struct ToPy<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static PyObject* convert(T value) { return PyFloat_FromDouble(static_cast<double>(value)); }
};

template<>
struct ToPy<std::string> {
    static PyObject* convert(const std::string& value);
};

template<>
struct ToPy<std::string_view> {
    static PyObject* convert(std::string_view value);
};

// nullptr maps to None
template<>
struct ToPy<const char*> {
    static PyObject* convert(const char* value);
};

template<>
struct ToPy<char*> {
    static PyObject* convert(const char* value) { return ToPy<const char*>::convert(value); }
};

template<>
struct ToPy<std::vector<std::byte>> {
    static PyObject* convert(const std::vector<std::byte>& value);
};

template<>
struct ToPy<NoneType> {
    static PyObject* convert(NoneType) { return ffi::none_owned(); }
};

// An rvalue handle is consumed; an lvalue handle is shared (incref).
template<>
struct ToPy<Object> {
    static PyObject* convert(Object&& value) { return value.steal(); }
    static PyObject* convert(const Object& value) {
        Py_XINCREF(value.ptr());
        return value.ptr();
    }
};

template<typename T>
struct ToPy<T, std::enable_if_t<std::is_base_of_v<View, T>>> {
    static PyObject* convert(T&& value) { return value.take().steal(); }
    static PyObject* convert(const T& value) {
        Py_XINCREF(value.ptr());
        return value.ptr();
    }
};

template<typename T>
struct ToPy<std::optional<T>> {
    template<typename U>
    static PyObject* convert(U&& value) {
        if (!value) return ffi::none_owned();
        if constexpr (std::is_rvalue_reference_v<U&&>) {
            return ToPy<T>::convert(std::move(*value));
        } else {
            return ToPy<T>::convert(*value);
        }
    }
};

template<typename T>
struct ToPy<T, std::enable_if_t<detail::IsVector<T>::value &&
                                !std::is_same_v<T, std::vector<std::byte>>>> {
    static PyObject* convert(const T& value) {
        PyObject* list = PyList_New(static_cast<Py_ssize_t>(value.size()));
        if (!list) return nullptr;
        for (size_t i = 0; i < value.size(); ++i) {
            PyObject* item = ToPy<typename detail::IsVector<T>::value_type>::convert(value[i]);
            if (!item) {
                Py_DECREF(list);
                return nullptr;
            }
            PyList_SET_ITEM(list, static_cast<Py_ssize_t>(i), item);
        }
        return list;
    }
};

template<typename T>
struct ToPy<T, std::enable_if_t<detail::IsStringMap<T>::value>> {
    static PyObject* convert(const T& value) {
        PyObject* dict = PyDict_New();
        if (!dict) return nullptr;
        for (const auto& [k, v] : value) {
            PyObject* item = ToPy<typename detail::IsStringMap<T>::mapped_type>::convert(v);
            if (!item) {
                Py_DECREF(dict);
                return nullptr;
            }
            int rc = PyDict_SetItemString(dict, k.c_str(), item);
            Py_DECREF(item);
            if (rc != 0) {
                Py_DECREF(dict);
                return nullptr;
            }
        }
        return dict;
    }
};

template<typename A, typename B>
struct ToPy<std::pair<A, B>> {
    static PyObject* convert(const std::pair<A, B>& value) {
        PyObject* first = ToPy<A>::convert(value.first);
        if (!first) return nullptr;
        PyObject* second = ToPy<B>::convert(value.second);
        if (!second) {
            Py_DECREF(first);
            return nullptr;
        }
        PyObject* tuple = PyTuple_New(2);
        if (!tuple) {
            Py_DECREF(first);
            Py_DECREF(second);
            return nullptr;
        }
        PyTuple_SET_ITEM(tuple, 0, first);
        PyTuple_SET_ITEM(tuple, 1, second);
        return tuple;
    }
};

// Convenience functions
template<typename T>
PyObject* to_py(T&& value) {
    using Decayed = std::decay_t<T>;
    return ToPy<Decayed>::convert(std::forward<T>(value));
}

template<typename T>
Object to_object(T&& value) {
    return Object::owned(to_py(std::forward<T>(value)));
}

// ============================================================================
// Type names (registration manifest)
// ============================================================================

template<typename T, typename = void>
struct TypeName {
    static std::string get() { return "object"; }
};

template<> struct TypeName<void> { static std::string get() { return "None"; } };
template<> struct TypeName<NoneType> { static std::string get() { return "None"; } };
template<> struct TypeName<bool> { static std::string get() { return "bool"; } };
template<> struct TypeName<std::string> { static std::string get() { return "str"; } };
template<> struct TypeName<std::string_view> { static std::string get() { return "str"; } };
template<> struct TypeName<const char*> { static std::string get() { return "str"; } };
template<> struct TypeName<std::vector<std::byte>> { static std::string get() { return "bytes"; } };
template<> struct TypeName<Bytes> { static std::string get() { return "bytes"; } };
template<> struct TypeName<BufferView> { static std::string get() { return "Buffer"; } };
template<> struct TypeName<List> { static std::string get() { return "list"; } };
template<> struct TypeName<Tuple> { static std::string get() { return "tuple"; } };
template<> struct TypeName<Dict> { static std::string get() { return "dict"; } };
template<> struct TypeName<Long> { static std::string get() { return "int"; } };

template<typename T>
struct TypeName<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static std::string get() { return "int"; }
};

template<typename T>
struct TypeName<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static std::string get() { return "float"; }
};

template<typename T>
struct TypeName<std::optional<T>> {
    static std::string get() { return "Optional[" + TypeName<T>::get() + "]"; }
};

template<typename T>
struct TypeName<Result<T>> {
    static std::string get() { return TypeName<T>::get(); }
};

template<typename T>
struct TypeName<T, std::enable_if_t<detail::IsVector<T>::value &&
                                    !std::is_same_v<T, std::vector<std::byte>>>> {
    static std::string get() { return "list[" + TypeName<typename detail::IsVector<T>::value_type>::get() + "]"; }
};

template<typename T>
struct TypeName<T, std::enable_if_t<detail::IsStringMap<T>::value>> {
    static std::string get() { return "dict[str, " + TypeName<typename detail::IsStringMap<T>::mapped_type>::get() + "]"; }
};

template<typename A, typename B>
struct TypeName<std::pair<A, B>> {
    static std::string get() { return "tuple[" + TypeName<A>::get() + ", " + TypeName<B>::get() + "]"; }
};

// ============================================================================
// Handle and view templates declared in pf_object.hpp
// ============================================================================

template<typename T>
std::optional<T> Object::as() const {
    return from_py<T>(ptr_);
}

template<typename... Args>
Object Object::call(Args&&... args) const {
    if (!ptr_) {
        detail::raise_empty_handle();
        return Object();
    }
    if constexpr (sizeof...(Args) == 0) {
        return Object::owned(PyObject_CallNoArgs(ptr_));
    } else {
        auto tuple = Tuple::from_values(std::forward<Args>(args)...);
        if (!tuple) return Object();
        Object result = Object::owned(PyObject_Call(ptr_, tuple->ptr(), nullptr));
        tuple->release();
        return result;
    }
}

template<typename... Args>
Object Object::call_method(const char* name, Args&&... args) const {
    ScopedRef method(get_attr(name));
    if (!method) return Object();
    return method->call(std::forward<Args>(args)...);
}

template<typename V>
bool Object::set_attr(const char* name, V&& value) const {
    if (!ptr_) {
        detail::raise_empty_handle();
        return false;
    }
    PyObject* v = to_py(std::forward<V>(value));
    if (!v) return false;
    int rc = PyObject_SetAttrString(ptr_, name, v);
    Py_DECREF(v);
    return rc == 0;
}

template<typename V>
bool List::set(Py_ssize_t index, V&& value) const {
    PyObject* v = to_py(std::forward<V>(value));
    if (!v) return false;
    return PyList_SetItem(ptr(), index, v) == 0;
}

template<typename V>
bool List::append(V&& value) const {
    PyObject* v = to_py(std::forward<V>(value));
    if (!v) return false;
    int rc = PyList_Append(ptr(), v);
    Py_DECREF(v);
    return rc == 0;
}

template<typename V>
bool Tuple::set(Py_ssize_t index, V&& value) const {
    PyObject* v = to_py(std::forward<V>(value));
    if (!v) return false;
    return PyTuple_SetItem(ptr(), index, v) == 0;
}

template<typename... Args>
std::optional<Tuple> Tuple::from_values(Args&&... args) {
    auto tuple = create(static_cast<Py_ssize_t>(sizeof...(Args)));
    if (!tuple) return std::nullopt;
    Py_ssize_t index = 0;
    bool ok = (tuple->set(index++, std::forward<Args>(args)) && ...);
    if (!ok) {
        tuple->release();
        return std::nullopt;
    }
    return tuple;
}

template<typename K, typename V>
bool Dict::set_item(K&& key, V&& value) const {
    PyObject* k = to_py(std::forward<K>(key));
    if (!k) return false;
    PyObject* v = to_py(std::forward<V>(value));
    if (!v) {
        Py_DECREF(k);
        return false;
    }
    int rc = PyDict_SetItem(ptr(), k, v);
    Py_DECREF(k);
    Py_DECREF(v);
    return rc == 0;
}

} // namespace pyforge
