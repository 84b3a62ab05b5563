// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_method.cpp
 * @brief Shared argument binding for every dispatch adapter.
 */

#include "pch.h"
#include "pyforge/pf_method.hpp"

namespace pyforge {

const char* method_kind_name(MethodKind kind) {
    switch (kind) {
        case MethodKind::Function:     return "function";
        case MethodKind::Method:       return "method";
        case MethodKind::ClassMethod:  return "classmethod";
        case MethodKind::StaticMethod: return "staticmethod";
    }
    return "function";
}

static bool RaiseArity(const ArgSchema& schema, Py_ssize_t given) {
    if (schema.required == schema.total) {
        PyErr_Format(PyExc_TypeError, "%s() expected %zu arguments, got %zd",
                     schema.function.c_str(), schema.total, given);
    } else {
        PyErr_Format(PyExc_TypeError, "%s() expected %zu to %zu arguments, got %zd",
                     schema.function.c_str(), schema.required, schema.total, given);
    }
    PF_TRACE("%s: arity mismatch (%zd given)", schema.function.c_str(), given);
    return false;
}

static bool BindKeywords(const ArgSchema& schema, PyObject* kwargs, std::span<PyObject*> slots) {
    if (!schema.keywords) {
        PyErr_Format(PyExc_TypeError, "%s() takes no keyword arguments", schema.function.c_str());
        return false;
    }

    PyObject* key = nullptr;
    PyObject* value = nullptr;
    Py_ssize_t pos = 0;
    while (PyDict_Next(kwargs, &pos, &key, &value)) {
        if (!PyUnicode_Check(key)) {
            PyErr_Format(PyExc_TypeError, "%s() keywords must be strings", schema.function.c_str());
            return false;
        }
        Py_ssize_t size = 0;
        const char* data = ffi::utf8(key, &size);
        if (!data) return false;
        std::string_view keyword(data, static_cast<size_t>(size));

        auto it = std::find(schema.names.begin(), schema.names.end(), keyword);
        if (it == schema.names.end()) {
            PF_TRACE("%s: unknown keyword '%s'", schema.function.c_str(), data);
            PyErr_Format(PyExc_TypeError, "%s() got an unexpected keyword argument '%s'",
                         schema.function.c_str(), data);
            return false;
        }

        size_t index = static_cast<size_t>(it - schema.names.begin());
        if (slots[index] != nullptr) {
            // Filled positionally: no silent override
            PF_TRACE("%s: duplicate binding for '%s'", schema.function.c_str(), data);
            PyErr_Format(PyExc_TypeError, "%s() got multiple values for argument '%s'",
                         schema.function.c_str(), data);
            return false;
        }
        slots[index] = value;
    }
    return true;
}

bool BindArguments(const ArgSchema& schema, PyObject* args, PyObject* kwargs,
                   std::span<PyObject*> slots) {
    Py_ssize_t nargs = args ? PyTuple_GET_SIZE(args) : 0;
    if (static_cast<size_t>(nargs) > schema.total) {
        return RaiseArity(schema, nargs);
    }

    for (Py_ssize_t i = 0; i < nargs; ++i) {
        slots[static_cast<size_t>(i)] = PyTuple_GET_ITEM(args, i);
    }

    if (kwargs && PyDict_GET_SIZE(kwargs) > 0) {
        if (!BindKeywords(schema, kwargs, slots)) {
            return false;
        }
    }

    for (size_t i = 0; i < schema.required; ++i) {
        if (slots[i] != nullptr) continue;
        if (!schema.keywords) {
            return RaiseArity(schema, nargs);
        }
        PF_TRACE("%s: missing '%s'", schema.function.c_str(), schema.names[i].c_str());
        PyErr_Format(PyExc_TypeError, "%s() missing required argument '%s'",
                     schema.function.c_str(), schema.names[i].c_str());
        return false;
    }
    return true;
}

} // namespace pyforge
