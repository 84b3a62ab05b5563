// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_module.hpp
 * @brief Class and module descriptors, GC lifecycle and PyInit export.
 *
 * ModuleDescriptor composes MethodDescriptors, constants and
 * ClassDescriptors into a module object. ClassDescriptor builds a heap
 * type whose instances carry a __dict__, weak reference support and a
 * native Payload, and which cooperates with the cycle collector through
 * the payload's traverse/clear/finalize hooks. Dunder methods with a host
 * protocol (__len__, __getitem__, __eq__, __add__, ...) are wired to the
 * matching type slots.
 *
 * Descriptors are built once and must outlive the interpreter: types
 * and modules keep pointers into them.
 */

#pragma once

#include "pf_method.hpp"

#include <array>
#include <cstddef>
#include <deque>
#include <new>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace pyforge {

// ============================================================================
// GC support
// ============================================================================

// Handed to a payload's traverse(GcVisitor&) hook. Every handle-typed
// field the payload owns must be visited.
class GcVisitor {
public:
    GcVisitor(visitproc visit, void* arg) noexcept : visit_(visit), arg_(arg) {}

    void visit(const Object& obj) noexcept { visit(obj.ptr()); }

    void visit(PyObject* obj) noexcept {
        if (result_ == 0 && obj) {
            result_ = visit_(obj, arg_);
        }
    }

    int result() const noexcept { return result_; }

private:
    visitproc visit_;
    void* arg_;
    int result_ = 0;
};

// Payload of classes that keep no native state
struct NoPayload {};

// Type-erased payload lifecycle, filled by MakeClass<Payload>()
struct ClassHooks {
    size_t size = 0;
    size_t align = alignof(std::max_align_t);
    const std::type_info* type = nullptr;
    void (*construct)(void* payload) = nullptr;
    void (*destroy)(void* payload) = nullptr;
    void (*traverse)(void* payload, GcVisitor& visitor) = nullptr;
    void (*clear)(void* payload) = nullptr;
    void (*finalize)(void* payload) = nullptr;
};

template<typename Payload>
ClassHooks MakeHooks() {
    static_assert(std::is_default_constructible_v<Payload>, "class payload must be default constructible");

    ClassHooks hooks;
    hooks.size = sizeof(Payload);
    hooks.align = alignof(Payload);
    hooks.type = &typeid(Payload);
    hooks.construct = [](void* p) { ::new (p) Payload(); };
    hooks.destroy = [](void* p) { static_cast<Payload*>(p)->~Payload(); };

    if constexpr (requires(Payload& p, GcVisitor& v) { p.traverse(v); }) {
        hooks.traverse = [](void* p, GcVisitor& v) { static_cast<Payload*>(p)->traverse(v); };
    }
    if constexpr (requires(Payload& p) { p.clear(); }) {
        hooks.clear = [](void* p) { static_cast<Payload*>(p)->clear(); };
    }
    if constexpr (requires(Payload& p) { p.finalize(); }) {
        hooks.finalize = [](void* p) { static_cast<Payload*>(p)->finalize(); };
    }
    return hooks;
}

// ============================================================================
// Special methods
// ============================================================================

// Dunder methods reached through type slots. Comparisons follow the host's
// Py_LT..Py_GE order; binary operators come as forward, reflected and
// in-place blocks laid out in the same order.
enum class SpecialMethod : uint8_t {
    Init, Call, Repr, Str,
    Len, Hash, Bool, Int, Float, Index,
    Iter, Next, Contains, GetItem, SetItem, DelItem, GetAttr,
    Lt, Le, Eq, Ne, Gt, Ge,
    Neg, Pos, Abs, Invert,
    Add, Sub, Mul, TrueDiv, FloorDiv, Mod, MatMul, And, Or, Xor, LShift, RShift,
    RAdd, RSub, RMul, RTrueDiv, RFloorDiv, RMod, RMatMul, RAnd, ROr, RXor, RLShift, RRShift,
    IAdd, ISub, IMul, ITrueDiv, IFloorDiv, IMod, IMatMul, IAnd, IOr, IXor, ILShift, IRShift,
    Count,
};

// ============================================================================
// ClassDescriptor
// ============================================================================

class ClassDescriptor {
public:
    ClassDescriptor(std::string name, std::string doc, ClassHooks hooks);

    ClassDescriptor& def(MethodDescriptor method);

    // Allow subclassing from the host
    ClassDescriptor& base(bool subclassable = true);

    const std::string& name() const { return name_; }
    const std::string& doc() const { return doc_; }
    const ClassHooks& hooks() const { return hooks_; }
    const std::deque<MethodDescriptor>& methods() const { return methods_; }
    bool is_base() const { return base_; }
    const std::string& error() const { return error_; }

    // Build a new type object for `module` (new reference, or nullptr
    // with an exception pending).
    PyObject* create(PyObject* module, const std::string& module_name);

    // Entry point of a special method; nullptr when the class has none
    MethodDescriptor::Invoke special(SpecialMethod which) const {
        return special_[static_cast<size_t>(which)];
    }

private:
    std::string name_;
    std::string doc_;
    ClassHooks hooks_;
    bool base_ = false;
    std::string error_;

    std::deque<MethodDescriptor> methods_;
    std::vector<PyMethodDef> method_defs_;
    std::deque<std::string> qualified_names_;  // tp_name storage

    std::array<MethodDescriptor::Invoke, static_cast<size_t>(SpecialMethod::Count)> special_{};
};

template<typename Payload = NoPayload>
ClassDescriptor MakeClass(const char* name, const char* doc = nullptr) {
    return ClassDescriptor(name, doc ? doc : "", MakeHooks<Payload>());
}

// Descriptor of the native class obj is an instance of (nullptr if none)
const ClassDescriptor* FindClass(PyTypeObject* type);

// Whether obj is an instance of desc's type (or a subclass unless exact).
// Never raises.
bool CheckInstance(const ClassDescriptor& desc, const Object& obj, bool exact = false);

namespace detail {
void* payload_address(PyObject* obj);
} // namespace detail

// Typed payload of an instance; TypeError and nullptr on mismatch.
template<typename Payload>
Payload* PayloadOf(const ClassDescriptor& desc, const Object& obj) {
    if (!obj || !CheckInstance(desc, obj)) {
        PyErr_Format(PyExc_TypeError, "expected %s instance, got %s", desc.name().c_str(),
                     obj ? Py_TYPE(obj.ptr())->tp_name : "NULL");
        return nullptr;
    }
    if (*desc.hooks().type != typeid(Payload)) {
        PyErr_Format(PyExc_TypeError, "%s does not carry the requested payload type", desc.name().c_str());
        return nullptr;
    }
    return static_cast<Payload*>(detail::payload_address(obj.ptr()));
}

// ============================================================================
// ModuleDescriptor
// ============================================================================

using AttrValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

class ModuleDescriptor {
public:
    explicit ModuleDescriptor(std::string module_name, std::string module_doc = {})
        : name(std::move(module_name)), doc(std::move(module_doc)) {}

    std::string name;
    std::string doc;

    ModuleDescriptor& def(MethodDescriptor function);

    // The class descriptor is referenced, not copied
    ModuleDescriptor& add_class(ClassDescriptor& cls);

    // Module-level constant: int, float, bool, string or None (nullptr)
    template<typename V>
    ModuleDescriptor& attr(const char* attr_name, V value) {
        using T = std::decay_t<V>;
        if constexpr (std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, NoneType>) {
            attrs_.emplace_back(attr_name, std::monostate{});
        } else if constexpr (std::is_same_v<T, bool>) {
            attrs_.emplace_back(attr_name, value);
        } else if constexpr (std::is_integral_v<T>) {
            attrs_.emplace_back(attr_name, static_cast<int64_t>(value));
        } else if constexpr (std::is_floating_point_v<T>) {
            attrs_.emplace_back(attr_name, static_cast<double>(value));
        } else {
            static_assert(std::is_convertible_v<T, std::string>, "unsupported module attribute type");
            attrs_.emplace_back(attr_name, std::string(value));
        }
        return *this;
    }

    // Owned module object, or nullptr with an exception pending. Nothing
    // created along the way survives a failure.
    PyObject* create();

    const std::deque<MethodDescriptor>& functions() const { return functions_; }
    const std::vector<ClassDescriptor*>& classes() const { return classes_; }
    const std::vector<std::pair<std::string, AttrValue>>& attrs() const { return attrs_; }

private:
    std::deque<MethodDescriptor> functions_;
    std::vector<ClassDescriptor*> classes_;
    std::vector<std::pair<std::string, AttrValue>> attrs_;

    std::vector<PyMethodDef> method_defs_;
    PyModuleDef def_{};
    bool initialized_ = false;
};

// Export the module's init symbol
#define PF_MODULE(modname, descriptor) \
    PyMODINIT_FUNC PyInit_##modname(void) { return (descriptor).create(); }

} // namespace pyforge
