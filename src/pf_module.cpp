// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_module.cpp
 * @brief Heap type construction, instance lifecycle and module creation.
 */

#include "pch.h"
#include "pyforge/pf_module.hpp"

namespace pyforge {

// ============================================================================
// Instance layout
// ============================================================================

namespace {

// Fixed header of every instance; the payload follows at an aligned offset.
struct InstanceHeader {
    PyObject_HEAD
    PyObject* dict;
    PyObject* weakrefs;
    const ClassDescriptor* desc;
    bool constructed;  // payload constructed
    bool finalized;    // finalize hook has run
};

size_t PayloadOffset(const ClassHooks& hooks) {
    size_t align = hooks.align ? hooks.align : alignof(std::max_align_t);
    return (sizeof(InstanceHeader) + align - 1) / align * align;
}

InstanceHeader* Header(PyObject* self) {
    return reinterpret_cast<InstanceHeader*>(self);
}

void* PayloadPtr(PyObject* self) {
    InstanceHeader* h = Header(self);
    return reinterpret_cast<char*>(self) + PayloadOffset(h->desc->hooks());
}

PyMemberDef kInstanceMembers[] = {
    { "__dictoffset__", T_PYSSIZET, offsetof(InstanceHeader, dict), READONLY, nullptr },
    { "__weaklistoffset__", T_PYSSIZET, offsetof(InstanceHeader, weakrefs), READONLY, nullptr },
    { nullptr, 0, 0, 0, nullptr },
};

PyGetSetDef kInstanceGetSet[] = {
    { "__dict__", PyObject_GenericGetDict, PyObject_GenericSetDict, nullptr, nullptr },
    { nullptr, nullptr, nullptr, nullptr, nullptr },
};

// ============================================================================
// Class registry (Singleton)
// ============================================================================

PyObject* ForgetType(PyObject*, PyObject* ref);

PyMethodDef kForgetTypeDef = { "_pyforge_forget_type", ForgetType, METH_O, nullptr };

// Maps every live type to its descriptor. Each entry holds a weak
// reference to its type whose callback drops the entry when the type is
// freed, so a released module takes its types with it.
class ClassRegistry {
public:
    static ClassRegistry& instance() {
        static ClassRegistry instance;
        return instance;
    }

    bool add(PyTypeObject* type, const ClassDescriptor* desc) {
        if (!forget_) {
            forget_ = PyCFunction_New(&kForgetTypeDef, nullptr);
            if (!forget_) return false;
        }
        PyObject* ref = PyWeakref_NewRef(reinterpret_cast<PyObject*>(type), forget_);
        if (!ref) return false;
        types_[type] = Entry{ desc, ref };
        return true;
    }

    void forget(PyObject* ref) {
        for (auto it = types_.begin(); it != types_.end(); ++it) {
            if (it->second.ref == ref) {
                PF_TRACE("forget type %s", it->second.desc->name().c_str());
                types_.erase(it);
                Py_DECREF(ref);
                return;
            }
        }
    }

    // Walks the base chain so host subclasses resolve to their native base
    const ClassDescriptor* find(PyTypeObject* type, bool exact) const {
        for (PyTypeObject* t = type; t; t = t->tp_base) {
            auto it = types_.find(t);
            if (it != types_.end()) return it->second.desc;
            if (exact) break;
        }
        return nullptr;
    }

private:
    struct Entry {
        const ClassDescriptor* desc;
        PyObject* ref;  // weak reference to the type (owned)
    };

    ClassRegistry() = default;

    ClassRegistry(const ClassRegistry&) = delete;
    ClassRegistry& operator=(const ClassRegistry&) = delete;

    std::unordered_map<PyTypeObject*, Entry> types_;
    PyObject* forget_ = nullptr;
};

PyObject* ForgetType(PyObject*, PyObject* ref) {
    ClassRegistry::instance().forget(ref);
    Py_RETURN_NONE;
}

// ============================================================================
// Type slots
// ============================================================================

PyObject* InstanceNew(PyTypeObject* type, PyObject*, PyObject*) {
    const ClassDescriptor* desc = ClassRegistry::instance().find(type, false);
    if (!desc) {
        return raise(ExceptionKind::InternalError, "native class has no descriptor").sentinel();
    }

    // Zero-filled and tracked by the collector
    PyObject* self = type->tp_alloc(type, 0);
    if (!self) return nullptr;

    InstanceHeader* h = Header(self);
    h->desc = desc;
    try {
        desc->hooks().construct(PayloadPtr(self));
    } catch (...) {
        raise_current_exception();
        Py_DECREF(self);
        return nullptr;
    }
    h->constructed = true;
    PF_DEBUG_RC("new %s %p", desc->name().c_str(), static_cast<void*>(self));
    return self;
}

int InstanceTraverse(PyObject* self, visitproc visit, void* arg) {
    Py_VISIT(Py_TYPE(self));
    InstanceHeader* h = Header(self);
    Py_VISIT(h->dict);
    if (h->constructed && h->desc->hooks().traverse) {
        GcVisitor visitor(visit, arg);
        h->desc->hooks().traverse(PayloadPtr(self), visitor);
        return visitor.result();
    }
    return 0;
}

int InstanceClear(PyObject* self) {
    InstanceHeader* h = Header(self);
    Py_CLEAR(h->dict);
    if (h->constructed && h->desc->hooks().clear) {
        h->desc->hooks().clear(PayloadPtr(self));
    }
    return 0;
}

void InstanceFinalize(PyObject* self) {
    InstanceHeader* h = Header(self);
    if (h->finalized) return;
    h->finalized = true;
    if (!h->constructed || !h->desc->hooks().finalize) return;

    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);

    PF_TRACE("finalize %s %p", h->desc->name().c_str(), static_cast<void*>(self));
    try {
        h->desc->hooks().finalize(PayloadPtr(self));
    } catch (...) {
        raise_current_exception();
    }
    if (PyErr_Occurred()) {
        PyErr_WriteUnraisable(self);
    }

    PyErr_Restore(type, value, traceback);
}

void InstanceDealloc(PyObject* self) {
    if (PyObject_CallFinalizerFromDealloc(self) < 0) {
        return;  // resurrected
    }

    PyTypeObject* type = Py_TYPE(self);
    PyObject_GC_UnTrack(self);

    InstanceHeader* h = Header(self);
    PF_DEBUG_RC("dealloc %s %p", h->desc->name().c_str(), static_cast<void*>(self));
    if (h->weakrefs) {
        PyObject_ClearWeakRefs(self);
    }
    InstanceClear(self);
    if (h->constructed) {
        h->desc->hooks().destroy(PayloadPtr(self));
        h->constructed = false;
    }

    type->tp_free(self);
    Py_DECREF(type);
}

// ============================================================================
// Special method slots
// ============================================================================

constexpr int kBinaryOps = static_cast<int>(SpecialMethod::RAdd) - static_cast<int>(SpecialMethod::Add);

constexpr SpecialMethod Shift(SpecialMethod method, int by) {
    return static_cast<SpecialMethod>(static_cast<int>(method) + by);
}

const ClassDescriptor* NativeClass(PyObject* obj) {
    return ClassRegistry::instance().find(Py_TYPE(obj), false);
}

// Call a special method of desc on self with borrowed positional arguments
PyObject* CallSpecial(const ClassDescriptor* desc, PyObject* self, SpecialMethod which,
                      PyObject* first = nullptr, PyObject* second = nullptr) {
    MethodDescriptor::Invoke invoke = desc->special(which);
    PyObject* args = second ? PyTuple_Pack(2, first, second)
                   : first  ? PyTuple_Pack(1, first)
                            : PyTuple_New(0);
    if (!args) return nullptr;
    PyObject* result = invoke(self, args, nullptr);
    Py_DECREF(args);
    return result;
}

PyObject* CallSpecial(PyObject* self, SpecialMethod which,
                      PyObject* first = nullptr, PyObject* second = nullptr) {
    return CallSpecial(Header(self)->desc, self, which, first, second);
}

int InstanceInit(PyObject* self, PyObject* args, PyObject* kwargs) {
    const ClassDescriptor* desc = Header(self)->desc;
    MethodDescriptor::Invoke init = desc->special(SpecialMethod::Init);
    if (!init) {
        if ((args && PyTuple_GET_SIZE(args) > 0) || (kwargs && PyDict_GET_SIZE(kwargs) > 0)) {
            PyErr_Format(PyExc_TypeError, "%s() takes no arguments", desc->name().c_str());
            return -1;
        }
        return 0;
    }
    PyObject* result = init(self, args, kwargs);
    if (!result) return -1;
    Py_DECREF(result);
    return 0;
}

PyObject* InstanceCall(PyObject* self, PyObject* args, PyObject* kwargs) {
    return Header(self)->desc->special(SpecialMethod::Call)(self, args, kwargs);
}

PyObject* CallText(PyObject* self, SpecialMethod which) {
    PyObject* result = CallSpecial(self, which);
    if (result && !PyUnicode_Check(result)) {
        PyErr_Format(PyExc_TypeError, "__repr__/__str__ returned non-string (type %s)",
                     Py_TYPE(result)->tp_name);
        Py_DECREF(result);
        return nullptr;
    }
    return result;
}

PyObject* InstanceRepr(PyObject* self) {
    return CallText(self, SpecialMethod::Repr);
}

PyObject* InstanceStr(PyObject* self) {
    return CallText(self, SpecialMethod::Str);
}

Py_ssize_t InstanceLen(PyObject* self) {
    PyObject* result = CallSpecial(self, SpecialMethod::Len);
    if (!result) return -1;
    Py_ssize_t n = PyNumber_AsSsize_t(result, PyExc_OverflowError);
    Py_DECREF(result);
    if (n == -1 && PyErr_Occurred()) return -1;
    if (n < 0) {
        PyErr_SetString(PyExc_ValueError, "__len__() should return >= 0");
        return -1;
    }
    return n;
}

Py_hash_t InstanceHash(PyObject* self) {
    PyObject* result = CallSpecial(self, SpecialMethod::Hash);
    if (!result) return -1;
    if (!PyLong_Check(result)) {
        Py_DECREF(result);
        PyErr_SetString(PyExc_TypeError, "__hash__ method should return an integer");
        return -1;
    }
    // Reduces out-of-range values and maps -1 to -2
    Py_hash_t hash = PyObject_Hash(result);
    Py_DECREF(result);
    return hash;
}

int InstanceBool(PyObject* self) {
    PyObject* result = CallSpecial(self, SpecialMethod::Bool);
    if (!result) return -1;
    if (!PyBool_Check(result)) {
        PyErr_Format(PyExc_TypeError, "__bool__ should return bool, returned %s", Py_TYPE(result)->tp_name);
        Py_DECREF(result);
        return -1;
    }
    int truth = result == Py_True;
    Py_DECREF(result);
    return truth;
}

int InstanceContains(PyObject* self, PyObject* item) {
    PyObject* result = CallSpecial(self, SpecialMethod::Contains, item);
    if (!result) return -1;
    int truth = PyObject_IsTrue(result);
    Py_DECREF(result);
    return truth;
}

PyObject* InstanceGetItem(PyObject* self, PyObject* key) {
    return CallSpecial(self, SpecialMethod::GetItem, key);
}

// value == nullptr is deletion
int InstanceAssignItem(PyObject* self, PyObject* key, PyObject* value) {
    const ClassDescriptor* desc = Header(self)->desc;
    SpecialMethod which = value ? SpecialMethod::SetItem : SpecialMethod::DelItem;
    if (!desc->special(which)) {
        PyErr_Format(PyExc_TypeError, "'%s' object does not support item %s",
                     Py_TYPE(self)->tp_name, value ? "assignment" : "deletion");
        return -1;
    }
    PyObject* result = CallSpecial(desc, self, which, key, value);
    if (!result) return -1;
    Py_DECREF(result);
    return 0;
}

// __getattr__ runs only when normal lookup raises AttributeError
PyObject* InstanceGetAttr(PyObject* self, PyObject* name) {
    PyObject* found = PyObject_GenericGetAttr(self, name);
    if (found || !PyErr_ExceptionMatches(PyExc_AttributeError)) return found;
    PyErr_Clear();
    return CallSpecial(self, SpecialMethod::GetAttr, name);
}

PyObject* InstanceRichCompare(PyObject* self, PyObject* other, int op) {
    SpecialMethod which = Shift(SpecialMethod::Lt, op);
    if (!Header(self)->desc->special(which)) {
        Py_RETURN_NOTIMPLEMENTED;
    }
    return CallSpecial(self, which, other);
}

template<SpecialMethod Which>
PyObject* UnarySlot(PyObject* self) {
    return CallSpecial(self, Which);
}

// Shared by both operand types: the left operand's forward method first,
// then the right operand's reflected one when the types differ.
template<SpecialMethod Forward>
PyObject* BinarySlot(PyObject* lhs, PyObject* rhs) {
    constexpr SpecialMethod kReflected = Shift(Forward, kBinaryOps);

    const ClassDescriptor* left = NativeClass(lhs);
    if (left && left->special(Forward)) {
        PyObject* result = CallSpecial(left, lhs, Forward, rhs);
        if (result != Py_NotImplemented) return result;
        Py_DECREF(result);
    }
    if (Py_TYPE(lhs) == Py_TYPE(rhs)) {
        Py_RETURN_NOTIMPLEMENTED;
    }
    const ClassDescriptor* right = NativeClass(rhs);
    if (right && right->special(kReflected)) {
        return CallSpecial(right, rhs, kReflected, lhs);
    }
    Py_RETURN_NOTIMPLEMENTED;
}

template<SpecialMethod InPlace>
PyObject* InPlaceSlot(PyObject* self, PyObject* other) {
    return CallSpecial(self, InPlace, other);
}

struct SpecialEntry {
    const char* name;
    SpecialMethod method;
    int slot;        // 0: tp_init, always installed
    void* function;
};

template<typename Fn>
void* SlotFn(Fn* fn) {
    return reinterpret_cast<void*>(fn);
}

#define PF_BINARY(fwd, ref, inplace, op, nb, nb_inplace)                                   \
    { fwd, SpecialMethod::op, nb, SlotFn(&BinarySlot<SpecialMethod::op>) },                \
    { ref, SpecialMethod::R##op, nb, SlotFn(&BinarySlot<SpecialMethod::op>) },             \
    { inplace, SpecialMethod::I##op, nb_inplace, SlotFn(&InPlaceSlot<SpecialMethod::I##op>) }

const SpecialEntry kSpecialMethods[] = {
    { "__init__", SpecialMethod::Init, 0, nullptr },
    { "__call__", SpecialMethod::Call, Py_tp_call, SlotFn(&InstanceCall) },
    { "__repr__", SpecialMethod::Repr, Py_tp_repr, SlotFn(&InstanceRepr) },
    { "__str__", SpecialMethod::Str, Py_tp_str, SlotFn(&InstanceStr) },
    { "__len__", SpecialMethod::Len, Py_mp_length, SlotFn(&InstanceLen) },
    { "__hash__", SpecialMethod::Hash, Py_tp_hash, SlotFn(&InstanceHash) },
    { "__bool__", SpecialMethod::Bool, Py_nb_bool, SlotFn(&InstanceBool) },
    { "__int__", SpecialMethod::Int, Py_nb_int, SlotFn(&UnarySlot<SpecialMethod::Int>) },
    { "__float__", SpecialMethod::Float, Py_nb_float, SlotFn(&UnarySlot<SpecialMethod::Float>) },
    { "__index__", SpecialMethod::Index, Py_nb_index, SlotFn(&UnarySlot<SpecialMethod::Index>) },
    { "__iter__", SpecialMethod::Iter, Py_tp_iter, SlotFn(&UnarySlot<SpecialMethod::Iter>) },
    { "__next__", SpecialMethod::Next, Py_tp_iternext, SlotFn(&UnarySlot<SpecialMethod::Next>) },
    { "__contains__", SpecialMethod::Contains, Py_sq_contains, SlotFn(&InstanceContains) },
    { "__getitem__", SpecialMethod::GetItem, Py_mp_subscript, SlotFn(&InstanceGetItem) },
    { "__setitem__", SpecialMethod::SetItem, Py_mp_ass_subscript, SlotFn(&InstanceAssignItem) },
    { "__delitem__", SpecialMethod::DelItem, Py_mp_ass_subscript, SlotFn(&InstanceAssignItem) },
    { "__getattr__", SpecialMethod::GetAttr, Py_tp_getattro, SlotFn(&InstanceGetAttr) },
    { "__lt__", SpecialMethod::Lt, Py_tp_richcompare, SlotFn(&InstanceRichCompare) },
    { "__le__", SpecialMethod::Le, Py_tp_richcompare, SlotFn(&InstanceRichCompare) },
    { "__eq__", SpecialMethod::Eq, Py_tp_richcompare, SlotFn(&InstanceRichCompare) },
    { "__ne__", SpecialMethod::Ne, Py_tp_richcompare, SlotFn(&InstanceRichCompare) },
    { "__gt__", SpecialMethod::Gt, Py_tp_richcompare, SlotFn(&InstanceRichCompare) },
    { "__ge__", SpecialMethod::Ge, Py_tp_richcompare, SlotFn(&InstanceRichCompare) },
    { "__neg__", SpecialMethod::Neg, Py_nb_negative, SlotFn(&UnarySlot<SpecialMethod::Neg>) },
    { "__pos__", SpecialMethod::Pos, Py_nb_positive, SlotFn(&UnarySlot<SpecialMethod::Pos>) },
    { "__abs__", SpecialMethod::Abs, Py_nb_absolute, SlotFn(&UnarySlot<SpecialMethod::Abs>) },
    { "__invert__", SpecialMethod::Invert, Py_nb_invert, SlotFn(&UnarySlot<SpecialMethod::Invert>) },
    PF_BINARY("__add__", "__radd__", "__iadd__", Add, Py_nb_add, Py_nb_inplace_add),
    PF_BINARY("__sub__", "__rsub__", "__isub__", Sub, Py_nb_subtract, Py_nb_inplace_subtract),
    PF_BINARY("__mul__", "__rmul__", "__imul__", Mul, Py_nb_multiply, Py_nb_inplace_multiply),
    PF_BINARY("__truediv__", "__rtruediv__", "__itruediv__", TrueDiv, Py_nb_true_divide, Py_nb_inplace_true_divide),
    PF_BINARY("__floordiv__", "__rfloordiv__", "__ifloordiv__", FloorDiv, Py_nb_floor_divide, Py_nb_inplace_floor_divide),
    PF_BINARY("__mod__", "__rmod__", "__imod__", Mod, Py_nb_remainder, Py_nb_inplace_remainder),
    PF_BINARY("__matmul__", "__rmatmul__", "__imatmul__", MatMul, Py_nb_matrix_multiply, Py_nb_inplace_matrix_multiply),
    PF_BINARY("__and__", "__rand__", "__iand__", And, Py_nb_and, Py_nb_inplace_and),
    PF_BINARY("__or__", "__ror__", "__ior__", Or, Py_nb_or, Py_nb_inplace_or),
    PF_BINARY("__xor__", "__rxor__", "__ixor__", Xor, Py_nb_xor, Py_nb_inplace_xor),
    PF_BINARY("__lshift__", "__rlshift__", "__ilshift__", LShift, Py_nb_lshift, Py_nb_inplace_lshift),
    PF_BINARY("__rshift__", "__rrshift__", "__irshift__", RShift, Py_nb_rshift, Py_nb_inplace_rshift),
};

#undef PF_BINARY

// Dunders the host looks up as ordinary methods on the type
const char* const kPlainDunders[] = {
    "__enter__", "__exit__", "__format__", "__reduce__", "__reduce_ex__",
    "__getstate__", "__setstate__", "__copy__", "__deepcopy__", "__sizeof__",
    "__dir__", "__round__", "__trunc__", "__floor__", "__ceil__",
    "__reversed__", "__length_hint__", "__fspath__", "__getnewargs__", "__getnewargs_ex__",
};

const SpecialEntry* FindSpecial(std::string_view name) {
    for (const SpecialEntry& entry : kSpecialMethods) {
        if (name == entry.name) return &entry;
    }
    return nullptr;
}

bool IsDunder(std::string_view name) {
    return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

bool IsPlainDunder(std::string_view name) {
    for (const char* plain : kPlainDunders) {
        if (name == plain) return true;
    }
    return false;
}

} // namespace

namespace detail {

void* payload_address(PyObject* obj) {
    return PayloadPtr(obj);
}

void* payload_pointer(PyObject* obj, const std::type_info& type) {
    const ClassDescriptor* desc = ClassRegistry::instance().find(Py_TYPE(obj), false);
    if (!desc) {
        PyErr_Format(PyExc_TypeError, "expected a native class instance, got %s", Py_TYPE(obj)->tp_name);
        return nullptr;
    }
    if (*desc->hooks().type != type) {
        PyErr_Format(PyExc_TypeError, "%s instance does not carry the expected payload", desc->name().c_str());
        return nullptr;
    }
    return PayloadPtr(obj);
}

} // namespace detail

const ClassDescriptor* FindClass(PyTypeObject* type) {
    return ClassRegistry::instance().find(type, false);
}

bool CheckInstance(const ClassDescriptor& desc, const Object& obj, bool exact) {
    if (!obj) return false;
    return ClassRegistry::instance().find(Py_TYPE(obj.ptr()), exact) == &desc;
}

// ============================================================================
// ClassDescriptor
// ============================================================================

ClassDescriptor::ClassDescriptor(std::string name, std::string doc, ClassHooks hooks)
    : name_(std::move(name))
    , doc_(std::move(doc))
    , hooks_(hooks) {}

ClassDescriptor& ClassDescriptor::def(MethodDescriptor method) {
    if (!method.error.empty() && error_.empty()) {
        error_ = method.error;
    }
    if (method.kind == MethodKind::Function && error_.empty()) {
        error_ = name_ + "." + method.name + ": module functions cannot be class members; use method()";
    }

    const std::string& n = method.name;
    if (IsDunder(n)) {
        if (const SpecialEntry* entry = FindSpecial(n)) {
            if (method.kind != MethodKind::Method) {
                if (error_.empty()) error_ = name_ + "." + n + " must be an instance method";
            } else {
                special_[static_cast<size_t>(entry->method)] = method.invoke;
            }
        } else if (!IsPlainDunder(n) && error_.empty()) {
            error_ = name_ + "." + n + " is not a supported special method";
        }
    }

    methods_.push_back(std::move(method));
    return *this;
}

ClassDescriptor& ClassDescriptor::base(bool subclassable) {
    base_ = subclassable;
    return *this;
}

PyObject* ClassDescriptor::create(PyObject* module, const std::string& module_name) {
    if (!error_.empty()) {
        return raise(ExceptionKind::InternalError, error_).sentinel();
    }

    try {
        // Built once: every type created from this descriptor points into it.
        // Special methods are reached through type slots only.
        if (method_defs_.empty()) {
            for (const auto& m : methods_) {
                if (FindSpecial(m.name)) continue;
                method_defs_.push_back({ m.name.c_str(), m.entry, m.flags, m.doc.empty() ? nullptr : m.doc.c_str() });
            }
            method_defs_.push_back({ nullptr, nullptr, 0, nullptr });
        }

        std::vector<PyType_Slot> slots = {
            { Py_tp_new, SlotFn(&InstanceNew) },
            { Py_tp_init, SlotFn(&InstanceInit) },
            { Py_tp_dealloc, SlotFn(&InstanceDealloc) },
            { Py_tp_traverse, SlotFn(&InstanceTraverse) },
            { Py_tp_clear, SlotFn(&InstanceClear) },
            { Py_tp_finalize, SlotFn(&InstanceFinalize) },
            { Py_tp_free, SlotFn(&PyObject_GC_Del) },
            { Py_tp_members, kInstanceMembers },
            { Py_tp_getset, kInstanceGetSet },
            { Py_tp_methods, method_defs_.data() },
        };
        if (!doc_.empty()) slots.push_back({ Py_tp_doc, const_cast<char*>(doc_.c_str()) });

        // Several special methods share one slot (comparisons, forward and
        // reflected operators, item assignment and deletion)
        for (const SpecialEntry& entry : kSpecialMethods) {
            if (entry.slot == 0 || !special(entry.method)) continue;
            bool present = std::any_of(slots.begin(), slots.end(),
                                       [&](const PyType_Slot& s) { return s.slot == entry.slot; });
            if (!present) slots.push_back({ entry.slot, entry.function });
        }
        slots.push_back({ 0, nullptr });

        // tp_name points into this storage for the lifetime of the type
        qualified_names_.push_back(module_name + "." + name_);

        unsigned int flags = Py_TPFLAGS_DEFAULT | Py_TPFLAGS_HAVE_GC;
        if (base_) flags |= Py_TPFLAGS_BASETYPE;

        PyType_Spec spec = {
            qualified_names_.back().c_str(),
            static_cast<int>(PayloadOffset(hooks_) + hooks_.size),
            0,
            flags,
            slots.data(),
        };

        ScopedRef type(Object::owned(PyType_FromModuleAndSpec(module, &spec, nullptr)));
        if (!type) return nullptr;

        if (!ClassRegistry::instance().add(reinterpret_cast<PyTypeObject*>(type.ptr()), this)) {
            return nullptr;
        }
        PF_TRACE("created type %s", qualified_names_.back().c_str());
        return type.take().steal();
    } catch (...) {
        return raise_current_exception().sentinel();
    }
}

// ============================================================================
// ModuleDescriptor
// ============================================================================

ModuleDescriptor& ModuleDescriptor::def(MethodDescriptor fn) {
    functions_.push_back(std::move(fn));
    return *this;
}

ModuleDescriptor& ModuleDescriptor::add_class(ClassDescriptor& cls) {
    classes_.push_back(&cls);
    return *this;
}

static PyObject* AttrToPy(const AttrValue& value) {
    return std::visit([](const auto& v) -> PyObject* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return ffi::none_owned();
        } else {
            return to_py(v);
        }
    }, value);
}

PyObject* ModuleDescriptor::create() {
    for (const auto& fn : functions_) {
        if (!fn.error.empty()) {
            return raise(ExceptionKind::InternalError, fn.error).sentinel();
        }
        if (fn.kind != MethodKind::Function) {
            return raise(ExceptionKind::InternalError,
                         name + "." + fn.name + ": only module functions can be defined on a module").sentinel();
        }
    }

    // Runs inside PyInit_<name>: no C++ exception may leave it
    try {
        if (!initialized_) {
            method_defs_.clear();
            for (const auto& fn : functions_) {
                method_defs_.push_back({ fn.name.c_str(), fn.entry, fn.flags, fn.doc.empty() ? nullptr : fn.doc.c_str() });
            }
            method_defs_.push_back({ nullptr, nullptr, 0, nullptr });

            def_ = {
                PyModuleDef_HEAD_INIT,
                name.c_str(),
                doc.empty() ? nullptr : doc.c_str(),
                -1,
                method_defs_.data(),
                nullptr,
                nullptr,
                nullptr,
                nullptr,
            };
            initialized_ = true;
        }

        ScopedRef module(Object::owned(PyModule_Create(&def_)));
        if (!module) return nullptr;

        for (const auto& [key, value] : attrs_) {
            ScopedRef obj(Object::owned(AttrToPy(value)));
            if (!obj) return nullptr;
            if (PyModule_AddObjectRef(module.ptr(), key.c_str(), obj.ptr()) < 0) {
                return nullptr;
            }
        }

        for (ClassDescriptor* cls : classes_) {
            ScopedRef type(Object::owned(cls->create(module.ptr(), name)));
            if (!type) return nullptr;
            if (PyModule_AddObjectRef(module.ptr(), cls->name().c_str(), type.ptr()) < 0) {
                return nullptr;
            }
        }

        PF_TRACE("created module %s (%zu functions, %zu classes)", name.c_str(), functions_.size(), classes_.size());
        return module.take().steal();
    } catch (...) {
        return raise_current_exception().sentinel();
    }
}

} // namespace pyforge
