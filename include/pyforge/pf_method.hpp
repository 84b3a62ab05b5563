// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_method.hpp
 * @brief Method descriptors and the per-function dispatch adapter.
 *
 * function<&fn>(name, options) builds an immutable MethodDescriptor whose
 * entry point is a Binding of Dispatcher<&fn, Kind>. The adapter binds the host's
 * positional tuple and keyword dict against a static ArgSchema through
 * the shared BindArguments() routine, converts every slot, invokes the
 * native function and converts its result back.
 *
 * Trailing std::optional<T> parameters are optional: an omitted argument
 * arrives as std::nullopt. A required parameter after an optional one is
 * rejected at compile time.
 */

#pragma once

#include "pf_convert.hpp"

#include <array>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace pyforge {

// ============================================================================
// Function Traits
// ============================================================================

// Primary template
template<typename T>
struct FunctionTraits;

// Specialization for function pointers
template<typename Ret, typename... Args>
struct FunctionTraits<Ret(*)(Args...)> {
    using return_type = Ret;
    using args_tuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);
    static constexpr bool is_member = false;

    template<size_t N>
    using arg = std::tuple_element_t<N, args_tuple>;
};

// Specialization for member function pointers
template<typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret(Class::*)(Args...)> {
    using return_type = Ret;
    using class_type = Class;
    using args_tuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);
    static constexpr bool is_member = true;

    template<size_t N>
    using arg = std::tuple_element_t<N, args_tuple>;
};

// Specialization for const member function pointers
template<typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret(Class::*)(Args...) const> {
    using return_type = Ret;
    using class_type = Class;
    using args_tuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);
    static constexpr bool is_member = true;

    template<size_t N>
    using arg = std::tuple_element_t<N, args_tuple>;
};

// ============================================================================
// Descriptors
// ============================================================================

enum class MethodKind : uint8_t {
    Function,      // module level, no receiver
    Method,        // receiver = instance
    ClassMethod,   // receiver = type
    StaticMethod,  // no receiver
};

const char* method_kind_name(MethodKind kind);

struct MethodOptions {
    const char* doc = nullptr;
    std::vector<std::string> args;  // keyword names; empty = positional only
};

// Static binding schema, shared by every call of one registration
struct ArgSchema {
    std::string function;            // name used in messages
    std::vector<std::string> names;  // one per parameter when keywords is set
    size_t required = 0;             // leading required parameters
    size_t total = 0;
    bool keywords = false;

    bool operator==(const ArgSchema&) const = default;
};

struct ParamInfo {
    std::string name;
    std::string type;
    bool optional = false;
};

struct MethodDescriptor {
    using Invoke = PyObject* (*)(PyObject* self, PyObject* args, PyObject* kwargs);

    std::string name;
    std::string doc;
    MethodKind kind = MethodKind::Function;
    std::shared_ptr<const ArgSchema> schema;
    PyCFunction entry = nullptr;  // for PyMethodDef
    Invoke invoke = nullptr;      // for type slots (__init__, __call__, ...)
    int flags = 0;
    bool has_receiver = false;
    std::vector<ParamInfo> params;
    std::string return_type;
    std::string error;            // registration error, raised by create()
};

// Bind positional arguments left to right, then fill unfilled slots by
// keyword. slots must hold schema.total entries; a slot left nullptr is
// absent. Raises TypeError and returns false on any binding error.
bool BindArguments(const ArgSchema& schema, PyObject* args, PyObject* kwargs,
                   std::span<PyObject*> slots);

namespace detail {

// Payload of a class instance whose payload type is `type`. TypeError
// and nullptr when obj is not an instance of a class carrying it.
void* payload_pointer(PyObject* obj, const std::type_info& type);

template<typename T>
using Plain = std::remove_cvref_t<T>;

template<typename Tuple, size_t Offset, typename Seq>
struct DropFront;

template<typename Tuple, size_t Offset, size_t... Is>
struct DropFront<Tuple, Offset, std::index_sequence<Is...>> {
    using type = std::tuple<Plain<std::tuple_element_t<Is + Offset, Tuple>>...>;
};

template<typename... Ts>
constexpr std::array<bool, sizeof...(Ts)> optional_flags(std::tuple<Ts...>*) {
    return { IsOptional<Ts>::value... };
}

template<size_t N>
constexpr size_t count_required(const std::array<bool, N>& flags) {
    size_t n = 0;
    while (n < N && !flags[n]) ++n;
    return n;
}

template<size_t N>
constexpr bool optionals_trailing(const std::array<bool, N>& flags) {
    bool seen_optional = false;
    for (size_t i = 0; i < N; ++i) {
        if (flags[i]) seen_optional = true;
        else if (seen_optional) return false;
    }
    return true;
}

template<typename T>
struct ReturnName {
    static std::string get() { return TypeName<T>::get(); }
};

template<>
struct ReturnName<ErrorPending> {
    static std::string get() { return "NoReturn"; }
};

// Resolve a receiver parameter of a free function: the self handle itself,
// or the payload it carries.
template<typename R>
struct Receiver {
    using Value = Plain<std::remove_pointer_t<Plain<R>>>;

    static bool resolve(PyObject* self, std::optional<Object>& handle, Value*& payload) {
        if constexpr (std::is_same_v<Value, Object>) {
            handle = Object::borrowed(self);
            return true;
        } else {
            payload = static_cast<Value*>(payload_pointer(self, typeid(Value)));
            return payload != nullptr;
        }
    }

    static decltype(auto) get(std::optional<Object>& handle, Value* payload) {
        if constexpr (std::is_same_v<Value, Object>) {
            return std::move(*handle);
        } else if constexpr (std::is_pointer_v<Plain<R>>) {
            return payload;
        } else {
            return static_cast<Value&>(*payload);
        }
    }
};

} // namespace detail

// ============================================================================
// Dispatcher
// ============================================================================

template<auto Fn, MethodKind Kind>
struct Dispatcher {
    using Traits = FunctionTraits<decltype(Fn)>;
    using Ret = typename Traits::return_type;

    static constexpr bool kMember = Traits::is_member;
    static constexpr bool kReceiverParam =
        !kMember && (Kind == MethodKind::Method || Kind == MethodKind::ClassMethod);
    static constexpr size_t kOffset = kReceiverParam ? 1 : 0;

    static_assert(Traits::arity >= kOffset, "methods and classmethods take the receiver as first parameter");
    static_assert(!kMember || Kind == MethodKind::Method, "member functions bind only as instance methods");

    static constexpr size_t kArity = Traits::arity - kOffset;

    using Params = typename detail::DropFront<typename Traits::args_tuple, kOffset,
                                              std::make_index_sequence<kArity>>::type;

    static constexpr auto kOptional = detail::optional_flags(static_cast<Params*>(nullptr));
    static constexpr size_t kRequired = detail::count_required(kOptional);

    static_assert(detail::optionals_trailing(kOptional),
                  "optional parameters must follow every required parameter");

    // Shared body of every registration of Fn
    static PyObject* call(const ArgSchema& s, PyObject* self, PyObject* args, PyObject* kwargs) {
        PF_TRACE("call %s", s.function.c_str());

        std::array<PyObject*, kArity> slots{};
        if (!BindArguments(s, args, kwargs, std::span<PyObject*>(slots.data(), slots.size()))) {
            return nullptr;
        }

        try {
            return invoke(s, self, slots, std::make_index_sequence<kArity>{});
        } catch (...) {
            return raise_current_exception().sentinel();
        }
    }

private:
    template<size_t I>
    using Param = std::tuple_element_t<I, Params>;

    template<size_t I>
    static bool convert_one(const ArgSchema& s, PyObject* slot, std::optional<Param<I>>& out) {
        if (!slot) {
            if constexpr (detail::IsOptional<Param<I>>::value) {
                out.emplace();
                return true;
            } else {
                raise_fallback(s.function.c_str());
                return false;
            }
        } else {
            out = FromPy<Param<I>>::convert(slot);
            return out.has_value();
        }
    }

    template<size_t... Is>
    static PyObject* invoke(const ArgSchema& s, PyObject* self, std::array<PyObject*, kArity>& slots,
                            std::index_sequence<Is...>) {
        std::tuple<std::optional<Param<Is>>...> converted;
        // Stops at the first failed conversion (exception pending)
        if (!(convert_one<Is>(s, slots[Is], std::get<Is>(converted)) && ...)) {
            PF_TRACE("%s: argument conversion failed", s.function.c_str());
            return nullptr;
        }

        if constexpr (kMember) {
            using Class = typename Traits::class_type;
            auto* payload = static_cast<Class*>(detail::payload_pointer(self, typeid(Class)));
            if (!payload) return nullptr;
            return finish(s, [&]() -> decltype(auto) {
                return (payload->*Fn)(std::move(*std::get<Is>(converted))...);
            });
        } else if constexpr (kReceiverParam) {
            using Recv = detail::Receiver<typename Traits::template arg<0>>;
            std::optional<Object> handle;
            typename Recv::Value* payload = nullptr;
            if (!Recv::resolve(self, handle, payload)) return nullptr;
            return finish(s, [&]() -> decltype(auto) {
                return Fn(Recv::get(handle, payload), std::move(*std::get<Is>(converted))...);
            });
        } else {
            return finish(s, [&]() -> decltype(auto) {
                return Fn(std::move(*std::get<Is>(converted))...);
            });
        }
    }

    static PyObject* convert_result(const ArgSchema& s, PyObject* result) {
        if (!result) return raise_fallback(s.function.c_str()).sentinel();
        return result;
    }

    template<typename Call>
    static PyObject* finish(const ArgSchema& s, Call&& fn) {
        using R = detail::Plain<Ret>;
        if constexpr (std::is_void_v<Ret>) {
            fn();
            // A procedure that left an exception pending propagates it
            if (PyErr_Occurred()) return nullptr;
            return ffi::none_owned();
        } else if constexpr (std::is_same_v<R, ErrorPending>) {
            fn();
            return raise_fallback(s.function.c_str()).sentinel();
        } else if constexpr (IsResult<R>::value) {
            R result = fn();
            if (!result.ok()) {
                return raise_fallback(s.function.c_str()).sentinel();
            }
            if constexpr (std::is_void_v<typename IsResult<R>::value_type>) {
                return ffi::none_owned();
            } else {
                return convert_result(s, to_py(std::move(result).value()));
            }
        } else if constexpr (detail::IsOptional<R>::value) {
            R result = fn();
            if (!result) {
                if (PyErr_Occurred()) {
                    PyErr_Clear();
                    return raise(ExceptionKind::RuntimeError,
                                 "optional returns cannot signal errors; use Result<T>").sentinel();
                }
                return ffi::none_owned();
            }
            return convert_result(s, to_py(std::move(*result)));
        } else if constexpr (std::is_same_v<R, PyObject*>) {
            return convert_result(s, fn());
        } else {
            return convert_result(s, to_py(fn()));
        }
    }
};

// Names one native function can be registered under
inline constexpr size_t kMaxBindings = 8;

// Entry points of one registration. Each binding owns the schema it was
// registered with, so messages carry the name the host called.
template<auto Fn, MethodKind Kind, size_t Index>
struct Binding {
    using D = Dispatcher<Fn, Kind>;

    static inline std::shared_ptr<const ArgSchema> schema;

    static PyObject* call(PyObject* self, PyObject* args, PyObject* kwargs) {
        return D::call(*schema, self, args, kwargs);
    }

    static PyObject* call_varargs(PyObject* self, PyObject* args) {
        return D::call(*schema, self, args, nullptr);
    }

    static PyObject* call_noargs(PyObject* self, PyObject*) {
        return D::call(*schema, self, nullptr, nullptr);
    }
};

// ============================================================================
// Descriptor factories
// ============================================================================

namespace detail {

template<auto Fn, MethodKind Kind, size_t Index>
bool claim_binding(const std::shared_ptr<const ArgSchema>& schema, MethodDescriptor& desc) {
    using B = Binding<Fn, Kind, Index>;
    if (!B::schema) {
        B::schema = schema;
    } else if (!(*B::schema == *schema)) {
        return false;
    }
    desc.schema = B::schema;
    desc.invoke = &B::call;

    if (schema->keywords) {
        desc.flags = METH_VARARGS | METH_KEYWORDS;
        desc.entry = reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(&B::call));
    } else if constexpr (Dispatcher<Fn, Kind>::kArity == 0) {
        desc.flags = METH_NOARGS;
        desc.entry = reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(&B::call_noargs));
    } else {
        desc.flags = METH_VARARGS;
        desc.entry = reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(&B::call_varargs));
    }
    if constexpr (Kind == MethodKind::ClassMethod) desc.flags |= METH_CLASS;
    if constexpr (Kind == MethodKind::StaticMethod) desc.flags |= METH_STATIC;
    return true;
}

template<auto Fn, MethodKind Kind>
MethodDescriptor make_descriptor(const char* name, MethodOptions options) {
    using D = Dispatcher<Fn, Kind>;

    MethodDescriptor desc;
    desc.name = name ? name : "";
    desc.doc = options.doc ? options.doc : "";
    desc.kind = Kind;
    desc.has_receiver = Kind == MethodKind::Method || Kind == MethodKind::ClassMethod;
    desc.return_type = ReturnName<Plain<typename D::Ret>>::get();

    if (desc.name.empty()) {
        desc.error = "native function registered without a name";
    }

    auto schema = std::make_shared<ArgSchema>();
    schema->function = desc.name;
    schema->required = D::kRequired;
    schema->total = D::kArity;
    schema->keywords = !options.args.empty();
    if (schema->keywords) {
        if (options.args.size() != D::kArity) {
            desc.error = desc.name + "(): " + std::to_string(options.args.size()) +
                         " argument names given for " + std::to_string(D::kArity) + " parameters";
        }
        schema->names = std::move(options.args);
    }

    [&]<size_t... Is>(std::index_sequence<Is...>) {
        (desc.params.push_back(ParamInfo{
            schema->keywords && Is < schema->names.size() ? schema->names[Is] : "arg" + std::to_string(Is),
            TypeName<std::tuple_element_t<Is, typename D::Params>>::get(),
            D::kOptional[Is] }), ...);
    }(std::make_index_sequence<D::kArity>{});

    // Same name and arguments share a binding; anything else claims a new one
    bool bound = [&]<size_t... Bs>(std::index_sequence<Bs...>) {
        return (claim_binding<Fn, Kind, Bs>(schema, desc) || ...);
    }(std::make_index_sequence<kMaxBindings>{});
    if (!bound) {
        desc.schema = schema;
        if (desc.error.empty()) {
            desc.error = desc.name + ": native function registered under more than " +
                         std::to_string(kMaxBindings) + " names";
        }
    }

    return desc;
}

} // namespace detail

// Module-level function
template<auto Fn>
MethodDescriptor function(const char* name, MethodOptions options = {}) {
    return detail::make_descriptor<Fn, MethodKind::Function>(name, std::move(options));
}

// Instance method: a member function of the payload, or a free function
// whose first parameter is the receiver (Object, Payload& or Payload*)
template<auto Fn>
MethodDescriptor method(const char* name, MethodOptions options = {}) {
    return detail::make_descriptor<Fn, MethodKind::Method>(name, std::move(options));
}

// First parameter receives the type object
template<auto Fn>
MethodDescriptor classmethod(const char* name, MethodOptions options = {}) {
    return detail::make_descriptor<Fn, MethodKind::ClassMethod>(name, std::move(options));
}

template<auto Fn>
MethodDescriptor staticmethod(const char* name, MethodOptions options = {}) {
    return detail::make_descriptor<Fn, MethodKind::StaticMethod>(name, std::move(options));
}

} // namespace pyforge
