// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_manifest.cpp
 * @brief DescribeModule() and friends.
 */

#include "pch.h"
#include "pyforge/pf_manifest.hpp"

namespace pyforge {

using json = nlohmann::json;

static const char* ReceiverName(MethodKind kind) {
    switch (kind) {
        case MethodKind::Method:      return "instance";
        case MethodKind::ClassMethod: return "type";
        default:                      return "none";
    }
}

json DescribeMethod(const MethodDescriptor& method) {
    json params = json::array();
    for (const auto& p : method.params) {
        params.push_back({
            { "name", p.name },
            { "type", p.type },
            { "optional", p.optional },
        });
    }

    json j;
    j["name"] = method.name;
    j["doc"] = method.doc;
    j["kind"] = method_kind_name(method.kind);
    j["receiver"] = ReceiverName(method.kind);
    j["returns"] = method.return_type;
    j["keywords"] = method.schema ? method.schema->keywords : false;
    j["params"] = params;
    return j;
}

json DescribeClass(const ClassDescriptor& cls) {
    json methods = json::array();
    for (const auto& m : cls.methods()) {
        methods.push_back(DescribeMethod(m));
    }

    const ClassHooks& hooks = cls.hooks();
    json j;
    j["name"] = cls.name();
    j["doc"] = cls.doc();
    j["base"] = cls.is_base();
    j["gc"] = {
        { "traverse", hooks.traverse != nullptr },
        { "clear", hooks.clear != nullptr },
        { "finalize", hooks.finalize != nullptr },
    };
    j["methods"] = methods;
    return j;
}

static json AttributeEntry(const std::string& name, const AttrValue& value) {
    json j;
    j["name"] = name;
    std::visit([&j](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            j["type"] = "None";
            j["value"] = nullptr;
        } else if constexpr (std::is_same_v<T, bool>) {
            j["type"] = "bool";
            j["value"] = v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            j["type"] = "int";
            j["value"] = v;
        } else if constexpr (std::is_same_v<T, double>) {
            j["type"] = "float";
            j["value"] = v;
        } else {
            j["type"] = "str";
            j["value"] = v;
        }
    }, value);
    return j;
}

json DescribeModule(const ModuleDescriptor& module) {
    json functions = json::array();
    for (const auto& fn : module.functions()) {
        functions.push_back(DescribeMethod(fn));
    }

    json classes = json::array();
    for (const ClassDescriptor* cls : module.classes()) {
        classes.push_back(DescribeClass(*cls));
    }

    json attributes = json::array();
    for (const auto& [name, value] : module.attrs()) {
        attributes.push_back(AttributeEntry(name, value));
    }

    json j;
    j["module"] = module.name;
    j["doc"] = module.doc;
    j["functions"] = functions;
    j["classes"] = classes;
    j["attributes"] = attributes;
    return j;
}

} // namespace pyforge
