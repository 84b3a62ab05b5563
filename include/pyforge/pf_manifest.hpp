// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_manifest.hpp
 * @brief JSON manifest of a module's registration surface.
 *
 * Consumed by stub and documentation generators. Shape:
 *
 *     { "module": "name", "doc": "...",
 *       "functions": [ { "name", "doc", "kind", "receiver", "returns",
 *                        "keywords", "params": [ { "name", "type", "optional" } ] } ],
 *       "classes":   [ { "name", "doc", "base", "gc": { "traverse", "clear", "finalize" },
 *                        "methods": [ ... ] } ],
 *       "attributes": [ { "name", "type", "value" } ] }
 */

#pragma once

#include "pf_module.hpp"

#include <nlohmann/json.hpp>

namespace pyforge {

nlohmann::json DescribeMethod(const MethodDescriptor& method);

nlohmann::json DescribeClass(const ClassDescriptor& cls);

nlohmann::json DescribeModule(const ModuleDescriptor& module);

} // namespace pyforge
