// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pyforge.hpp
 * @brief Umbrella header for extension modules.
 *
 * Usage:
 *   #include <pyforge/pyforge.hpp>
 *
 *   static int64_t add(int64_t a, int64_t b, std::optional<int64_t> c) {
 *       return a + b + c.value_or(0);
 *   }
 *
 *   static pyforge::ModuleDescriptor g_module = [] {
 *       pyforge::ModuleDescriptor m("mathx", "Native math helpers");
 *       m.def(pyforge::function<&add>("add", { .args = { "a", "b", "c" } }));
 *       return m;
 *   }();
 *
 *   PF_MODULE(mathx, g_module)
 */

#pragma once

#include "pf_core.hpp"
#include "pf_ffi.hpp"
#include "pf_errors.hpp"
#include "pf_object.hpp"
#include "pf_convert.hpp"
#include "pf_method.hpp"
#include "pf_module.hpp"
#include "pf_config.hpp"
