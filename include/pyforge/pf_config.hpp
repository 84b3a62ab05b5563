// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_config.hpp
 * @brief Runtime configuration file (JSON) loader.
 *
 * Reads RuntimeConfig from a JSON document:
 *
 *     { "trace_dispatch": false, "trace_refcounts": false, "warn_on_fallback": true }
 *
 * Missing keys keep their defaults, unknown keys are ignored, and a key of
 * the wrong type is an error.
 */

#pragma once

#include "pf_core.hpp"

#include <filesystem>
#include <string>

namespace pyforge {

// Environment variable naming a config file
inline constexpr const char* kConfigEnvVar = "PYFORGE_CONFIG";

bool ParseRuntimeConfig(const std::string& text, RuntimeConfig& out, std::string& err);

bool LoadRuntimeConfig(const std::filesystem::path& path, RuntimeConfig& out, std::string& err);

// Load and apply the file named by PYFORGE_CONFIG. Returns true when the
// variable is unset; on failure the current configuration is unchanged.
bool ConfigureFromEnvironment(std::string& err);

} // namespace pyforge
