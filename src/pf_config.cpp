// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_config.cpp
 * @brief Process-wide RuntimeConfig and its JSON loader.
 */

#include "pch.h"
#include "pyforge/pf_config.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>

namespace pyforge {

using json = nlohmann::json;

static RuntimeConfig g_config;

const RuntimeConfig& runtime_config() {
    return g_config;
}

void configure(const RuntimeConfig& config) {
    g_config = config;
}

static bool ReadAllText(const std::filesystem::path& p, std::string& out, std::string& err) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) { err = "cannot open: " + p.string(); return false; }
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return true;
}

static bool ReadFlag(const json& doc, const char* key, bool& out, std::string& err) {
    auto it = doc.find(key);
    if (it == doc.end()) return true;
    if (!it->is_boolean()) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool ParseRuntimeConfig(const std::string& text, RuntimeConfig& out, std::string& err) {
    json doc;
    try {
        doc = json::parse(text);
    }
    catch (const json::parse_error& e) {
        err = std::string("invalid config: ") + e.what();
        return false;
    }

    if (!doc.is_object()) {
        err = "invalid config: expected a JSON object";
        return false;
    }

    RuntimeConfig config = out;
    if (!ReadFlag(doc, "trace_dispatch", config.trace_dispatch, err)) return false;
    if (!ReadFlag(doc, "trace_refcounts", config.trace_refcounts, err)) return false;
    if (!ReadFlag(doc, "warn_on_fallback", config.warn_on_fallback, err)) return false;

    out = config;
    return true;
}

bool LoadRuntimeConfig(const std::filesystem::path& path, RuntimeConfig& out, std::string& err) {
    std::string text;
    if (!ReadAllText(path, text, err)) return false;
    if (!ParseRuntimeConfig(text, out, err)) {
        err = path.string() + ": " + err;
        return false;
    }
    return true;
}

bool ConfigureFromEnvironment(std::string& err) {
    const char* path = std::getenv(kConfigEnvVar);
    if (path == nullptr || *path == '\0') return true;

    RuntimeConfig config = runtime_config();
    if (!LoadRuntimeConfig(path, config, err)) {
        return false;
    }
    configure(config);
    return true;
}

} // namespace pyforge
