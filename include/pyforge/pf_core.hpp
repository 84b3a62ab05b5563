// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pf_core.hpp
 * @brief Core declarations shared by every pyforge layer.
 *
 * Forward declarations, the process-wide RuntimeConfig and the
 * tracing macros used by the handle, dispatch and class layers.
 */

#pragma once

#include <cstdint>
#include <cstdio>

namespace pyforge {

// Forward declarations
class Object;
class Bytes;
class List;
class Dict;
class Tuple;
class BufferView;
class ClassDescriptor;
class ModuleDescriptor;
struct MethodDescriptor;

// Runtime switches. Read on the dispatch path, so keep it trivially copyable.
struct RuntimeConfig {
    bool trace_dispatch = false;    // log every adapter entry and binding failure
    bool trace_refcounts = false;   // log handle incref/release
    bool warn_on_fallback = true;   // report "failure without pending exception"
};

// Current configuration (defaults until configure() is called)
const RuntimeConfig& runtime_config();

// Replace the process-wide configuration. Call with the host lock held.
void configure(const RuntimeConfig& config);

// Version
inline constexpr int kVersionMajor = 0;
inline constexpr int kVersionMinor = 3;
inline constexpr int kVersionPatch = 0;
inline constexpr const char* kVersionString = "0.3.0";

// Debug utilities
#ifdef PF_DEBUG
    #define PF_DEBUG_RC(fmt, ...) \
        printf("[RC] " fmt "\n", ##__VA_ARGS__)
#else
    #define PF_DEBUG_RC(fmt, ...) \
        do { \
            if (::pyforge::runtime_config().trace_refcounts) \
                std::fprintf(stderr, "[RC] " fmt "\n", ##__VA_ARGS__); \
        } while (0)
#endif

#define PF_TRACE(fmt, ...) \
    do { \
        if (::pyforge::runtime_config().trace_dispatch) \
            std::fprintf(stderr, "[pyforge] " fmt "\n", ##__VA_ARGS__); \
    } while (0)

} // namespace pyforge
