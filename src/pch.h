// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pch.h
 * @brief Precompiled header for the pyforge library sources.
 *
 * Python.h must precede every standard header, so pf_ffi.hpp comes first.
 */

#pragma once

#include "pyforge/pf_ffi.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
