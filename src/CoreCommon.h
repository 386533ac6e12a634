/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Common utilities and debugging macros for AsyncFile Core
 *
 * Debug assertions and small helpers shared by every module of the library.
 */

#include <cassert>
#include <optional>
#include <string>
#include <cstdlib>

#ifdef AsyncFileDebug
#undef NDEBUG
#define AFILE_ASSERT(condition, message) assert(condition)
#else
#define AFILE_ASSERT(condition, message) ((void)0)
#endif

namespace AsyncFile {
namespace Core {
    // Copies an environment variable into a std::string.
    // Returns std::nullopt if the variable is not set or the name is empty.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name || !*name) return std::nullopt;
#if defined(_WIN32)
        size_t required = 0;
        errno_t err = getenv_s(&required, nullptr, 0, name);
        if (err != 0 || required == 0) return std::nullopt;
        std::string value;
        value.resize(required);
        size_t read = 0;
        err = getenv_s(&read, value.data(), value.size(), name);
        if (err != 0 || read == 0) return std::nullopt;
        if (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
#else
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
#endif
    }
} // namespace Core
} // namespace AsyncFile
