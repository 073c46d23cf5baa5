// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file platform.hpp
 * @brief Compiler portability helpers shared by every public redlog header.
 *
 * Macros defined here:
 *   - REDLOG_EXPORT : Marks a symbol for export from the shared library.
 */

#pragma once

/*
 * ---------------------------------------------------------------------------
 * REDLOG_EXPORT  --  Shared library symbol visibility
 * ---------------------------------------------------------------------------
 * On GCC and Clang we use the "default" visibility attribute so the linker
 * exports the symbol from the .so / .dylib. On other compilers the macro
 * expands to nothing.
 */
#if defined(__GNUC__) || defined(__clang__)
#   define REDLOG_EXPORT __attribute__((visibility("default")))
#else
#   define REDLOG_EXPORT
#endif
