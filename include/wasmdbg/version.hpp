//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
/**
 * @file version.hpp
 * @brief Centralized version information for wasmdbg.
 *
 * Update version numbers HERE ONLY when releasing new versions.
 */
#pragma once

#define WASMDBG_VERSION_MAJOR 0
#define WASMDBG_VERSION_MINOR 2
#define WASMDBG_VERSION_PATCH 0

#define WASMDBG_VERSION_STRING "0.2.0"
#define WASMDBG_VERSION_FULL "wasmdbg 0.2.0"
