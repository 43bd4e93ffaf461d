#pragma once

/**
 * @file export.h
 * @brief DLL export/import macros for the Cascade library
 *
 * NOTE: With WINDOWS_EXPORT_ALL_SYMBOLS, CMake auto-generates exports.
 *       CASCADE_API is kept as an empty macro so headers stay annotated.
 */

#define CASCADE_API

// For classes that should not be exported (internal use only)
#define CASCADE_INTERNAL
