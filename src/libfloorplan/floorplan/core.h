// =====================================================================
//  src/libfloorplan/floorplan/core.h — Library version and export macros
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_CORE_H
#define FLOORPLAN_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libfloorplan as a shared library, FLOORPLAN_SHARED and
// FLOORPLAN_BUILDING are defined.  Consumers linking against the shared
// library only see FLOORPLAN_SHARED (set as a PUBLIC compile definition).

#if defined(FLOORPLAN_SHARED)
  #if defined(FLOORPLAN_BUILDING)
    #if defined(_WIN32)
      #define FLOORPLAN_EXPORT __declspec(dllexport)
    #else
      #define FLOORPLAN_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define FLOORPLAN_EXPORT __declspec(dllimport)
    #else
      #define FLOORPLAN_EXPORT
    #endif
  #endif
#else
  #define FLOORPLAN_EXPORT
#endif

namespace floorplan {

/// Library version string (e.g., "0.1.0").
FLOORPLAN_EXPORT const char* version();

/// Version of the JSON companion format written by plan_io.
/// Files carrying a newer version are rejected on load.
constexpr int FORMAT_VERSION = 1;

}  // namespace floorplan

#endif  // FLOORPLAN_CORE_H
