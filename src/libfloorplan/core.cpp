// =====================================================================
//  src/libfloorplan/core.cpp -- Library version
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "floorplan/core.h"

#ifndef FLOORPLAN_VERSION
#define FLOORPLAN_VERSION "0.1.0"
#endif

namespace floorplan {

const char* version()
{
    return FLOORPLAN_VERSION;
}

}  // namespace floorplan
