// =====================================================================
//  src/libfloorplan/logging.cpp — Library logging categories
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "logging.h"

namespace floorplan {

Q_LOGGING_CATEGORY(lcBuilder, "floorplan.builder", QtWarningMsg)
Q_LOGGING_CATEGORY(lcExport, "floorplan.export", QtWarningMsg)
Q_LOGGING_CATEGORY(lcStorage, "floorplan.storage", QtWarningMsg)

}  // namespace floorplan
