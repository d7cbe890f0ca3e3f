// =====================================================================
//  src/libfloorplan/logging.h — Library logging categories
// =====================================================================
//
//  Private to libfloorplan.  Output is filtered with QT_LOGGING_RULES,
//  e.g. QT_LOGGING_RULES="floorplan.*.debug=true".
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_LOGGING_H
#define FLOORPLAN_LOGGING_H

#include <QLoggingCategory>

namespace floorplan {

Q_DECLARE_LOGGING_CATEGORY(lcBuilder)
Q_DECLARE_LOGGING_CATEGORY(lcExport)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)

}  // namespace floorplan

#endif  // FLOORPLAN_LOGGING_H
