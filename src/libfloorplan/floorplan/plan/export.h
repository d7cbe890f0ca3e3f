// =====================================================================
//  src/libfloorplan/floorplan/plan/export.h — Floor plan export
// =====================================================================
//
//  Serializes a FloorPlanModel to SVG 1.1 and to AutoCAD DXF (AC1015,
//  ASCII), either as a string or straight to a file.
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_PLAN_EXPORT_H
#define FLOORPLAN_PLAN_EXPORT_H

#include "../core.h"
#include "model.h"

#include <QDateTime>
#include <QString>

namespace floorplan {
namespace plan {

// =====================================================================
//  SVG Export
// =====================================================================

/// Options for SVG export
struct SVGExportOptions {
    double scale = 100.0;              ///< SVG user units per meter
    double padding = 50.0;             ///< Margin around the plan in user units
    bool applyRotation = true;         ///< Rotate elements about their center (false = plain plan view)
    double dimensionOffset = 30.0;     ///< Distance of dimension lines from the plan edge
    double labelBaselineShift = 4.0;   ///< Downward shift of object labels from the rect center
};

/// Export floor plan to SVG string
/// @param model Floor plan to export
/// @param includeDimensions Append room width and depth annotations
/// @param options Export options
/// @return SVG document as string
FLOORPLAN_EXPORT QString floorPlanToSVG(
    const FloorPlanModel& model,
    bool includeDimensions = true,
    const SVGExportOptions& options = {});

// =====================================================================
//  DXF Export
// =====================================================================

/// Options for DXF export
struct DXFExportOptions {
    double scale = 1.0;                ///< Drawing units per meter (1.0 = meters)
    double labelHeight = 0.15;         ///< Text height of object labels
    double dimensionTextHeight = 0.2;  ///< Text height of dimension annotations
    double dimensionOffset = 0.3;      ///< Distance of dimension text from the plan edge
    bool includeOpenings = false;      ///< Emit openings on an extra OPENINGS layer
};

/// Export floor plan to DXF string
/// @param model Floor plan to export
/// @param includeDimensions Append room width and depth text
/// @param options Export options
/// @return DXF document as string
FLOORPLAN_EXPORT QString floorPlanToDXF(
    const FloorPlanModel& model,
    bool includeDimensions = true,
    const DXFExportOptions& options = {});

// =====================================================================
//  Format Dispatch
// =====================================================================

/// Supported export formats
enum class ExportFormat {
    SVG,
    DXF
};

/// Combined options for exportFloorPlan()
struct ExportOptions {
    SVGExportOptions svg;
    DXFExportOptions dxf;
};

/// File extension without dot ("svg", "dxf")
FLOORPLAN_EXPORT QString fileExtension(ExportFormat format);

/// Human-readable format name ("SVG (Vector Graphics)", "DXF (AutoCAD)")
FLOORPLAN_EXPORT QString formatDisplayName(ExportFormat format);

/// Look up a format by file extension (case-insensitive, dot optional).
/// Returns false if the extension is not supported.
FLOORPLAN_EXPORT bool formatFromExtension(const QString& extension, ExportFormat* format);

/// Export floor plan in the given format
FLOORPLAN_EXPORT QString exportFloorPlan(
    const FloorPlanModel& model,
    ExportFormat format,
    bool includeDimensions = true,
    const ExportOptions& options = {});

/// Default export file name, e.g. "FloorPlan_20260118_142530.svg"
FLOORPLAN_EXPORT QString exportFileName(ExportFormat format, const QDateTime& timestamp);

/// Export floor plan to a UTF-8 file
/// @param model Floor plan to export
/// @param format Output format
/// @param filePath Output file path
/// @param includeDimensions Append room dimension annotations
/// @param errorMsg Set on failure if non-null
/// @param options Export options
/// @return True on success
FLOORPLAN_EXPORT bool exportFloorPlanToFile(
    const FloorPlanModel& model,
    ExportFormat format,
    const QString& filePath,
    bool includeDimensions = true,
    QString* errorMsg = nullptr,
    const ExportOptions& options = {});

}  // namespace plan
}  // namespace floorplan

#endif  // FLOORPLAN_PLAN_EXPORT_H
