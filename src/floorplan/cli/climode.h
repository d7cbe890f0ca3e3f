// =====================================================================
//  src/floorplan/cli/climode.h — Command-line mode
// =====================================================================
//
//  Headless operations on saved scans: convert a surface list or a
//  saved floor plan to SVG, DXF or the JSON model format, and print a
//  summary of a scan.  Uses libfloorplan directly.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_CLIMODE_H
#define FLOORPLAN_CLIMODE_H

#include <floorplan/plan/export.h>
#include <floorplan/plan/model.h>

#include <QString>

namespace floorplan {

/// Settings for runConvert(), filled from command-line flags
struct ConvertOptions {
    bool includeDimensions = true;
    plan::ExportOptions exportOptions;
};

class CliMode {
public:
    /// Convert a surface list or saved floor plan to the format named by
    /// the output file's extension (.svg, .dxf or .json).
    /// Returns 0 on success, 1 on failure.
    int runConvert(const QString& input, const QString& output,
                   const ConvertOptions& options = {});

    /// Print element counts, floor area and room dimensions of an input.
    /// Returns 0 on success, 1 on failure.
    int runInfo(const QString& input);

private:
    /// Load either input kind into a floor plan model.  Surface lists are
    /// built with validation, so malformed geometry is reported here.
    bool loadPlan(const QString& input, plan::FloorPlanModel* model,
                  QString* summary, QString* errorMsg);
};

}  // namespace floorplan

#endif  // FLOORPLAN_CLIMODE_H
