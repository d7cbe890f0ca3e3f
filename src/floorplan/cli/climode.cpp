// =====================================================================
//  src/floorplan/cli/climode.cpp — Command-line mode
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "climode.h"

#include <floorplan/plan/builder.h>
#include <floorplan/plan/roomgeometry.h>
#include <floorplan/plan_io.h>

#include <QFileInfo>
#include <QJsonObject>

#include <iostream>

namespace floorplan {

// ---- Input loading ---------------------------------------------------

bool CliMode::loadPlan(const QString& input, plan::FloorPlanModel* model,
                       QString* summary, QString* errorMsg)
{
    QJsonObject json;
    if (!plan_io::readJsonFile(input, &json, errorMsg)) {
        return false;
    }

    // A saved floor plan is exported as-is
    if (json.contains(QStringLiteral("elements"))) {
        if (!plan_io::modelFromJson(json, model, errorMsg)) return false;
        if (summary) {
            *summary = QStringLiteral("%1 element(s) from saved floor plan")
                           .arg(model->elements.size());
        }
        return true;
    }

    QVector<plan::SurfaceRecord> surfaces;
    if (!plan_io::surfacesFromJson(json, &surfaces, errorMsg)) {
        return false;
    }

    plan::BuildResult result = plan::buildFloorPlanChecked(surfaces);
    if (!result.success) {
        if (errorMsg) *errorMsg = result.errorMessage;
        return false;
    }

    *model = result.model;
    if (summary) *summary = plan::scanStatistics(surfaces).summary();
    return true;
}

// ---- Single-command: convert ----------------------------------------

int CliMode::runConvert(const QString& input, const QString& output,
                        const ConvertOptions& options)
{
    std::cout << "Converting: " << input.toStdString()
              << " -> " << output.toStdString() << std::endl;

    QString outputExt = QFileInfo(output).suffix().toLower();
    plan::ExportFormat format = plan::ExportFormat::SVG;
    bool toModel = (outputExt == QLatin1String("json"));

    if (!toModel && !plan::formatFromExtension(outputExt, &format)) {
        std::cerr << "Error: unsupported output format \""
                  << outputExt.toStdString() << "\"." << std::endl;
        std::cerr << "  Supported extensions: .svg, .dxf, .json" << std::endl;
        return 1;
    }

    QString errorMsg;
    QString summary;
    plan::FloorPlanModel model;
    if (!loadPlan(input, &model, &summary, &errorMsg)) {
        std::cerr << "Error reading input: "
                  << errorMsg.toStdString() << std::endl;
        return 1;
    }

    bool written = toModel
        ? plan_io::saveModel(output, model, &errorMsg)
        : plan::exportFloorPlanToFile(model, format, output,
                                      options.includeDimensions, &errorMsg,
                                      options.exportOptions);
    if (!written) {
        std::cerr << "Error writing output: "
                  << errorMsg.toStdString() << std::endl;
        return 1;
    }

    std::cout << "Done. " << summary.toStdString() << std::endl;
    return 0;
}

// ---- Single-command: info -------------------------------------------

int CliMode::runInfo(const QString& input)
{
    QString errorMsg;
    QString summary;
    plan::FloorPlanModel model;
    if (!loadPlan(input, &model, &summary, &errorMsg)) {
        std::cerr << "Error reading input: "
                  << errorMsg.toStdString() << std::endl;
        return 1;
    }

    const plan::RoomDimensions& dims = model.roomDimensions;
    std::cout << summary.toStdString() << std::endl;
    std::cout << "Walls: " << model.count(plan::ElementType::Wall)
              << "  Doors: " << model.count(plan::ElementType::Door)
              << "  Windows: " << model.count(plan::ElementType::Window)
              << "  Openings: " << model.count(plan::ElementType::Opening)
              << "  Objects: " << model.count(plan::ElementType::Object)
              << std::endl;
    std::cout << "Room: "
              << QString::number(dims.width, 'f', 2).toStdString() << " m wide, "
              << QString::number(dims.depth, 'f', 2).toStdString() << " m deep, "
              << QString::number(dims.height, 'f', 2).toStdString() << " m high"
              << std::endl;
    return 0;
}

}  // namespace floorplan
