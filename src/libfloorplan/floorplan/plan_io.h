// =====================================================================
//  src/libfloorplan/floorplan/plan_io.h — JSON companion format
// =====================================================================
//
//  Saves floor plan models and captured surface lists as JSON so a
//  room can be exported again later without rescanning.
//
//  Model document:
//    { "format_version": 1,
//      "elements": [ { "rect": {x, y, width, height}, "rotation",
//                      "type", "category", "label" } ],
//      "boundingBox": {x, y, width, height},
//      "roomDimensions": {width, height, depth} }
//
//  Surface document:
//    { "format_version": 1,
//      "surfaces": [ { "kind", "transform": [16, column-major],
//                      "dimensions": [x, y, z], "category" } ] }
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FLOORPLAN_PLAN_IO_H
#define FLOORPLAN_PLAN_IO_H

#include "core.h"
#include "plan/model.h"
#include "plan/surface.h"

#include <QJsonObject>
#include <QString>
#include <QVector>

namespace floorplan {
namespace plan_io {

// ---- Models ----

/// Serialize a floor plan model
FLOORPLAN_EXPORT QJsonObject modelToJson(const plan::FloorPlanModel& model);

/// Deserialize a floor plan model.
/// Returns false and sets errorMsg if non-null on malformed input;
/// model is left untouched in that case.
FLOORPLAN_EXPORT bool modelFromJson(const QJsonObject& json,
                                    plan::FloorPlanModel* model,
                                    QString* errorMsg = nullptr);

/// Write a model to a JSON file.  Returns true on success.
FLOORPLAN_EXPORT bool saveModel(const QString& path,
                                const plan::FloorPlanModel& model,
                                QString* errorMsg = nullptr);

/// Read a model from a JSON file.  Returns true on success.
FLOORPLAN_EXPORT bool loadModel(const QString& path,
                                plan::FloorPlanModel* model,
                                QString* errorMsg = nullptr);

// ---- Surfaces ----

/// Serialize a list of captured surfaces
FLOORPLAN_EXPORT QJsonObject surfacesToJson(const QVector<plan::SurfaceRecord>& surfaces);

/// Deserialize a list of captured surfaces.
/// Returns false and sets errorMsg if non-null on malformed input.
FLOORPLAN_EXPORT bool surfacesFromJson(const QJsonObject& json,
                                       QVector<plan::SurfaceRecord>* surfaces,
                                       QString* errorMsg = nullptr);

/// Write surfaces to a JSON file.  Returns true on success.
FLOORPLAN_EXPORT bool saveSurfaces(const QString& path,
                                   const QVector<plan::SurfaceRecord>& surfaces,
                                   QString* errorMsg = nullptr);

/// Read surfaces from a JSON file.  Returns true on success.
FLOORPLAN_EXPORT bool loadSurfaces(const QString& path,
                                   QVector<plan::SurfaceRecord>* surfaces,
                                   QString* errorMsg = nullptr);

// ---- Files ----

/// Read a JSON file whose top level is an object.
/// Returns true on success.
FLOORPLAN_EXPORT bool readJsonFile(const QString& path,
                                   QJsonObject* json,
                                   QString* errorMsg = nullptr);

}  // namespace plan_io
}  // namespace floorplan

#endif  // FLOORPLAN_PLAN_IO_H
