// =====================================================================
//  src/libfloorplan/plan_io.cpp — JSON companion format
// =====================================================================
//
//  Part of libfloorplan.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "floorplan/plan_io.h"

#include "logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace floorplan {
namespace plan_io {

using plan::ElementKind;
using plan::ElementType;
using plan::FloorPlanElement;
using plan::FloorPlanModel;
using plan::SurfaceKind;
using plan::SurfaceRecord;

namespace {

// ---- Small value helpers ----

QJsonObject rectToJson(const QRectF& rect)
{
    QJsonObject obj;
    obj[QStringLiteral("x")] = rect.x();
    obj[QStringLiteral("y")] = rect.y();
    obj[QStringLiteral("width")] = rect.width();
    obj[QStringLiteral("height")] = rect.height();
    return obj;
}

QRectF rectFromJson(const QJsonObject& json)
{
    return QRectF(json[QStringLiteral("x")].toDouble(0.0),
                  json[QStringLiteral("y")].toDouble(0.0),
                  json[QStringLiteral("width")].toDouble(0.0),
                  json[QStringLiteral("height")].toDouble(0.0));
}

QJsonArray vectorToJson(const geometry::Vector3& v)
{
    return QJsonArray{v.x, v.y, v.z};
}

bool checkFormatVersion(const QJsonObject& json, QString* errorMsg)
{
    int version = json[QStringLiteral("format_version")].toInt(FORMAT_VERSION);
    if (version > FORMAT_VERSION) {
        if (errorMsg) {
            *errorMsg = QStringLiteral("File was written by a newer version (format %1, "
                                       "this version supports %2)")
                            .arg(version).arg(FORMAT_VERSION);
        }
        return false;
    }
    return true;
}

bool writeJsonFile(const QString& path, const QJsonObject& json, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to save %1: %2").arg(path, file.errorString());
        qCWarning(lcStorage) << "Cannot write" << path << file.errorString();
        return false;
    }

    QByteArray data = QJsonDocument(json).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to save %1: %2").arg(path, file.errorString());
        qCWarning(lcStorage) << "Short write to" << path << file.errorString();
        return false;
    }
    if (!file.flush()) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to save %1: %2").arg(path, file.errorString());
        qCWarning(lcStorage) << "Flush failed for" << path << file.errorString();
        return false;
    }
    return true;
}

}  // anonymous namespace

// =====================================================================
//  Models
// =====================================================================

QJsonObject modelToJson(const FloorPlanModel& model)
{
    QJsonObject obj;
    obj[QStringLiteral("format_version")] = FORMAT_VERSION;

    QJsonArray elements;
    for (const FloorPlanElement& element : model.elements) {
        QJsonObject el;
        el[QStringLiteral("rect")] = rectToJson(element.rect);
        el[QStringLiteral("rotation")] = element.rotation;
        el[QStringLiteral("type")] = plan::elementTypeName(element.kind.type());
        if (element.kind.isObject()) {
            el[QStringLiteral("category")] = plan::categoryName(element.kind.category());
        }
        if (element.label) {
            el[QStringLiteral("label")] = *element.label;
        }
        elements.append(el);
    }
    obj[QStringLiteral("elements")] = elements;

    obj[QStringLiteral("boundingBox")] = rectToJson(model.boundingBox);

    QJsonObject dims;
    dims[QStringLiteral("width")] = model.roomDimensions.width;
    dims[QStringLiteral("height")] = model.roomDimensions.height;
    dims[QStringLiteral("depth")] = model.roomDimensions.depth;
    obj[QStringLiteral("roomDimensions")] = dims;

    return obj;
}

bool modelFromJson(const QJsonObject& json, FloorPlanModel* model, QString* errorMsg)
{
    if (!checkFormatVersion(json, errorMsg)) return false;

    if (!json[QStringLiteral("elements")].isArray()) {
        if (errorMsg) *errorMsg = QStringLiteral("Floor plan has no \"elements\" array");
        return false;
    }

    FloorPlanModel result;
    const QJsonArray elements = json[QStringLiteral("elements")].toArray();
    result.elements.reserve(elements.size());

    for (int i = 0; i < elements.size(); ++i) {
        QJsonObject el = elements[i].toObject();

        ElementType type = ElementType::Wall;
        QString typeName = el[QStringLiteral("type")].toString();
        if (!plan::elementTypeFromName(typeName, &type)) {
            if (errorMsg) {
                *errorMsg = QStringLiteral("Unknown element type \"%1\" at index %2")
                                .arg(typeName).arg(i);
            }
            return false;
        }

        FloorPlanElement element;
        element.rect = rectFromJson(el[QStringLiteral("rect")].toObject());
        element.rotation = el[QStringLiteral("rotation")].toDouble(0.0);

        switch (type) {
        case ElementType::Wall:    element.kind = ElementKind::wall(); break;
        case ElementType::Door:    element.kind = ElementKind::door(); break;
        case ElementType::Window:  element.kind = ElementKind::window(); break;
        case ElementType::Opening: element.kind = ElementKind::opening(); break;
        case ElementType::Object:
            element.kind = ElementKind::object(
                plan::categoryFromName(el[QStringLiteral("category")].toString()));
            break;
        }

        if (el.contains(QStringLiteral("label"))) {
            element.label = el[QStringLiteral("label")].toString();
        }
        result.elements.append(element);
    }

    result.boundingBox = rectFromJson(json[QStringLiteral("boundingBox")].toObject());

    QJsonObject dims = json[QStringLiteral("roomDimensions")].toObject();
    result.roomDimensions.width = dims[QStringLiteral("width")].toDouble(0.0);
    result.roomDimensions.height = dims[QStringLiteral("height")].toDouble(0.0);
    result.roomDimensions.depth = dims[QStringLiteral("depth")].toDouble(0.0);

    if (model) *model = result;
    return true;
}

bool saveModel(const QString& path, const FloorPlanModel& model, QString* errorMsg)
{
    return writeJsonFile(path, modelToJson(model), errorMsg);
}

bool loadModel(const QString& path, FloorPlanModel* model, QString* errorMsg)
{
    QJsonObject json;
    if (!readJsonFile(path, &json, errorMsg)) return false;
    return modelFromJson(json, model, errorMsg);
}

// =====================================================================
//  Surfaces
// =====================================================================

QJsonObject surfacesToJson(const QVector<SurfaceRecord>& surfaces)
{
    QJsonObject obj;
    obj[QStringLiteral("format_version")] = FORMAT_VERSION;

    QJsonArray list;
    for (const SurfaceRecord& surface : surfaces) {
        QJsonObject s;
        s[QStringLiteral("kind")] = plan::surfaceKindName(surface.kind);

        QJsonArray transform;
        for (double value : surface.transform.toColumnMajor()) {
            transform.append(value);
        }
        s[QStringLiteral("transform")] = transform;
        s[QStringLiteral("dimensions")] = vectorToJson(surface.dimensions);

        if (surface.kind == SurfaceKind::Object) {
            s[QStringLiteral("category")] = plan::categoryName(surface.category);
        }
        list.append(s);
    }
    obj[QStringLiteral("surfaces")] = list;
    return obj;
}

bool surfacesFromJson(const QJsonObject& json, QVector<SurfaceRecord>* surfaces,
                      QString* errorMsg)
{
    if (!checkFormatVersion(json, errorMsg)) return false;

    if (!json[QStringLiteral("surfaces")].isArray()) {
        if (errorMsg) *errorMsg = QStringLiteral("Surface list has no \"surfaces\" array");
        return false;
    }

    QVector<SurfaceRecord> result;
    const QJsonArray list = json[QStringLiteral("surfaces")].toArray();
    result.reserve(list.size());

    for (int i = 0; i < list.size(); ++i) {
        QJsonObject s = list[i].toObject();
        SurfaceRecord surface;

        QString kindName = s[QStringLiteral("kind")].toString();
        if (!plan::surfaceKindFromName(kindName, &surface.kind)) {
            if (errorMsg) {
                *errorMsg = QStringLiteral("Unknown surface kind \"%1\" at index %2")
                                .arg(kindName).arg(i);
            }
            return false;
        }

        QJsonArray transform = s[QStringLiteral("transform")].toArray();
        if (!transform.isEmpty()) {
            if (transform.size() != 16) {
                if (errorMsg) {
                    *errorMsg = QStringLiteral("Surface %1: transform needs 16 values, got %2")
                                    .arg(i).arg(transform.size());
                }
                return false;
            }
            QVector<double> values;
            values.reserve(16);
            for (const QJsonValue& v : transform) {
                values.append(v.toDouble(0.0));
            }
            surface.transform = geometry::Matrix4::fromColumnMajor(values);
        }

        QJsonArray dims = s[QStringLiteral("dimensions")].toArray();
        if (dims.size() != 3) {
            if (errorMsg) {
                *errorMsg = QStringLiteral("Surface %1: dimensions need 3 values, got %2")
                                .arg(i).arg(dims.size());
            }
            return false;
        }
        surface.dimensions = geometry::Vector3(dims[0].toDouble(0.0),
                                               dims[1].toDouble(0.0),
                                               dims[2].toDouble(0.0));

        if (surface.kind == SurfaceKind::Object) {
            surface.category = plan::categoryFromName(s[QStringLiteral("category")].toString());
        }
        result.append(surface);
    }

    if (surfaces) *surfaces = result;
    return true;
}

bool saveSurfaces(const QString& path, const QVector<SurfaceRecord>& surfaces,
                  QString* errorMsg)
{
    return writeJsonFile(path, surfacesToJson(surfaces), errorMsg);
}

bool loadSurfaces(const QString& path, QVector<SurfaceRecord>* surfaces,
                  QString* errorMsg)
{
    QJsonObject json;
    if (!readJsonFile(path, &json, errorMsg)) return false;
    return surfacesFromJson(json, surfaces, errorMsg);
}

// =====================================================================
//  Files
// =====================================================================

bool readJsonFile(const QString& path, QJsonObject* json, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to read %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMsg) *errorMsg = QStringLiteral("Invalid JSON in %1: %2").arg(path, parseError.errorString());
        qCWarning(lcStorage) << "JSON parse error in" << path << parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        if (errorMsg) *errorMsg = QStringLiteral("Invalid JSON in %1: top level is not an object").arg(path);
        return false;
    }

    if (json) *json = doc.object();
    return true;
}

}  // namespace plan_io
}  // namespace floorplan
