// =====================================================================
//  tests/test_plan_io.cpp — JSON companion format
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/plan/builder.h>
#include <floorplan/plan_io.h>

#include "test_helpers.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <QtMath>

#include <gtest/gtest.h>

using namespace floorplan;
using namespace floorplan::plan;
using floorplan::test::boxRoom;
using floorplan::test::objectAt;
using floorplan::test::surfaceAt;

namespace {

QVector<SurfaceRecord> capturedRoom()
{
    QVector<SurfaceRecord> surfaces = boxRoom(4.2, 3.1);
    surfaces.append(createSurface(SurfaceKind::Door,
                                  geometry::Matrix4::translation(0.0, 1.0, 1.2) *
                                      geometry::Matrix4::rotationY(-M_PI / 2.0),
                                  geometry::Vector3(0.85, 2.0, 0.1)));
    surfaces.append(surfaceAt(SurfaceKind::Window, 2.0, 1.5, 0.0, 1.2, 1.0, 0.1));
    surfaces.append(surfaceAt(SurfaceKind::Opening, 4.2, 1.0, 2.0, 0.1, 2.0, 0.9));
    surfaces.append(objectAt(ObjectCategory::WasherDryer, 3.5, 0.5, 0.6, 0.6));
    surfaces.append(objectAt(ObjectCategory::Unknown, 1.0, 2.0, 0.4, 0.4));
    return surfaces;
}

QJsonObject parse(const char* text)
{
    return QJsonDocument::fromJson(QByteArray(text)).object();
}

}  // anonymous namespace

// ---- Models ----

TEST(PlanIO, ModelRoundTrip) {
    FloorPlanModel model = buildFloorPlan(capturedRoom());
    FloorPlanModel restored;
    QString error;

    ASSERT_TRUE(plan_io::modelFromJson(plan_io::modelToJson(model), &restored, &error))
        << error.toStdString();
    EXPECT_TRUE(model.fuzzyEquals(restored));
    EXPECT_EQ(model.count(ElementType::Object), restored.count(ElementType::Object));
}

TEST(PlanIO, ModelFileRoundTrip) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath(QStringLiteral("room.json"));

    FloorPlanModel model = buildFloorPlan(capturedRoom());
    ASSERT_TRUE(plan_io::saveModel(path, model));

    FloorPlanModel restored;
    QString error;
    ASSERT_TRUE(plan_io::loadModel(path, &restored, &error)) << error.toStdString();
    EXPECT_TRUE(model.fuzzyEquals(restored));
}

TEST(PlanIO, ModelFields) {
    FloorPlanModel model = buildFloorPlan({objectAt(ObjectCategory::Television, 1.0, 1.0, 1.2, 0.1)});
    QJsonObject json = plan_io::modelToJson(model);

    EXPECT_EQ(FORMAT_VERSION, json[QStringLiteral("format_version")].toInt());
    ASSERT_TRUE(json[QStringLiteral("elements")].isArray());
    QJsonObject element = json[QStringLiteral("elements")].toArray()[0].toObject();
    EXPECT_EQ(QStringLiteral("object"), element[QStringLiteral("type")].toString());
    EXPECT_EQ(QStringLiteral("television"), element[QStringLiteral("category")].toString());
    EXPECT_EQ(QStringLiteral("TV"), element[QStringLiteral("label")].toString());
    EXPECT_DOUBLE_EQ(1.2, element[QStringLiteral("rect")].toObject()[QStringLiteral("width")].toDouble());
    EXPECT_TRUE(json[QStringLiteral("boundingBox")].isObject());
    EXPECT_TRUE(json[QStringLiteral("roomDimensions")].isObject());
}

TEST(PlanIO, StructuralElementsHaveNoLabel) {
    QJsonObject json = plan_io::modelToJson(buildFloorPlan(boxRoom(2.0, 2.0)));

    for (const QJsonValue& value : json[QStringLiteral("elements")].toArray()) {
        QJsonObject element = value.toObject();
        EXPECT_FALSE(element.contains(QStringLiteral("label")));
        EXPECT_FALSE(element.contains(QStringLiteral("category")));
    }
}

TEST(PlanIO, MinimalModelDocument) {
    QJsonObject json = parse(R"({"elements": [
        {"type": "door", "rect": {"x": 1, "y": 2, "width": 0.9, "height": 0.1}}
    ]})");

    FloorPlanModel model;
    ASSERT_TRUE(plan_io::modelFromJson(json, &model));
    ASSERT_EQ(1, model.elements.size());
    EXPECT_EQ(ElementKind::door(), model.elements[0].kind);
    EXPECT_DOUBLE_EQ(0.0, model.elements[0].rotation);
    EXPECT_FALSE(model.elements[0].label.has_value());
    EXPECT_EQ(RoomDimensions(), model.roomDimensions);
}

TEST(PlanIO, RejectsNewerFormat) {
    QJsonObject json = plan_io::modelToJson(FloorPlanModel());
    json[QStringLiteral("format_version")] = FORMAT_VERSION + 1;

    QString error;
    EXPECT_FALSE(plan_io::modelFromJson(json, nullptr, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("newer version")));
}

TEST(PlanIO, RejectsMissingElements) {
    QString error;
    EXPECT_FALSE(plan_io::modelFromJson(parse(R"({"format_version": 1})"), nullptr, &error));
    EXPECT_EQ(QStringLiteral("Floor plan has no \"elements\" array"), error);
}

TEST(PlanIO, RejectsUnknownElementTypeAndKeepsModel) {
    FloorPlanModel model = buildFloorPlan(boxRoom(2.0, 2.0));
    FloorPlanModel before = model;
    QString error;

    EXPECT_FALSE(plan_io::modelFromJson(
        parse(R"({"elements": [{"type": "wall"}, {"type": "stairwell"}]})"), &model, &error));
    EXPECT_EQ(QStringLiteral("Unknown element type \"stairwell\" at index 1"), error);
    EXPECT_EQ(before, model);
}

// ---- Surfaces ----

TEST(PlanIO, SurfacesRoundTrip) {
    QVector<SurfaceRecord> surfaces = capturedRoom();
    QVector<SurfaceRecord> restored;
    QString error;

    ASSERT_TRUE(plan_io::surfacesFromJson(plan_io::surfacesToJson(surfaces), &restored, &error))
        << error.toStdString();
    EXPECT_EQ(surfaces, restored);
}

TEST(PlanIO, SurfacesFileRoundTripBuildsSamePlan) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath(QStringLiteral("capture.json"));

    QVector<SurfaceRecord> surfaces = capturedRoom();
    ASSERT_TRUE(plan_io::saveSurfaces(path, surfaces));

    QVector<SurfaceRecord> restored;
    ASSERT_TRUE(plan_io::loadSurfaces(path, &restored));
    EXPECT_TRUE(buildFloorPlan(surfaces).fuzzyEquals(buildFloorPlan(restored)));
}

TEST(PlanIO, SurfaceDefaults) {
    QJsonObject json = parse(R"({"surfaces": [
        {"kind": "WALL", "dimensions": [4, 2.5, 0.1]},
        {"kind": "object", "dimensions": [1, 1, 1], "category": "hammock"}
    ]})");

    QVector<SurfaceRecord> surfaces;
    ASSERT_TRUE(plan_io::surfacesFromJson(json, &surfaces));
    ASSERT_EQ(2, surfaces.size());
    EXPECT_EQ(SurfaceKind::Wall, surfaces[0].kind);
    EXPECT_EQ(geometry::Matrix4::identity(), surfaces[0].transform);
    EXPECT_EQ(SurfaceKind::Object, surfaces[1].kind);
    EXPECT_EQ(ObjectCategory::Unknown, surfaces[1].category);
}

TEST(PlanIO, RejectsMalformedSurfaces) {
    QString error;

    EXPECT_FALSE(plan_io::surfacesFromJson(parse(R"({"elements": []})"), nullptr, &error));
    EXPECT_EQ(QStringLiteral("Surface list has no \"surfaces\" array"), error);

    EXPECT_FALSE(plan_io::surfacesFromJson(
        parse(R"({"surfaces": [{"kind": "ceiling", "dimensions": [1, 1, 1]}]})"), nullptr, &error));
    EXPECT_EQ(QStringLiteral("Unknown surface kind \"ceiling\" at index 0"), error);

    EXPECT_FALSE(plan_io::surfacesFromJson(
        parse(R"({"surfaces": [{"kind": "wall", "dimensions": [1, 1]}]})"), nullptr, &error));
    EXPECT_EQ(QStringLiteral("Surface 0: dimensions need 3 values, got 2"), error);

    EXPECT_FALSE(plan_io::surfacesFromJson(
        parse(R"({"surfaces": [{"kind": "wall", "dimensions": [1, 1, 1],
                                "transform": [1, 0, 0, 0]}]})"), nullptr, &error));
    EXPECT_EQ(QStringLiteral("Surface 0: transform needs 16 values, got 4"), error);
}

// ---- Files ----

TEST(PlanIO, ReadJsonFileErrors) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString error;
    QJsonObject json;

    EXPECT_FALSE(plan_io::readJsonFile(dir.filePath(QStringLiteral("absent.json")), &json, &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Failed to read")));

    QString broken = dir.filePath(QStringLiteral("broken.json"));
    QFile file(broken);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{\"surfaces\": [");
    file.close();
    EXPECT_FALSE(plan_io::readJsonFile(broken, &json, &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Invalid JSON in")));

    QString array = dir.filePath(QStringLiteral("array.json"));
    QFile arrayFile(array);
    ASSERT_TRUE(arrayFile.open(QIODevice::WriteOnly));
    arrayFile.write("[1, 2, 3]");
    arrayFile.close();
    EXPECT_FALSE(plan_io::readJsonFile(array, &json, &error));
    EXPECT_TRUE(error.endsWith(QStringLiteral("top level is not an object")));
}

TEST(PlanIO, SaveReportsUnwritablePath) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QString error;
    EXPECT_FALSE(plan_io::saveModel(dir.filePath(QStringLiteral("no/such/dir/plan.json")),
                                    FloorPlanModel(), &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Failed to save")));
}

TEST(PlanIO, SaveReportsFailedFlush) {
    if (!QFile::exists(QStringLiteral("/dev/full"))) {
        GTEST_SKIP() << "/dev/full not available";
    }

    QString error;
    EXPECT_FALSE(plan_io::saveModel(QStringLiteral("/dev/full"),
                                    buildFloorPlan(boxRoom(2.0, 2.0)), &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Failed to save")));
}
