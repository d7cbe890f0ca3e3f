// =====================================================================
//  tests/test_dxf_export.cpp — DXF encoder
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/plan/builder.h>
#include <floorplan/plan/export.h>

#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace floorplan::plan;
using floorplan::test::documentLines;
using floorplan::test::singleElementModel;

namespace {

/// Model with one element of every kind, bounding box (0, 0, 4, 3)
FloorPlanModel oneOfEach()
{
    FloorPlanModel model;
    auto add = [&model](const ElementKind& kind, const QRectF& rect) {
        FloorPlanElement element;
        element.kind = kind;
        element.rect = rect;
        if (kind.isObject()) element.label = objectLabel(kind.category());
        model.elements.append(element);
    };

    add(ElementKind::wall(), QRectF(0, 0, 4, 0.1));
    add(ElementKind::door(), QRectF(0, 1, 0.1, 0.8));
    add(ElementKind::window(), QRectF(1, 0, 1.2, 0.1));
    add(ElementKind::opening(), QRectF(3.9, 1, 0.1, 0.9));
    add(ElementKind::object(ObjectCategory::Bed), QRectF(1, 1, 2, 2));

    model.boundingBox = QRectF(0, 0, 4, 3);
    model.roomDimensions = {4.0, 2.5, 3.0};
    return model;
}

QString polylinesOn(const char* layer)
{
    return QStringLiteral("0\nLWPOLYLINE\n8\n%1\n").arg(QLatin1String(layer));
}

/// True if the document alternates integer group codes and values and
/// every SECTION is closed before EOF
bool isWellFormedDXF(const QString& dxf)
{
    QStringList lines = documentLines(dxf);
    if (lines.isEmpty() || !lines.last().isEmpty()) return false;
    lines.removeLast();
    if (lines.size() % 2 != 0) return false;

    int open = 0;
    for (int i = 0; i < lines.size(); i += 2) {
        bool ok = false;
        lines[i].trimmed().toInt(&ok);
        if (!ok) return false;
        if (lines[i] == QLatin1String("0")) {
            if (lines[i + 1] == QLatin1String("SECTION")) ++open;
            if (lines[i + 1] == QLatin1String("ENDSEC")) --open;
        }
    }
    return open == 0 && lines.size() >= 2 &&
           lines[lines.size() - 2] == QLatin1String("0") &&
           lines.last() == QLatin1String("EOF");
}

}  // anonymous namespace

TEST(DXFExport, HeaderDeclaresVersionAndUnits) {
    QString dxf = floorPlanToDXF(oneOfEach());

    EXPECT_TRUE(dxf.startsWith(QStringLiteral("0\nSECTION\n2\nHEADER\n9\n$ACADVER\n1\nAC1015\n")));
    EXPECT_TRUE(dxf.contains(QStringLiteral("9\n$INSUNITS\n70\n6\n")));
}

TEST(DXFExport, InsertionUnitsFollowScale) {
    DXFExportOptions options;
    options.scale = 100.0;
    EXPECT_TRUE(floorPlanToDXF(FloorPlanModel(), false, options)
                    .contains(QStringLiteral("$INSUNITS\n70\n5\n")));
    options.scale = 1000.0;
    EXPECT_TRUE(floorPlanToDXF(FloorPlanModel(), false, options)
                    .contains(QStringLiteral("$INSUNITS\n70\n4\n")));
    options.scale = 2.0;
    EXPECT_TRUE(floorPlanToDXF(FloorPlanModel(), false, options)
                    .contains(QStringLiteral("$INSUNITS\n70\n0\n")));
}

TEST(DXFExport, LayerTable) {
    QString dxf = floorPlanToDXF(oneOfEach());

    EXPECT_TRUE(dxf.contains(QStringLiteral("0\nTABLE\n2\nLAYER\n70\n5\n")));
    EXPECT_TRUE(dxf.contains(QStringLiteral("0\nLAYER\n2\nWALLS\n70\n0\n62\n7\n6\nCONTINUOUS\n")));
    EXPECT_TRUE(dxf.contains(QStringLiteral("0\nLAYER\n2\nDOORS\n70\n0\n62\n3\n")));
    EXPECT_TRUE(dxf.contains(QStringLiteral("0\nLAYER\n2\nWINDOWS\n70\n0\n62\n5\n")));
    EXPECT_TRUE(dxf.contains(QStringLiteral("0\nLAYER\n2\nOBJECTS\n70\n0\n62\n8\n")));
    EXPECT_TRUE(dxf.contains(QStringLiteral("0\nLAYER\n2\nDIMENSIONS\n70\n0\n62\n1\n")));
    EXPECT_FALSE(dxf.contains(QStringLiteral("OPENINGS")));
}

TEST(DXFExport, OneEntityPerLayerAndNoOpenings) {
    QString dxf = floorPlanToDXF(oneOfEach(), false);

    EXPECT_EQ(1, dxf.count(polylinesOn("WALLS")));
    EXPECT_EQ(1, dxf.count(polylinesOn("DOORS")));
    EXPECT_EQ(1, dxf.count(polylinesOn("WINDOWS")));
    EXPECT_EQ(1, dxf.count(polylinesOn("OBJECTS")));
    EXPECT_EQ(4, dxf.count(QStringLiteral("0\nLWPOLYLINE\n")));
    EXPECT_EQ(0, dxf.count(QStringLiteral("8\nDIMENSIONS\n")));
}

TEST(DXFExport, OpeningsCanBeIncluded) {
    DXFExportOptions options;
    options.includeOpenings = true;
    QString dxf = floorPlanToDXF(oneOfEach(), false, options);

    EXPECT_TRUE(dxf.contains(QStringLiteral("0\nTABLE\n2\nLAYER\n70\n6\n")));
    EXPECT_TRUE(dxf.contains(QStringLiteral("0\nLAYER\n2\nOPENINGS\n70\n0\n62\n9\n")));
    EXPECT_EQ(1, dxf.count(polylinesOn("OPENINGS")));
    EXPECT_EQ(5, dxf.count(QStringLiteral("0\nLWPOLYLINE\n")));
}

TEST(DXFExport, ClosedRectangleCornerOrder) {
    FloorPlanModel model = singleElementModel(ElementKind::wall(), QRectF(1, 2, 2, 3));
    QString dxf = floorPlanToDXF(model, false);

    EXPECT_TRUE(dxf.contains(QStringLiteral(
        "0\nLWPOLYLINE\n8\nWALLS\n90\n4\n70\n1\n"
        "10\n0\n20\n0\n"
        "10\n2\n20\n0\n"
        "10\n2\n20\n3\n"
        "10\n0\n20\n3\n")));
}

TEST(DXFExport, ScaleMultipliesCoordinates) {
    FloorPlanModel model = singleElementModel(ElementKind::door(), QRectF(0, 0, 0.25, 3));
    DXFExportOptions options;
    options.scale = 100.0;

    QString dxf = floorPlanToDXF(model, false, options);
    EXPECT_TRUE(dxf.contains(QStringLiteral("10\n25\n20\n300\n")));
}

TEST(DXFExport, ObjectLabelText) {
    QString dxf = floorPlanToDXF(oneOfEach(), false);

    EXPECT_TRUE(dxf.contains(QStringLiteral(
        "0\nTEXT\n8\nOBJECTS\n10\n2\n20\n2\n40\n0.15\n1\nBed\n")));
}

TEST(DXFExport, LabelTextStaysOnOneLine) {
    FloorPlanModel model = singleElementModel(
        ElementKind::object(ObjectCategory::Table), QRectF(0, 0, 1, 1));
    model.elements[0].label = QStringLiteral("Dining\nTable");

    QString dxf = floorPlanToDXF(model, false);
    EXPECT_TRUE(dxf.contains(QStringLiteral("1\nDining Table\n")));
    EXPECT_TRUE(isWellFormedDXF(dxf));
}

TEST(DXFExport, DimensionsUseTwoDecimalsWithSpace) {
    FloorPlanModel model = singleElementModel(ElementKind::wall(), QRectF(0, 0, 2, 3));
    model.roomDimensions.width = 3.456;
    model.roomDimensions.depth = 3.0;

    QString dxf = floorPlanToDXF(model, true);
    EXPECT_TRUE(dxf.contains(QStringLiteral(
        "0\nTEXT\n8\nDIMENSIONS\n10\n1\n20\n-0.3\n40\n0.2\n1\n3.46 m\n")));
    EXPECT_TRUE(dxf.contains(QStringLiteral(
        "0\nTEXT\n8\nDIMENSIONS\n10\n2.3\n20\n1.5\n40\n0.2\n1\n3.00 m\n")));
}

TEST(DXFExport, NoDimensionsWhenDisabled) {
    FloorPlanModel model = singleElementModel(ElementKind::wall(), QRectF(0, 0, 2, 3));
    model.roomDimensions.width = 3.456;

    QString dxf = floorPlanToDXF(model, false);
    EXPECT_FALSE(dxf.contains(QStringLiteral("3.46")));
    EXPECT_FALSE(dxf.contains(QStringLiteral("8\nDIMENSIONS\n")));
}

TEST(DXFExport, EmptyModelIsWellFormed) {
    QString dxf = floorPlanToDXF(buildFloorPlan({}), false);

    EXPECT_TRUE(isWellFormedDXF(dxf));
    EXPECT_TRUE(dxf.endsWith(QStringLiteral("0\nSECTION\n2\nENTITIES\n0\nENDSEC\n0\nEOF\n")));
    EXPECT_TRUE(isWellFormedDXF(floorPlanToDXF(buildFloorPlan({}), true)));
}

TEST(DXFExport, DocumentIsWellFormed) {
    EXPECT_TRUE(isWellFormedDXF(floorPlanToDXF(oneOfEach())));
}

TEST(DXFExport, IsIdempotent) {
    FloorPlanModel model = oneOfEach();
    EXPECT_EQ(floorPlanToDXF(model), floorPlanToDXF(model));
}
