// =====================================================================
//  tests/test_viewfit.cpp — Scale-to-fit transform
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/plan/viewfit.h>

#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace floorplan::plan;
using floorplan::test::singleElementModel;

TEST(ViewFit, ExactFitHasUnitScale) {
    FloorPlanModel model = singleElementModel(ElementKind::wall(), QRectF(0, 0, 4, 3));
    ViewFit fit = computeViewFit(model, QSizeF(480, 380));

    ASSERT_TRUE(fit.valid);
    EXPECT_DOUBLE_EQ(1.0, fit.scale);
    EXPECT_DOUBLE_EQ(40.0, fit.offset.x());
    EXPECT_DOUBLE_EQ(40.0, fit.offset.y());
}

TEST(ViewFit, NarrowAxisLimitsScaleAndPlanIsCentered) {
    FloorPlanModel model = singleElementModel(ElementKind::wall(), QRectF(0, 0, 4, 3));
    ViewFit fit = computeViewFit(model, QSizeF(880, 380));

    ASSERT_TRUE(fit.valid);
    EXPECT_DOUBLE_EQ(1.0, fit.scale);
    EXPECT_DOUBLE_EQ(240.0, fit.offset.x());
    EXPECT_DOUBLE_EQ(40.0, fit.offset.y());

    QPointF corner = fit.map(QPointF(4, 3));
    EXPECT_DOUBLE_EQ(640.0, corner.x());
    EXPECT_DOUBLE_EQ(340.0, corner.y());
}

TEST(ViewFit, OffsetCompensatesForBoxOrigin) {
    FloorPlanModel model = singleElementModel(ElementKind::wall(), QRectF(-2, 1, 2, 2));
    ViewFitOptions options;
    options.padding = 0.0;
    ViewFit fit = computeViewFit(model, QSizeF(400, 400), options);

    ASSERT_TRUE(fit.valid);
    EXPECT_DOUBLE_EQ(2.0, fit.scale);

    QRectF mapped = fit.map(model.boundingBox);
    EXPECT_DOUBLE_EQ(0.0, mapped.left());
    EXPECT_DOUBLE_EQ(0.0, mapped.top());
    EXPECT_DOUBLE_EQ(400.0, mapped.width());
    EXPECT_DOUBLE_EQ(400.0, mapped.height());
}

TEST(ViewFit, ViewportSmallerThanPaddingIsInvalid) {
    FloorPlanModel model = singleElementModel(ElementKind::wall(), QRectF(0, 0, 4, 3));
    ViewFit fit = computeViewFit(model, QSizeF(80, 500));

    EXPECT_FALSE(fit.valid);
    EXPECT_DOUBLE_EQ(1.0, fit.scale);
    EXPECT_EQ(QPointF(0, 0), fit.offset);
}

TEST(ViewFit, ModelWithoutAreaIsInvalid) {
    EXPECT_FALSE(computeViewFit(FloorPlanModel(), QSizeF(800, 600)).valid);

    // A single straight wall has zero depth
    FloorPlanModel line = singleElementModel(ElementKind::wall(), QRectF(0, 0, 4, 0));
    EXPECT_FALSE(computeViewFit(line, QSizeF(800, 600)).valid);
}
