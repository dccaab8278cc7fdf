#include "Coordinates.h"
#include <gtest/gtest.h>

using namespace Kiseki;

TEST(CoordinatesTest, ScreenToCellMapsThroughRenderedSize) {
    SurfaceRect surface{100.0f, 50.0f, 160.0f, 80.0f};

    CellCoord origin = Coordinates::ScreenToCell(100.0f, 50.0f, surface, 16, 8);
    EXPECT_EQ(origin.x, 0);
    EXPECT_EQ(origin.y, 0);

    CellCoord inner = Coordinates::ScreenToCell(125.0f, 79.0f, surface, 16, 8);
    EXPECT_EQ(inner.x, 2);
    EXPECT_EQ(inner.y, 2);

    CellCoord last = Coordinates::ScreenToCell(259.9f, 129.9f, surface, 16, 8);
    EXPECT_EQ(last.x, 15);
    EXPECT_EQ(last.y, 7);
}

TEST(CoordinatesTest, ScreenToCellOutsideSurfaceGoesOutOfRange) {
    SurfaceRect surface{0.0f, 0.0f, 100.0f, 100.0f};

    CellCoord before = Coordinates::ScreenToCell(-1.0f, -1.0f, surface, 10, 10);
    EXPECT_EQ(before.x, -1);
    EXPECT_EQ(before.y, -1);

    CellCoord after = Coordinates::ScreenToCell(100.0f, 150.0f, surface, 10, 10);
    EXPECT_EQ(after.x, 10);
    EXPECT_EQ(after.y, 15);
}

TEST(CoordinatesTest, ScreenToCellDegenerateSurface) {
    SurfaceRect surface{0.0f, 0.0f, 0.0f, 100.0f};
    CellCoord cell = Coordinates::ScreenToCell(5.0f, 5.0f, surface, 10, 10);
    EXPECT_EQ(cell.x, -1);
    EXPECT_EQ(cell.y, -1);
}

TEST(CoordinatesTest, CalculateFitUsesLargestIntegerZoom) {
    ViewTransform view = Coordinates::CalculateFit(800.0f, 600.0f, 16, 16);

    // min(700 / 16, 500 / 16) = 31.25
    EXPECT_FLOAT_EQ(view.zoom, 31.0f);
    EXPECT_FLOAT_EQ(view.panX, (800.0f - 496.0f) / 2.0f);
    EXPECT_FLOAT_EQ(view.panY, (600.0f - 496.0f) / 2.0f);
}

TEST(CoordinatesTest, CalculateFitClampsZoom) {
    ViewTransform large = Coordinates::CalculateFit(5000.0f, 5000.0f, 1, 1);
    EXPECT_FLOAT_EQ(large.zoom, Limits::MAX_ZOOM);

    ViewTransform tiny = Coordinates::CalculateFit(60.0f, 60.0f, 320, 320);
    EXPECT_FLOAT_EQ(tiny.zoom, Limits::MIN_ZOOM);
}

TEST(CoordinatesTest, CenterPan) {
    float panX = 0.0f;
    float panY = 0.0f;
    Coordinates::CenterPan(800.0f, 600.0f, 480, 320, &panX, &panY);
    EXPECT_FLOAT_EQ(panX, 160.0f);
    EXPECT_FLOAT_EQ(panY, 140.0f);
}

TEST(CoordinatesTest, DisplayScaleFloorsAndKeepsOne) {
    EXPECT_EQ(Coordinates::DisplayScale(30.0f), 30);
    EXPECT_EQ(Coordinates::DisplayScale(33.7f), 33);
    EXPECT_EQ(Coordinates::DisplayScale(0.5f), 1);
}

TEST(CoordinatesTest, ZoomAtPointKeepsPointFixed) {
    ViewTransform view{10.0f, 20.0f, 40.0f};
    float localX = 55.0f;
    float localY = 25.0f;

    // Grid position under the pointer before zooming
    float gridX = localX / view.zoom;
    float gridY = localY / view.zoom;
    float screenX = view.panX + localX;
    float screenY = view.panY + localY;

    ViewTransform zoomed = Coordinates::ZoomAtPoint(view, localX, localY, 2.0f);
    EXPECT_FLOAT_EQ(zoomed.zoom, 20.0f);
    EXPECT_FLOAT_EQ(zoomed.panX + gridX * zoomed.zoom, screenX);
    EXPECT_FLOAT_EQ(zoomed.panY + gridY * zoomed.zoom, screenY);
}

TEST(CoordinatesTest, ZoomAtPointClampsToLimits) {
    ViewTransform view{95.0f, 0.0f, 0.0f};
    ViewTransform zoomed = Coordinates::ZoomAtPoint(view, 0.0f, 0.0f, 1.1f);
    EXPECT_FLOAT_EQ(zoomed.zoom, Limits::MAX_ZOOM);

    ViewTransform small{1.0f, 0.0f, 0.0f};
    ViewTransform out = Coordinates::ZoomAtPoint(small, 0.0f, 0.0f, 0.9f);
    EXPECT_FLOAT_EQ(out.zoom, Limits::MIN_ZOOM);
}
