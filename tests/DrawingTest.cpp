#include "Drawing.h"
#include "RasterBuffer.h"
#include <gtest/gtest.h>
#include <cstdlib>
#include <utility>
#include <vector>

using namespace Kiseki;

namespace {

int CountColor(const RasterBuffer& buffer, const Color& color) {
    int count = 0;
    for (int y = 0; y < buffer.GetHeight(); ++y) {
        for (int x = 0; x < buffer.GetWidth(); ++x) {
            if (buffer.GetPixel(x, y) == color) count++;
        }
    }
    return count;
}

std::vector<std::pair<int, int>> LineCells(int x0, int y0, int x1, int y1) {
    std::vector<std::pair<int, int>> cells;
    Drawing::RasterizeLine(x0, y0, x1, y1, [&](int x, int y) {
        cells.emplace_back(x, y);
    });
    return cells;
}

} // namespace

TEST(DrawingTest, StampRectCentersOddSizes) {
    StampRect rect = Drawing::ComputeStampRect(5, 5, 3, 16, 16);
    EXPECT_EQ(rect.x, 4);
    EXPECT_EQ(rect.y, 4);
    EXPECT_EQ(rect.w, 3);
    EXPECT_EQ(rect.h, 3);
}

TEST(DrawingTest, StampRectBiasesEvenSizesTopLeft) {
    StampRect rect = Drawing::ComputeStampRect(5, 5, 4, 16, 16);
    EXPECT_EQ(rect.x, 3);
    EXPECT_EQ(rect.y, 3);
    EXPECT_EQ(rect.w, 4);
    EXPECT_EQ(rect.h, 4);
}

TEST(DrawingTest, StampRectKeepsFullSizeAtLeadingEdges) {
    // Origin clamps to 0 and the extent stays min(size, width - 0)
    StampRect topLeft = Drawing::ComputeStampRect(0, 0, 3, 16, 16);
    EXPECT_EQ(topLeft.x, 0);
    EXPECT_EQ(topLeft.y, 0);
    EXPECT_EQ(topLeft.w, 3);
    EXPECT_EQ(topLeft.h, 3);

    StampRect evenTopLeft = Drawing::ComputeStampRect(0, 0, 4, 16, 16);
    EXPECT_EQ(evenTopLeft.x, 0);
    EXPECT_EQ(evenTopLeft.w, 4);
    EXPECT_EQ(evenTopLeft.h, 4);

    StampRect leftEdge = Drawing::ComputeStampRect(1, 8, 5, 16, 16);
    EXPECT_EQ(leftEdge.x, 0);
    EXPECT_EQ(leftEdge.y, 6);
    EXPECT_EQ(leftEdge.w, 5);
    EXPECT_EQ(leftEdge.h, 5);
}

TEST(DrawingTest, StampRectTrimsAtTrailingEdges) {
    StampRect bottomRight = Drawing::ComputeStampRect(15, 15, 3, 16, 16);
    EXPECT_EQ(bottomRight.x, 14);
    EXPECT_EQ(bottomRight.y, 14);
    EXPECT_EQ(bottomRight.w, 2);
    EXPECT_EQ(bottomRight.h, 2);

    StampRect evenBottomRight = Drawing::ComputeStampRect(15, 15, 4, 16, 16);
    EXPECT_EQ(evenBottomRight.x, 13);
    EXPECT_EQ(evenBottomRight.w, 3);
}

TEST(DrawingTest, StampRectOffGridIsEmpty) {
    EXPECT_TRUE(Drawing::ComputeStampRect(40, 40, 3, 16, 16).IsEmpty());
    EXPECT_TRUE(Drawing::ComputeStampRect(-5, -5, 1, 16, 16).IsEmpty());
    EXPECT_TRUE(Drawing::ComputeStampRect(3, -4, 3, 16, 16).IsEmpty());
}

TEST(DrawingTest, StampAtCornerPaintsFullBrush) {
    RasterBuffer buffer(8, 8);
    Color red(255, 0, 0);
    ASSERT_TRUE(Drawing::Stamp(buffer, 0, 0, 3, StampMode::Paint, red));

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 3; ++x) {
            EXPECT_EQ(buffer.GetPixel(x, y), red) << x << "," << y;
        }
    }
    EXPECT_EQ(CountColor(buffer, red), 9);
}

TEST(DrawingTest, StampPaintsAndErases) {
    RasterBuffer buffer(8, 8);
    Color blue(0, 0, 255);

    EXPECT_TRUE(Drawing::Stamp(buffer, 3, 3, 3, StampMode::Paint, blue));
    EXPECT_EQ(CountColor(buffer, blue), 9);
    EXPECT_EQ(buffer.GetPixel(2, 2), blue);
    EXPECT_EQ(buffer.GetPixel(4, 4), blue);

    EXPECT_TRUE(Drawing::Stamp(buffer, 3, 3, 1, StampMode::Erase, blue));
    EXPECT_EQ(buffer.GetPixel(3, 3), Color::Transparent());
    EXPECT_EQ(CountColor(buffer, blue), 8);

    EXPECT_FALSE(Drawing::Stamp(buffer, -5, -5, 1, StampMode::Paint, blue));
}

TEST(DrawingTest, RasterizeLineIncludesEndpoints) {
    auto cells = LineCells(0, 0, 5, 2);
    ASSERT_FALSE(cells.empty());
    EXPECT_EQ(cells.front(), std::make_pair(0, 0));
    EXPECT_EQ(cells.back(), std::make_pair(5, 2));
    EXPECT_EQ(cells.size(), 6u);  // One cell per step of the major axis
}

TEST(DrawingTest, RasterizeLineIsEightConnected) {
    auto cells = LineCells(7, 1, -3, 9);
    for (size_t i = 1; i < cells.size(); ++i) {
        int dx = std::abs(cells[i].first - cells[i - 1].first);
        int dy = std::abs(cells[i].second - cells[i - 1].second);
        EXPECT_LE(dx, 1);
        EXPECT_LE(dy, 1);
        EXPECT_GT(dx + dy, 0);
    }
    EXPECT_EQ(cells.back(), std::make_pair(-3, 9));
}

TEST(DrawingTest, RasterizeSinglePoint) {
    auto cells = LineCells(4, 4, 4, 4);
    ASSERT_EQ(cells.size(), 1u);
    EXPECT_EQ(cells[0], std::make_pair(4, 4));
}

TEST(DrawingTest, StrokeLineLeavesNoGaps) {
    RasterBuffer buffer(10, 10);
    Color red(255, 0, 0);
    Drawing::StrokeLine(buffer, 0, 0, 9, 9, 1, StampMode::Paint, red);

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(buffer.GetPixel(i, i), red);
    }
    EXPECT_EQ(CountColor(buffer, red), 10);
}

TEST(DrawingTest, FloodFillStopsAtBoundaries) {
    RasterBuffer buffer(5, 5);
    Color wall(0, 0, 0);
    Color fill(255, 255, 0);

    // Vertical wall at x = 2
    buffer.FillRect(2, 0, 1, 5, wall);

    size_t filled = Drawing::FloodFill(buffer, 0, 0, fill);
    EXPECT_EQ(filled, 10u);
    EXPECT_EQ(buffer.GetPixel(1, 4), fill);
    EXPECT_EQ(buffer.GetPixel(2, 2), wall);
    EXPECT_EQ(buffer.GetPixel(3, 0), Color::Transparent());
}

TEST(DrawingTest, FloodFillIsFourConnected) {
    RasterBuffer buffer(3, 3);
    Color wall(0, 0, 0);
    Color fill(0, 255, 0);

    // Diagonal wall; cells on either side only touch at corners
    buffer.SetPixel(0, 2, wall);
    buffer.SetPixel(1, 1, wall);
    buffer.SetPixel(2, 0, wall);

    size_t filled = Drawing::FloodFill(buffer, 0, 0, fill);
    EXPECT_EQ(filled, 3u);
    EXPECT_EQ(buffer.GetPixel(2, 2), Color::Transparent());
}

TEST(DrawingTest, FloodFillMatchesExactRgba) {
    RasterBuffer buffer(3, 1);
    buffer.SetPixel(0, 0, Color(10, 10, 10, 255));
    buffer.SetPixel(1, 0, Color(10, 10, 10, 254));
    buffer.SetPixel(2, 0, Color(10, 10, 10, 255));

    size_t filled = Drawing::FloodFill(buffer, 0, 0, Color(1, 2, 3));
    EXPECT_EQ(filled, 1u);
    EXPECT_EQ(buffer.GetPixel(2, 0), Color(10, 10, 10, 255));
}

TEST(DrawingTest, FloodFillNoOps) {
    RasterBuffer buffer(4, 4);
    Color red(255, 0, 0);
    buffer.FillRect(0, 0, 4, 4, red);

    EXPECT_EQ(Drawing::FloodFill(buffer, 1, 1, red), 0u);
    EXPECT_EQ(Drawing::FloodFill(buffer, 4, 0, Color(0, 0, 255)), 0u);
    EXPECT_EQ(CountColor(buffer, red), 16);
}

TEST(DrawingTest, FloodFillTwiceIsNoOp) {
    RasterBuffer buffer(6, 6);
    Color wall(0, 0, 0);
    Color fill(30, 60, 90, 200);
    buffer.FillRect(0, 3, 6, 1, wall);

    ASSERT_EQ(Drawing::FloodFill(buffer, 2, 1, fill), 18u);
    std::vector<uint8_t> afterFirst = buffer.GetPixels();

    EXPECT_EQ(Drawing::FloodFill(buffer, 2, 1, fill), 0u);
    EXPECT_EQ(buffer.GetPixels(), afterFirst);

    // Any seed inside the filled region is equally inert
    EXPECT_EQ(Drawing::FloodFill(buffer, 5, 0, fill), 0u);
    EXPECT_EQ(buffer.GetPixels(), afterFirst);
}

TEST(DrawingTest, FloodFillHandlesLargestGrid) {
    RasterBuffer buffer(320, 320);
    size_t filled = Drawing::FloodFill(buffer, 160, 160, Color(9, 9, 9));
    EXPECT_EQ(filled, 320u * 320u);
}

TEST(DrawingTest, StampThenSampleEveryCell) {
    const int width = 5;
    const int height = 4;
    RasterBuffer buffer(width, height);

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            Color color(static_cast<uint8_t>(x * 40 + 1),
                        static_cast<uint8_t>(y * 60 + 1), 77);
            ASSERT_TRUE(Drawing::Stamp(buffer, x, y, 1, StampMode::Paint, color));

            auto sampled = Drawing::SampleColor(buffer, x, y);
            ASSERT_TRUE(sampled.has_value()) << x << "," << y;
            EXPECT_EQ(*sampled, color) << x << "," << y;
        }
    }
}

TEST(DrawingTest, SampleColorForcesOpaque) {
    RasterBuffer buffer(2, 2);
    buffer.SetPixel(0, 0, Color(12, 34, 56, 80));

    auto sampled = Drawing::SampleColor(buffer, 0, 0);
    ASSERT_TRUE(sampled.has_value());
    EXPECT_EQ(*sampled, Color(12, 34, 56, 255));

    EXPECT_FALSE(Drawing::SampleColor(buffer, 1, 1).has_value());
    EXPECT_FALSE(Drawing::SampleColor(buffer, 9, 0).has_value());
}
