#include "ViewportRenderer.h"
#include "EditorState.h"
#include "Limits.h"
#include "RasterBuffer.h"
#include <gtest/gtest.h>

using namespace Kiseki;

namespace {

Color SurfacePixel(const ViewportRenderer& renderer, int x, int y) {
    const auto& pixels = renderer.GetSurfacePixels();
    size_t idx = (static_cast<size_t>(y) * renderer.GetSurfaceWidth() + x) * 4;
    return Color(pixels[idx], pixels[idx + 1], pixels[idx + 2], pixels[idx + 3]);
}

void SetGrid(EditorState& state, int width, int height, float zoom) {
    StatePatch patch;
    patch.width = width;
    patch.height = height;
    patch.zoom = zoom;
    state.Update(patch);
}

const CheckerColors kChecker = {Color(200, 200, 200), Color(100, 100, 100)};

} // namespace

TEST(ViewportRendererTest, SurfaceIsGridTimesScale) {
    EditorState state;
    SetGrid(state, 4, 3, 10.7f);
    RasterBuffer buffer(4, 3);

    ViewportRenderer renderer;
    renderer.Render(state, buffer);
    EXPECT_EQ(renderer.GetScale(), 10);
    EXPECT_EQ(renderer.GetSurfaceWidth(), 40);
    EXPECT_EQ(renderer.GetSurfaceHeight(), 30);
    EXPECT_EQ(renderer.GetSurfacePixels().size(), 40u * 30u * 4u);
}

TEST(ViewportRendererTest, LargestGridAtMaxZoomStaysBounded) {
    EditorState state;
    SetGrid(state, 320, 320, 100.0f);
    RasterBuffer buffer(320, 320);
    buffer.SetPixel(319, 319, Color(255, 0, 0));

    ViewportRenderer renderer;
    renderer.Render(state, buffer);

    // 4096 / 320 = 12 surface pixels per cell
    EXPECT_EQ(renderer.GetScale(), 12);
    EXPECT_EQ(renderer.GetSurfaceWidth(), 3840);
    EXPECT_EQ(renderer.GetSurfaceHeight(), 3840);
    EXPECT_LE(renderer.GetSurfaceWidth(), Limits::MAX_SURFACE_DIMENSION);
    EXPECT_EQ(renderer.GetSurfacePixels().size(), 3840u * 3840u * 4u);
    EXPECT_EQ(SurfacePixel(renderer, 3839, 3839), Color(255, 0, 0));

    // The on-screen size still follows the zoom
    int displayW = 0;
    int displayH = 0;
    ViewportRenderer::GetDisplaySize(state, &displayW, &displayH);
    EXPECT_EQ(displayW, 32000);
    EXPECT_EQ(displayH, 32000);
}

TEST(ViewportRendererTest, SurfaceRespectsTextureLimit) {
    EditorState state;
    SetGrid(state, 320, 100, 40.0f);
    RasterBuffer buffer(320, 100);

    ViewportRenderer renderer;
    renderer.SetMaxSurfaceSize(1024);
    renderer.Render(state, buffer);
    EXPECT_EQ(renderer.GetScale(), 3);
    EXPECT_EQ(renderer.GetSurfaceWidth(), 960);
    EXPECT_EQ(renderer.GetSurfaceHeight(), 300);

    // Larger requests are held to the built-in ceiling
    renderer.SetMaxSurfaceSize(1 << 20);
    EXPECT_EQ(renderer.GetMaxSurfaceSize(), Limits::MAX_SURFACE_DIMENSION);
}

TEST(ViewportRendererTest, SurfaceScaleNeverDropsBelowOne) {
    EXPECT_EQ(ViewportRenderer::SurfaceScale(320, 320, 100, 100), 1);
    EXPECT_EQ(ViewportRenderer::SurfaceScale(16, 16, 30, 4096), 30);
    EXPECT_EQ(ViewportRenderer::SurfaceScale(16, 300, 30, 4096), 13);
}

TEST(ViewportRendererTest, SyncOnlyReportsRealChanges) {
    EditorState state;
    SetGrid(state, 8, 8, 4.0f);

    ViewportRenderer renderer;
    EXPECT_TRUE(renderer.SyncDisplaySize(state));
    EXPECT_FALSE(renderer.SyncDisplaySize(state));

    SetGrid(state, 8, 8, 4.9f);
    EXPECT_FALSE(renderer.SyncDisplaySize(state));

    SetGrid(state, 8, 8, 5.0f);
    EXPECT_TRUE(renderer.SyncDisplaySize(state));
}

TEST(ViewportRendererTest, TransparentCellsShowCheckerboard) {
    EditorState state;
    SetGrid(state, 2, 2, 3.0f);
    RasterBuffer buffer(2, 2);

    ViewportRenderer renderer;
    renderer.SetCheckerColors(kChecker);
    renderer.Render(state, buffer);

    EXPECT_EQ(SurfacePixel(renderer, 0, 0), kChecker.even);
    EXPECT_EQ(SurfacePixel(renderer, 2, 2), kChecker.even);
    EXPECT_EQ(SurfacePixel(renderer, 3, 0), kChecker.odd);
    EXPECT_EQ(SurfacePixel(renderer, 0, 5), kChecker.odd);
    EXPECT_EQ(SurfacePixel(renderer, 5, 5), kChecker.even);
}

TEST(ViewportRendererTest, OpaqueCellsCoverWholeBlock) {
    EditorState state;
    SetGrid(state, 2, 2, 3.0f);
    RasterBuffer buffer(2, 2);
    Color red(255, 0, 0);
    buffer.SetPixel(1, 0, red);

    ViewportRenderer renderer;
    renderer.SetCheckerColors(kChecker);
    renderer.Render(state, buffer);

    for (int y = 0; y < 3; ++y) {
        for (int x = 3; x < 6; ++x) {
            EXPECT_EQ(SurfacePixel(renderer, x, y), red);
        }
    }
    EXPECT_EQ(SurfacePixel(renderer, 3, 3), kChecker.even);
}

TEST(ViewportRendererTest, TranslucentCellsBlendOverChecker) {
    EditorState state;
    SetGrid(state, 1, 1, 1.0f);
    RasterBuffer buffer(1, 1);
    buffer.SetPixel(0, 0, Color(0, 0, 0, 128));

    ViewportRenderer renderer;
    renderer.SetCheckerColors(kChecker);
    renderer.Render(state, buffer);

    // 200 * (1 - 128/255) = 99.6
    Color blended = SurfacePixel(renderer, 0, 0);
    EXPECT_EQ(blended.r, 100);
    EXPECT_EQ(blended.a, 255);
}

TEST(ViewportRendererTest, CellsOutsideBufferStayChecker) {
    EditorState state;
    SetGrid(state, 3, 1, 1.0f);
    RasterBuffer buffer(2, 1);
    buffer.FillRect(0, 0, 2, 1, Color(1, 2, 3));

    ViewportRenderer renderer;
    renderer.SetCheckerColors(kChecker);
    renderer.Render(state, buffer);
    EXPECT_EQ(SurfacePixel(renderer, 2, 0), kChecker.even);
}

TEST(ViewportRendererTest, RevisionAdvancesEveryRender) {
    EditorState state;
    RasterBuffer buffer;
    ViewportRenderer renderer;
    uint64_t start = renderer.GetRevision();
    renderer.Render(state, buffer);
    renderer.Render(state, buffer);
    EXPECT_EQ(renderer.GetRevision(), start + 2);
}

TEST(ViewportRendererTest, TranslationFloorsPan) {
    EditorState state;
    StatePatch patch;
    patch.panX = 12.7f;
    patch.panY = -3.2f;
    state.Update(patch);

    int x = 0;
    int y = 0;
    ViewportRenderer::GetTranslation(state, &x, &y);
    EXPECT_EQ(x, 12);
    EXPECT_EQ(y, -4);
}
