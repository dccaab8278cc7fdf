#include "ToolController.h"
#include "EditorState.h"
#include "RasterBuffer.h"
#include <gtest/gtest.h>

using namespace Kiseki;

namespace {

class ToolControllerTest : public ::testing::Test {
protected:
    ToolControllerTest()
        : buffer(16, 16)
        , tools(state, buffer)
    {
    }

    void SetTool(Tool tool) {
        StatePatch patch;
        patch.currentTool = tool;
        state.Update(patch);
    }

    void SetColor(const Color& color) {
        StatePatch patch;
        patch.currentColor = color;
        state.Update(patch);
    }

    EditorState state;
    RasterBuffer buffer;
    ToolController tools;
};

} // namespace

TEST_F(ToolControllerTest, PencilStrokeCommits) {
    Color red(255, 0, 0);
    SetColor(red);

    EXPECT_EQ(tools.Execute(ToolAction::Start, 2, 2), ToolResult::None);
    EXPECT_TRUE(state.IsDrawing());
    EXPECT_EQ(buffer.GetPixel(2, 2), red);

    tools.Execute(ToolAction::Move, 6, 2);
    for (int x = 2; x <= 6; ++x) {
        EXPECT_EQ(buffer.GetPixel(x, 2), red) << "x=" << x;
    }
    EXPECT_EQ(tools.GetLastX(), 6);
    EXPECT_EQ(tools.GetLastY(), 2);

    EXPECT_EQ(tools.Execute(ToolAction::End), ToolResult::Commit);
    EXPECT_FALSE(state.IsDrawing());
}

TEST_F(ToolControllerTest, EndWithoutStrokeDoesNotCommit) {
    EXPECT_EQ(tools.Execute(ToolAction::End), ToolResult::None);
}

TEST_F(ToolControllerTest, StartOutsideGridIsIgnored) {
    tools.Execute(ToolAction::Start, -1, 3);
    EXPECT_FALSE(state.IsDrawing());
    EXPECT_EQ(tools.Execute(ToolAction::End), ToolResult::None);
}

TEST_F(ToolControllerTest, MoveOutsideGridKeepsLastPoint) {
    tools.Execute(ToolAction::Start, 1, 1);
    tools.Execute(ToolAction::Move, 40, 1);
    EXPECT_EQ(tools.GetLastX(), 1);
    EXPECT_EQ(buffer.GetPixel(5, 1), Color::Transparent());
}

TEST_F(ToolControllerTest, MoveWithoutStartDoesNothing) {
    tools.Execute(ToolAction::Move, 4, 4);
    EXPECT_EQ(buffer.GetPixel(4, 4), Color::Transparent());
}

TEST_F(ToolControllerTest, EraserClearsBrushFootprint) {
    buffer.FillRect(0, 0, 16, 16, Color(0, 0, 0));
    SetTool(Tool::Eraser);
    StatePatch patch;
    patch.brushSize = 3;
    state.Update(patch);

    tools.Execute(ToolAction::Start, 5, 5);
    EXPECT_EQ(buffer.GetPixel(4, 4), Color::Transparent());
    EXPECT_EQ(buffer.GetPixel(6, 6), Color::Transparent());
    EXPECT_EQ(buffer.GetPixel(7, 7), Color(0, 0, 0));
    EXPECT_EQ(tools.Execute(ToolAction::End), ToolResult::Commit);
}

TEST_F(ToolControllerTest, FillFloodsAndCommits) {
    Color green(0, 255, 0, 128);
    SetColor(green);
    SetTool(Tool::Fill);

    tools.Execute(ToolAction::Start, 0, 0);
    EXPECT_TRUE(state.IsDrawing());
    EXPECT_EQ(buffer.GetPixel(15, 15), green);

    // Dragging does not paint with the fill tool
    tools.Execute(ToolAction::Move, 3, 3);
    EXPECT_EQ(tools.Execute(ToolAction::End), ToolResult::Commit);
}

TEST_F(ToolControllerTest, EyedropperPicksOpaqueColor) {
    buffer.SetPixel(3, 4, Color(10, 20, 30, 40));
    SetTool(Tool::Eyedropper);

    tools.Execute(ToolAction::Start, 3, 4);
    EXPECT_EQ(state.GetCurrentColor(), Color(10, 20, 30, 255));
    EXPECT_FALSE(state.IsDrawing());
    EXPECT_EQ(tools.Execute(ToolAction::End), ToolResult::None);
}

TEST_F(ToolControllerTest, EyedropperIgnoresTransparentCells) {
    Color before = state.GetCurrentColor();
    SetTool(Tool::Eyedropper);
    tools.Execute(ToolAction::Start, 0, 0);
    EXPECT_EQ(state.GetCurrentColor(), before);
}

TEST_F(ToolControllerTest, HandToolLeavesBufferAlone) {
    SetTool(Tool::Hand);
    std::vector<uint8_t> before = buffer.GetPixels();
    tools.Execute(ToolAction::Start, 2, 2);
    tools.Execute(ToolAction::Move, 5, 5);
    EXPECT_EQ(buffer.GetPixels(), before);
    EXPECT_EQ(tools.Execute(ToolAction::End), ToolResult::None);
}
