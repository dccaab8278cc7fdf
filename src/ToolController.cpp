#include "ToolController.h"
#include "Drawing.h"
#include "EditorState.h"
#include "RasterBuffer.h"

namespace Kiseki {

ToolController::ToolController(EditorState& state, RasterBuffer& buffer)
    : m_state(state)
    , m_buffer(buffer)
    , m_lastX(-1)
    , m_lastY(-1)
{
}

ToolResult ToolController::Execute(ToolAction action, int x, int y) {
    switch (action) {
        case ToolAction::Start:
            Start(x, y);
            return ToolResult::None;
        case ToolAction::Move:
            Move(x, y);
            return ToolResult::None;
        case ToolAction::End:
            return End();
    }
    return ToolResult::None;
}

void ToolController::Start(int x, int y) {
    if (!m_buffer.Contains(x, y)) return;

    switch (m_state.GetCurrentTool()) {
        case Tool::Pencil:
        case Tool::Eraser: {
            StatePatch patch;
            patch.isDrawing = true;
            m_state.Update(patch);

            StampMode mode = m_state.GetCurrentTool() == Tool::Eraser
                ? StampMode::Erase : StampMode::Paint;
            Drawing::Stamp(m_buffer, x, y, m_state.GetBrushSize(), mode,
                           m_state.GetCurrentColor());
            m_lastX = x;
            m_lastY = y;
            break;
        }
        case Tool::Fill: {
            StatePatch patch;
            patch.isDrawing = true;
            m_state.Update(patch);

            Drawing::FloodFill(m_buffer, x, y, m_state.GetCurrentColor());
            break;
        }
        case Tool::Eyedropper: {
            // Sampling is not an edit and never enters the drawing state
            std::optional<Color> picked = Drawing::SampleColor(m_buffer, x, y);
            if (picked) {
                StatePatch patch;
                patch.currentColor = *picked;
                m_state.Update(patch);
            }
            break;
        }
        case Tool::Hand:
            // Panning is handled by the canvas panel
            break;
    }
}

void ToolController::Move(int x, int y) {
    if (!m_state.IsDrawing()) return;
    if (!m_buffer.Contains(x, y)) return;

    Tool tool = m_state.GetCurrentTool();
    if (tool != Tool::Pencil && tool != Tool::Eraser) return;

    StampMode mode = tool == Tool::Eraser ? StampMode::Erase : StampMode::Paint;
    Drawing::StrokeLine(m_buffer, m_lastX, m_lastY, x, y,
                        m_state.GetBrushSize(), mode,
                        m_state.GetCurrentColor());
    m_lastX = x;
    m_lastY = y;
}

ToolResult ToolController::End() {
    if (!m_state.IsDrawing()) return ToolResult::None;

    StatePatch patch;
    patch.isDrawing = false;
    m_state.Update(patch);
    return ToolResult::Commit;
}

} // namespace Kiseki
