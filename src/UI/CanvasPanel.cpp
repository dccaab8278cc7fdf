#include "CanvasPanel.h"
#include "../Coordinates.h"
#include "../Drawing.h"
#include "../EditorSession.h"
#include "../ViewportRenderer.h"
#include "../render/GlTexture.h"
#include <imgui.h>

namespace Kiseki {

CanvasPanel::CanvasPanel()
    : m_lastViewportW(0.0f)
    , m_lastViewportH(0.0f)
    , m_isDrawingStroke(false)
    , m_isPanDrag(false)
    , m_lastCellX(-1)
    , m_lastCellY(-1)
{
}

void CanvasPanel::Render(
    EditorSession& session,
    const ViewportRenderer& renderer,
    GlTexture& texture,
    const Theme& theme
) {
    const EditorState& state = session.GetState();

    ImVec2 canvasPos = ImGui::GetCursorScreenPos();
    ImVec2 canvasSize = ImGui::GetContentRegionAvail();
    if (canvasSize.x < 1.0f || canvasSize.y < 1.0f) {
        return;
    }

    // Viewport resize drives fit/center
    if (canvasSize.x != m_lastViewportW || canvasSize.y != m_lastViewportH) {
        m_lastViewportW = canvasSize.x;
        m_lastViewportH = canvasSize.y;
        session.OnViewportResized(canvasSize.x, canvasSize.y);
    }

    // Reserve space for canvas
    ImGui::InvisibleButton(
        "canvas", canvasSize,
        ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonMiddle
    );

    // Sync the GPU copy of the display surface
    texture.Upload(
        renderer.GetSurfacePixels().data(),
        renderer.GetSurfaceWidth(), renderer.GetSurfaceHeight(),
        renderer.GetRevision()
    );

    int tx = 0;
    int ty = 0;
    ViewportRenderer::GetTranslation(state, &tx, &ty);

    float surfaceX = canvasPos.x + tx;
    float surfaceY = canvasPos.y + ty;
    // Drawn at display size; a capped surface is magnified here
    int displayW = 0;
    int displayH = 0;
    ViewportRenderer::GetDisplaySize(state, &displayW, &displayH);
    float surfaceW = static_cast<float>(displayW);
    float surfaceH = static_cast<float>(displayH);

    ImDrawList* drawList = ImGui::GetWindowDrawList();
    ImVec2 canvasMax(canvasPos.x + canvasSize.x, canvasPos.y + canvasSize.y);
    drawList->PushClipRect(canvasPos, canvasMax, true);

    drawList->AddRectFilled(canvasPos, canvasMax,
                            theme.viewportBackground.ToU32());

    if (texture.IsValid()) {
        drawList->AddImage(
            texture.GetImTextureID(),
            ImVec2(surfaceX, surfaceY),
            ImVec2(surfaceX + surfaceW, surfaceY + surfaceH)
        );
    }
    drawList->AddRect(
        ImVec2(surfaceX - 1.0f, surfaceY - 1.0f),
        ImVec2(surfaceX + surfaceW + 1.0f, surfaceY + surfaceH + 1.0f),
        theme.surfaceBorder.ToU32()
    );

    HandleInput(session, surfaceX, surfaceY, surfaceW, surfaceH);
    DrawBrushCursor(state, surfaceX, surfaceY, surfaceW, surfaceH, theme);

    drawList->PopClipRect();
}

void CanvasPanel::HandleInput(
    EditorSession& session,
    float surfaceX, float surfaceY,
    float surfaceW, float surfaceH
) {
    const EditorState& state = session.GetState();
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mousePos = ImGui::GetMousePos();
    bool hovered = ImGui::IsItemHovered();

    SurfaceRect surface;
    surface.x = surfaceX;
    surface.y = surfaceY;
    surface.w = surfaceW;
    surface.h = surfaceH;
    CellCoord cell = Coordinates::ScreenToCell(
        mousePos.x, mousePos.y, surface, state.GetWidth(), state.GetHeight()
    );

    isHoveringCanvas = hovered &&
        cell.x >= 0 && cell.x < state.GetWidth() &&
        cell.y >= 0 && cell.y < state.GetHeight();
    if (isHoveringCanvas) {
        hoveredCellX = cell.x;
        hoveredCellY = cell.y;
    }

    // Mouse wheel zoom about the pointer
    if (hovered && io.MouseWheel != 0.0f) {
        float factor = (io.MouseWheel > 0.0f) ? 1.1f : 0.9f;
        session.ZoomAt(mousePos.x - surfaceX, mousePos.y - surfaceY, factor);
    }

    // Start of a pan gesture: middle button, Alt+left, or the hand tool
    if (hovered && !m_isDrawingStroke) {
        bool middle = ImGui::IsMouseClicked(ImGuiMouseButton_Middle);
        bool leftPan = ImGui::IsMouseClicked(ImGuiMouseButton_Left) &&
            (io.KeyAlt || state.IsPanning() ||
             state.GetCurrentTool() == Tool::Hand);
        if (middle || leftPan) {
            m_isPanDrag = true;
            session.SetPanning(true);
        }
    }

    if (m_isPanDrag) {
        if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f) {
            session.PanBy(io.MouseDelta.x, io.MouseDelta.y);
        }
        if (!ImGui::IsMouseDown(ImGuiMouseButton_Left) &&
            !ImGui::IsMouseDown(ImGuiMouseButton_Middle)) {
            m_isPanDrag = false;
            session.SetPanning(false);
        }
        return;
    }

    // Left button drives the active tool
    if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
        m_isDrawingStroke = true;
        m_lastCellX = cell.x;
        m_lastCellY = cell.y;
        session.PointerDown(cell.x, cell.y);
    }

    if (m_isDrawingStroke) {
        if (cell.x != m_lastCellX || cell.y != m_lastCellY) {
            m_lastCellX = cell.x;
            m_lastCellY = cell.y;
            session.PointerMove(cell.x, cell.y);
        }

        // Releasing anywhere ends the stroke
        if (!ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
            m_isDrawingStroke = false;
            session.PointerUp();
        }
    }
}

void CanvasPanel::DrawBrushCursor(
    const EditorState& state,
    float surfaceX, float surfaceY,
    float surfaceW, float surfaceH,
    const Theme& theme
) {
    if (!isHoveringCanvas || m_isPanDrag) return;

    Tool tool = state.GetCurrentTool();
    if (tool == Tool::Hand || tool == Tool::Eyedropper) return;

    float cellW = surfaceW / state.GetWidth();
    float cellH = surfaceH / state.GetHeight();

    // Fill targets a single cell regardless of brush size
    int size = (tool == Tool::Fill) ? 1 : state.GetBrushSize();
    StampRect rect = Drawing::ComputeStampRect(
        hoveredCellX, hoveredCellY, size, state.GetWidth(), state.GetHeight()
    );
    if (rect.IsEmpty()) return;

    ImVec2 min(surfaceX + rect.x * cellW, surfaceY + rect.y * cellH);
    ImVec2 max(min.x + rect.w * cellW, min.y + rect.h * cellH);

    ImDrawList* drawList = ImGui::GetWindowDrawList();
    if (tool == Tool::Pencil) {
        drawList->AddRectFilled(min, max,
            state.GetCurrentColor().WithAlpha(96).ToU32());
    }
    drawList->AddRect(min, max, theme.brushOutline.ToU32(), 0.0f, 0, 1.5f);
}

} // namespace Kiseki
