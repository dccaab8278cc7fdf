#pragma once

#include "../Theme/Themes.h"

namespace Kiseki {

class EditorSession;
class EditorState;
class ViewportRenderer;
class GlTexture;

/**
 * Canvas panel renderer and input handler.
 * Shows the display surface at the floored pan offset and turns mouse
 * input into cell-level pointer events, pans and wheel zooms.
 */
class CanvasPanel {
public:
    CanvasPanel();

    /**
     * Render the canvas panel into the current ImGui window region.
     * @param session Session receiving pointer and view operations
     * @param renderer Renderer holding the display surface
     * @param texture GPU mirror of the display surface
     * @param theme Active theme (viewport and cursor colors)
     */
    void Render(
        EditorSession& session,
        const ViewportRenderer& renderer,
        GlTexture& texture,
        const Theme& theme
    );

    // Hover state for the status bar
    bool isHoveringCanvas = false;
    int hoveredCellX = 0;
    int hoveredCellY = 0;

private:
    void HandleInput(EditorSession& session, float surfaceX, float surfaceY,
                     float surfaceW, float surfaceH);
    void DrawBrushCursor(const EditorState& state, float surfaceX,
                         float surfaceY, float surfaceW, float surfaceH,
                         const Theme& theme);

    float m_lastViewportW;
    float m_lastViewportH;

    bool m_isDrawingStroke;  // Left button stroke in progress
    bool m_isPanDrag;        // Pan gesture in progress
    int m_lastCellX;
    int m_lastCellY;
};

} // namespace Kiseki
