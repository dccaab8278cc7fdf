#pragma once

namespace Kiseki {

class EditorState;
class RasterBuffer;

enum class ToolAction {
    Start,  // Pointer pressed on a cell
    Move,   // Pointer dragged to a cell
    End     // Pointer released
};

enum class ToolResult {
    None,
    Commit  // A stroke finished; the caller should capture a snapshot
};

/**
 * Applies the active tool to the raster buffer.
 * Drives the Idle -> Drawing -> Idle interaction through the state's
 * isDrawing flag and remembers the last stroke point for line joins.
 */
class ToolController {
public:
    ToolController(EditorState& state, RasterBuffer& buffer);

    /**
     * Handle one pointer action at cell (x, y).
     * Coordinates outside the grid are ignored for Start and Move;
     * End ignores them entirely.
     * @return Commit when a stroke ended, None otherwise
     */
    ToolResult Execute(ToolAction action, int x = 0, int y = 0);

    int GetLastX() const { return m_lastX; }
    int GetLastY() const { return m_lastY; }

private:
    void Start(int x, int y);
    void Move(int x, int y);
    ToolResult End();

    EditorState& m_state;
    RasterBuffer& m_buffer;
    int m_lastX;
    int m_lastY;
};

} // namespace Kiseki
