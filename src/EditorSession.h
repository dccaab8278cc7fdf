#pragma once

#include "Color.h"
#include "EditorState.h"
#include "RasterBuffer.h"
#include "ToolController.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Kiseki {

class IImageCodec;

/**
 * Ties the editor together: owns the raster buffer and the tool
 * controller, borrows the state and the image codec.
 * Every user-level operation of the editor goes through here so that
 * snapshots, view fitting and notifications happen in the right order.
 */
class EditorSession {
public:
    EditorSession(EditorState& state, IImageCodec& codec);

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    /**
     * Size and clear the buffer to match the state and record the
     * baseline snapshot. History is reset.
     */
    void Initialize();

    // ========================================================================
    // Pointer input (cell coordinates)
    // ========================================================================

    void PointerDown(int x, int y);
    void PointerMove(int x, int y);

    // Finishes the stroke; records a snapshot if one was in progress
    void PointerUp();

    // ========================================================================
    // History
    // ========================================================================

    // @return true if a snapshot was restored
    bool Undo();
    bool Redo();

    // ========================================================================
    // Canvas operations
    // ========================================================================

    /**
     * Change the grid size, keeping the overlapping top-left region.
     * Dimensions are clamped to [1, 320]. Re-fits the view and records
     * a snapshot.
     */
    void ResizeCanvas(int width, int height);

    // Clear every cell to transparent and record a snapshot
    void ResetCanvas();

    /**
     * Replace the canvas with a decoded image.
     * Images larger than 320 on either axis are rejected and the state
     * is left unchanged.
     * @param outError Receives a user-facing message on failure
     * @return true on success
     */
    bool ImportImage(const std::vector<uint8_t>& bytes, std::string* outError);

    // Read a file and import it
    bool ImportFile(const std::string& path, std::string* outError);

    /**
     * Encode exactly width x height of the canvas.
     * @return Encoded bytes, or nullopt on failure
     */
    std::optional<std::vector<uint8_t>> ExportImage(std::string* outError) const;

    bool ExportFile(const std::string& path, std::string* outError) const;

    // "texture_<w>x<h>.png"
    std::string GetExportFileName() const;

    // ========================================================================
    // View
    // ========================================================================

    void SetViewportSize(float width, float height);

    /**
     * React to a viewport size change.
     * Sizes of 50 or less on either axis are ignored. The first usable
     * size fits the grid to the viewport; later ones only re-center.
     */
    void OnViewportResized(float width, float height);

    // Largest integer zoom that fits, centered. No-op before a viewport size
    void AutoFit();

    // Center the display surface without changing zoom
    void CenterView();

    void PanBy(float dx, float dy);

    /**
     * Zoom about a point so it stays under the pointer.
     * @param localX, localY Point relative to the display surface origin
     * @param factor Multiplier (1.1 zooms in, 0.9 zooms out)
     */
    void ZoomAt(float localX, float localY, float factor);

    // ========================================================================
    // Tool settings
    // ========================================================================

    void SetBrushSize(int size);
    void SetColor(const Color& color);

    // Re-selecting the active tool toggles the settings panel
    void SelectTool(Tool tool);

    // Switch tools without touching the settings panel (shortcuts)
    void SetTool(Tool tool);

    // Host-driven pan gesture flag
    void SetPanning(bool panning);

    const RasterBuffer& GetBuffer() const { return m_buffer; }
    const EditorState& GetState() const { return m_state; }
    float GetViewportWidth() const { return m_viewportWidth; }
    float GetViewportHeight() const { return m_viewportHeight; }
    bool HasFitted() const { return m_hasFitted; }

private:
    // Replace the buffer with a snapshot and sync the grid dimensions
    bool Restore(const Snapshot& snapshot);

    void Commit();

    EditorState& m_state;
    IImageCodec& m_codec;
    RasterBuffer m_buffer;
    ToolController m_tools;

    float m_viewportWidth;
    float m_viewportHeight;
    bool m_hasFitted;
};

} // namespace Kiseki
