#include "EditorSession.h"
#include "Coordinates.h"
#include "ImageIO.h"
#include "Limits.h"
#include "platform/Fs.h"
#include <SDL3/SDL.h>
#include <algorithm>

namespace Kiseki {

EditorSession::EditorSession(EditorState& state, IImageCodec& codec)
    : m_state(state)
    , m_codec(codec)
    , m_buffer(state.GetWidth(), state.GetHeight())
    , m_tools(state, m_buffer)
    , m_viewportWidth(0.0f)
    , m_viewportHeight(0.0f)
    , m_hasFitted(false)
{
}

void EditorSession::Initialize() {
    m_buffer.Resize(m_state.GetWidth(), m_state.GetHeight());
    m_buffer.Clear();

    m_state.ClearHistory();
    Commit();

    SDL_Log("Editor ready (%dx%d)", m_buffer.GetWidth(), m_buffer.GetHeight());
}

void EditorSession::Commit() {
    m_state.SaveHistory(Snapshot::Capture(m_buffer));
}

// ============================================================================
// Pointer input
// ============================================================================

void EditorSession::PointerDown(int x, int y) {
    if (m_tools.Execute(ToolAction::Start, x, y) == ToolResult::Commit) {
        Commit();
    }
    m_state.Notify();
}

void EditorSession::PointerMove(int x, int y) {
    if (!m_state.IsDrawing()) return;

    if (m_tools.Execute(ToolAction::Move, x, y) == ToolResult::Commit) {
        Commit();
    }
    m_state.Notify();
}

void EditorSession::PointerUp() {
    if (m_tools.Execute(ToolAction::End) == ToolResult::Commit) {
        Commit();
    }
}

// ============================================================================
// History
// ============================================================================

bool EditorSession::Restore(const Snapshot& snapshot) {
    if (!snapshot.RestoreInto(m_buffer)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Ignoring malformed history snapshot");
        return false;
    }

    // Notifies, which re-renders from the restored buffer
    StatePatch patch;
    patch.width = snapshot.GetWidth();
    patch.height = snapshot.GetHeight();
    m_state.Update(patch);
    return true;
}

bool EditorSession::Undo() {
    std::optional<Snapshot> snapshot = m_state.PerformUndo();
    if (!snapshot) return false;
    return Restore(*snapshot);
}

bool EditorSession::Redo() {
    std::optional<Snapshot> snapshot = m_state.PerformRedo();
    if (!snapshot) return false;
    return Restore(*snapshot);
}

// ============================================================================
// Canvas operations
// ============================================================================

void EditorSession::ResizeCanvas(int width, int height) {
    width = std::clamp(width, Limits::MIN_GRID_DIMENSION,
                       Limits::MAX_GRID_DIMENSION);
    height = std::clamp(height, Limits::MIN_GRID_DIMENSION,
                        Limits::MAX_GRID_DIMENSION);

    m_buffer.Resize(width, height);

    StatePatch patch;
    patch.width = width;
    patch.height = height;
    m_state.Update(patch);

    AutoFit();
    Commit();
}

void EditorSession::ResetCanvas() {
    m_buffer.Clear();
    Commit();
}

bool EditorSession::ImportImage(
    const std::vector<uint8_t>& bytes,
    std::string* outError
) {
    std::string decodeError;
    std::optional<DecodedImage> image = m_codec.Decode(bytes, &decodeError);
    if (!image) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Import failed: %s",
                    decodeError.c_str());
        if (outError) *outError = "Could not load image.";
        return false;
    }

    if (image->width > Limits::MAX_GRID_DIMENSION ||
        image->height > Limits::MAX_GRID_DIMENSION) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Import rejected: %dx%d exceeds %dx%d",
                    image->width, image->height,
                    Limits::MAX_GRID_DIMENSION, Limits::MAX_GRID_DIMENSION);
        if (outError) *outError = "Image too large! Maximum 320x320.";
        return false;
    }

    const int width = image->width;
    const int height = image->height;
    if (width < Limits::MIN_GRID_DIMENSION ||
        height < Limits::MIN_GRID_DIMENSION ||
        !m_buffer.Assign(width, height, std::move(image->pixels))) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Import failed: invalid image data (%dx%d)",
                    width, height);
        if (outError) *outError = "Could not load image.";
        return false;
    }

    StatePatch patch;
    patch.width = width;
    patch.height = height;
    m_state.Update(patch);

    AutoFit();
    Commit();

    SDL_Log("Imported %dx%d image", width, height);
    return true;
}

bool EditorSession::ImportFile(const std::string& path, std::string* outError) {
    auto bytes = Platform::ReadFile(path, Limits::MAX_IMPORT_FILE_SIZE);
    if (!bytes) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Could not read %s", path.c_str());
        if (outError) *outError = "Could not read file.";
        return false;
    }
    return ImportImage(*bytes, outError);
}

std::optional<std::vector<uint8_t>> EditorSession::ExportImage(
    std::string* outError
) const {
    const int width = m_state.GetWidth();
    const int height = m_state.GetHeight();

    std::string encodeError;
    auto bytes = m_codec.Encode(
        width, height, m_buffer.CopyRegion(width, height), &encodeError
    );
    if (!bytes) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Export failed: %s",
                     encodeError.c_str());
        if (outError) *outError = "Could not export image.";
        return std::nullopt;
    }
    return bytes;
}

bool EditorSession::ExportFile(
    const std::string& path,
    std::string* outError
) const {
    auto bytes = ExportImage(outError);
    if (!bytes) return false;

    if (!Platform::WriteFile(path, *bytes)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Could not write %s", path.c_str());
        if (outError) *outError = "Could not write file.";
        return false;
    }

    SDL_Log("Exported %s", path.c_str());
    return true;
}

std::string EditorSession::GetExportFileName() const {
    return "texture_" + std::to_string(m_state.GetWidth()) + "x" +
           std::to_string(m_state.GetHeight()) + ".png";
}

// ============================================================================
// View
// ============================================================================

void EditorSession::SetViewportSize(float width, float height) {
    m_viewportWidth = width;
    m_viewportHeight = height;
}

void EditorSession::OnViewportResized(float width, float height) {
    SetViewportSize(width, height);
    if (width <= Limits::MIN_USABLE_VIEWPORT ||
        height <= Limits::MIN_USABLE_VIEWPORT) {
        return;
    }

    if (!m_hasFitted) {
        AutoFit();
        m_hasFitted = true;
    } else {
        CenterView();
    }
}

void EditorSession::AutoFit() {
    if (m_viewportWidth <= 0.0f || m_viewportHeight <= 0.0f) return;

    ViewTransform view = Coordinates::CalculateFit(
        m_viewportWidth, m_viewportHeight,
        m_state.GetWidth(), m_state.GetHeight()
    );

    StatePatch patch;
    patch.zoom = view.zoom;
    patch.panX = view.panX;
    patch.panY = view.panY;
    m_state.Update(patch);
}

void EditorSession::CenterView() {
    if (m_viewportWidth <= 0.0f || m_viewportHeight <= 0.0f) return;

    int scale = Coordinates::DisplayScale(m_state.GetZoom());
    float panX = 0.0f;
    float panY = 0.0f;
    Coordinates::CenterPan(
        m_viewportWidth, m_viewportHeight,
        m_state.GetWidth() * scale, m_state.GetHeight() * scale,
        &panX, &panY
    );

    StatePatch patch;
    patch.panX = panX;
    patch.panY = panY;
    m_state.Update(patch);
}

void EditorSession::PanBy(float dx, float dy) {
    StatePatch patch;
    patch.panX = m_state.GetPanX() + dx;
    patch.panY = m_state.GetPanY() + dy;
    m_state.Update(patch);
}

void EditorSession::ZoomAt(float localX, float localY, float factor) {
    ViewTransform current;
    current.zoom = m_state.GetZoom();
    current.panX = m_state.GetPanX();
    current.panY = m_state.GetPanY();

    ViewTransform view = Coordinates::ZoomAtPoint(
        current, localX, localY, factor
    );

    StatePatch patch;
    patch.zoom = view.zoom;
    patch.panX = view.panX;
    patch.panY = view.panY;
    m_state.Update(patch);
}

// ============================================================================
// Tool settings
// ============================================================================

void EditorSession::SetBrushSize(int size) {
    StatePatch patch;
    patch.brushSize = size;
    m_state.Update(patch);
}

void EditorSession::SetColor(const Color& color) {
    StatePatch patch;
    patch.currentColor = color;
    m_state.Update(patch);
}

void EditorSession::SelectTool(Tool tool) {
    StatePatch patch;
    if (m_state.GetCurrentTool() == tool) {
        patch.settingsVisible = !m_state.IsSettingsVisible();
    } else {
        patch.currentTool = tool;
        patch.settingsVisible = true;
    }
    m_state.Update(patch);
}

void EditorSession::SetTool(Tool tool) {
    StatePatch patch;
    patch.currentTool = tool;
    m_state.Update(patch);
}

void EditorSession::SetPanning(bool panning) {
    if (m_state.IsPanning() == panning) return;

    StatePatch patch;
    patch.isPanning = panning;
    m_state.Update(patch);
}

} // namespace Kiseki
