#pragma once

#include "Color.h"
#include "History.h"
#include "Limits.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Kiseki {

// ============================================================================
// Tools
// ============================================================================

enum class Tool {
    Pencil,
    Eraser,
    Fill,
    Eyedropper,
    Hand
};

// Lowercase identifier ("pencil", "eraser", ...)
const char* ToolName(Tool tool);

// Inverse of ToolName, std::nullopt for unknown names
std::optional<Tool> ToolFromName(const std::string& name);

// ============================================================================
// State
// ============================================================================

/**
 * Partial update for EditorState. Only engaged fields are applied.
 */
struct StatePatch {
    std::optional<int> width;
    std::optional<int> height;
    std::optional<float> zoom;
    std::optional<float> panX;
    std::optional<float> panY;
    std::optional<Color> currentColor;
    std::optional<Tool> currentTool;
    std::optional<int> brushSize;
    std::optional<bool> settingsVisible;
    std::optional<bool> isDrawing;
    std::optional<bool> isPanning;
};

/**
 * Single source of truth for the editor.
 * Every mutation goes through Update() (or the history calls) and notifies
 * subscribers synchronously, in registration order.
 * Subscribers must not outlive the state; the unsubscribe function
 * returned by Subscribe() must not be called after it is destroyed.
 */
class EditorState {
public:
    using Subscriber = std::function<void(const EditorState&)>;
    using Unsubscribe = std::function<void()>;

    EditorState();

    EditorState(const EditorState&) = delete;
    EditorState& operator=(const EditorState&) = delete;

    // Grid
    int GetWidth() const { return m_width; }
    int GetHeight() const { return m_height; }

    // View
    float GetZoom() const { return m_zoom; }
    float GetPanX() const { return m_panX; }
    float GetPanY() const { return m_panY; }

    // Tools
    const Color& GetCurrentColor() const { return m_currentColor; }
    Tool GetCurrentTool() const { return m_currentTool; }
    int GetBrushSize() const { return m_brushSize; }
    bool IsSettingsVisible() const { return m_settingsVisible; }

    // Interaction
    bool IsDrawing() const { return m_isDrawing; }
    bool IsPanning() const { return m_isPanning; }

    /**
     * Merge a patch into the state, clamping dimensions, zoom and brush
     * size into range, then notify every subscriber.
     */
    void Update(const StatePatch& patch);

    /**
     * Register a change callback.
     * Callbacks added during a notification are first called on the next
     * one; callbacks removed during a notification are not called again.
     * @return Function that removes the callback (safe to call twice)
     */
    Unsubscribe Subscribe(Subscriber callback);

    // Invoke every subscriber with the current state
    void Notify();

    size_t GetSubscriberCount() const;

    // ========================================================================
    // History
    // ========================================================================

    /**
     * Record a snapshot: push, evict above the limit, clear redo, notify.
     */
    void SaveHistory(Snapshot snapshot);

    /**
     * Step back. Does not notify; the caller restores and then notifies.
     * @return Snapshot to restore, std::nullopt if only the baseline remains
     */
    std::optional<Snapshot> PerformUndo();

    /**
     * Step forward. Does not notify; the caller restores and then notifies.
     * @return Snapshot to restore, std::nullopt if nothing was undone
     */
    std::optional<Snapshot> PerformRedo();

    const History& GetHistory() const { return m_history; }
    void ClearHistory() { m_history.Clear(); }

private:
    struct SubscriberEntry {
        uint64_t id;
        Subscriber callback;  // Empty once removed mid-notification
    };

    void RemoveSubscriber(uint64_t id);
    void CompactSubscribers();

    int m_width;
    int m_height;
    float m_zoom;
    float m_panX;
    float m_panY;
    Color m_currentColor;
    Tool m_currentTool;
    int m_brushSize;
    bool m_settingsVisible;
    bool m_isDrawing;
    bool m_isPanning;

    History m_history;

    std::vector<SubscriberEntry> m_subscribers;
    uint64_t m_nextSubscriberId;
    int m_notifyDepth;
    bool m_needsCompaction;
};

} // namespace Kiseki
