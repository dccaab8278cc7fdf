#include "EditorState.h"
#include <algorithm>

namespace Kiseki {

const char* ToolName(Tool tool) {
    switch (tool) {
        case Tool::Pencil:     return "pencil";
        case Tool::Eraser:     return "eraser";
        case Tool::Fill:       return "fill";
        case Tool::Eyedropper: return "eyedropper";
        case Tool::Hand:       return "hand";
    }
    return "pencil";
}

std::optional<Tool> ToolFromName(const std::string& name) {
    static const Tool tools[] = {
        Tool::Pencil, Tool::Eraser, Tool::Fill, Tool::Eyedropper, Tool::Hand
    };
    for (Tool tool : tools) {
        if (name == ToolName(tool)) {
            return tool;
        }
    }
    return std::nullopt;
}

EditorState::EditorState()
    : m_width(Limits::DEFAULT_GRID_DIMENSION)
    , m_height(Limits::DEFAULT_GRID_DIMENSION)
    , m_zoom(Limits::DEFAULT_ZOOM)
    , m_panX(0.0f)
    , m_panY(0.0f)
    , m_currentColor(Color::FromHex("#38bdf8"))
    , m_currentTool(Tool::Pencil)
    , m_brushSize(Limits::MIN_BRUSH_SIZE)
    , m_settingsVisible(false)
    , m_isDrawing(false)
    , m_isPanning(false)
    , m_history(Limits::MAX_HISTORY)
    , m_nextSubscriberId(1)
    , m_notifyDepth(0)
    , m_needsCompaction(false)
{
}

void EditorState::Update(const StatePatch& patch) {
    if (patch.width) {
        m_width = std::clamp(*patch.width, Limits::MIN_GRID_DIMENSION,
                             Limits::MAX_GRID_DIMENSION);
    }
    if (patch.height) {
        m_height = std::clamp(*patch.height, Limits::MIN_GRID_DIMENSION,
                              Limits::MAX_GRID_DIMENSION);
    }
    if (patch.zoom) {
        m_zoom = std::clamp(*patch.zoom, Limits::MIN_ZOOM, Limits::MAX_ZOOM);
    }
    if (patch.panX) m_panX = *patch.panX;
    if (patch.panY) m_panY = *patch.panY;
    if (patch.currentColor) m_currentColor = *patch.currentColor;
    if (patch.currentTool) m_currentTool = *patch.currentTool;
    if (patch.brushSize) {
        m_brushSize = std::clamp(*patch.brushSize, Limits::MIN_BRUSH_SIZE,
                                 Limits::MAX_BRUSH_SIZE);
    }
    if (patch.settingsVisible) m_settingsVisible = *patch.settingsVisible;
    if (patch.isDrawing) m_isDrawing = *patch.isDrawing;
    if (patch.isPanning) m_isPanning = *patch.isPanning;

    Notify();
}

EditorState::Unsubscribe EditorState::Subscribe(Subscriber callback) {
    uint64_t id = m_nextSubscriberId++;
    m_subscribers.push_back({id, std::move(callback)});
    return [this, id]() { RemoveSubscriber(id); };
}

void EditorState::Notify() {
    m_notifyDepth++;

    // Entries appended by a callback sit past this count
    const size_t count = m_subscribers.size();
    for (size_t i = 0; i < count; ++i) {
        if (!m_subscribers[i].callback) continue;

        // The vector may reallocate if the callback subscribes
        Subscriber callback = m_subscribers[i].callback;
        callback(*this);
    }

    m_notifyDepth--;
    if (m_notifyDepth == 0 && m_needsCompaction) {
        CompactSubscribers();
    }
}

size_t EditorState::GetSubscriberCount() const {
    return static_cast<size_t>(std::count_if(
        m_subscribers.begin(), m_subscribers.end(),
        [](const SubscriberEntry& entry) { return bool(entry.callback); }
    ));
}

void EditorState::RemoveSubscriber(uint64_t id) {
    auto it = std::find_if(
        m_subscribers.begin(), m_subscribers.end(),
        [id](const SubscriberEntry& entry) { return entry.id == id; }
    );
    if (it == m_subscribers.end()) return;

    if (m_notifyDepth > 0) {
        // Indices must stay stable until the cycle ends
        it->callback = nullptr;
        m_needsCompaction = true;
    } else {
        m_subscribers.erase(it);
    }
}

void EditorState::CompactSubscribers() {
    m_subscribers.erase(
        std::remove_if(
            m_subscribers.begin(), m_subscribers.end(),
            [](const SubscriberEntry& entry) { return !entry.callback; }
        ),
        m_subscribers.end()
    );
    m_needsCompaction = false;
}

void EditorState::SaveHistory(Snapshot snapshot) {
    m_history.Push(std::move(snapshot));
    Notify();
}

std::optional<Snapshot> EditorState::PerformUndo() {
    return m_history.Undo();
}

std::optional<Snapshot> EditorState::PerformRedo() {
    return m_history.Redo();
}

} // namespace Kiseki
