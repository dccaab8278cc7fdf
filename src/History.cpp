#include "History.h"
#include <algorithm>

namespace Kiseki {

History::History(size_t maxEntries)
    : m_maxEntries(std::max<size_t>(1, maxEntries))
{
}

void History::Push(Snapshot snapshot) {
    m_undoStack.push_back(std::move(snapshot));

    if (m_undoStack.size() > m_maxEntries) {
        m_undoStack.erase(
            m_undoStack.begin(),
            m_undoStack.begin() + (m_undoStack.size() - m_maxEntries)
        );
    }

    // A new edit invalidates the redo branch
    m_redoStack.clear();
}

std::optional<Snapshot> History::Undo() {
    if (!CanUndo()) return std::nullopt;

    m_redoStack.push_back(std::move(m_undoStack.back()));
    m_undoStack.pop_back();
    return m_undoStack.back();
}

std::optional<Snapshot> History::Redo() {
    if (!CanRedo()) return std::nullopt;

    Snapshot snapshot = std::move(m_redoStack.back());
    m_redoStack.pop_back();
    m_undoStack.push_back(snapshot);
    return snapshot;
}

void History::Clear() {
    m_undoStack.clear();
    m_redoStack.clear();
}

std::optional<Snapshot> History::GetCurrent() const {
    if (m_undoStack.empty()) return std::nullopt;
    return m_undoStack.back();
}

} // namespace Kiseki
