#pragma once

#include "Limits.h"
#include "Snapshot.h"
#include <optional>
#include <vector>

namespace Kiseki {

/**
 * Snapshot history for undo/redo.
 * The undo stack is oldest-first and its top is the current canvas
 * contents, so undo needs at least two entries. Restoring a returned
 * snapshot is the caller's job.
 */
class History {
public:
    explicit History(size_t maxEntries = Limits::MAX_HISTORY);

    /**
     * Append a snapshot.
     * Evicts the oldest entry above the limit and always clears redo.
     */
    void Push(Snapshot snapshot);

    /**
     * Step back one entry.
     * @return The new current snapshot, or std::nullopt if only the
     *         baseline remains
     */
    std::optional<Snapshot> Undo();

    /**
     * Re-apply the most recently undone entry.
     * @return The restored snapshot, or std::nullopt if nothing to redo
     */
    std::optional<Snapshot> Redo();

    void Clear();

    bool CanUndo() const { return m_undoStack.size() > 1; }
    bool CanRedo() const { return !m_redoStack.empty(); }

    size_t GetUndoCount() const { return m_undoStack.size(); }
    size_t GetRedoCount() const { return m_redoStack.size(); }
    size_t GetMaxEntries() const { return m_maxEntries; }

    // Oldest first
    const std::vector<Snapshot>& GetEntries() const { return m_undoStack; }

    // Top of the undo stack, std::nullopt when empty
    std::optional<Snapshot> GetCurrent() const;

private:
    std::vector<Snapshot> m_undoStack;
    std::vector<Snapshot> m_redoStack;
    size_t m_maxEntries;
};

} // namespace Kiseki
