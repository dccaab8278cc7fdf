#pragma once

#include "UI/CanvasPanel.h"
#include "Theme/Themes.h"
#include <string>
#include <vector>

namespace Kiseki {

class App;
class EditorSession;
class EditorState;
class ViewportRenderer;
class GlTexture;
class KeymapManager;

/**
 * Toast notification.
 */
struct Toast {
    std::string message;
    float remainingTime;
    enum class Type {
        Info, Success, Warning, Error
    } type;
};

/**
 * UI manager.
 * Lays out the tool panel, the canvas panel and the status bar, and
 * routes keyboard shortcuts to the session.
 */
class UI {
public:
    UI();

    /**
     * Render all UI panels.
     * @param app Application instance (theme, file operations)
     * @param session Editor session
     * @param renderer Viewport renderer holding the display surface
     * @param texture GPU mirror of the display surface
     * @param theme Active theme
     * @param keymap Keymap manager for input handling
     * @param deltaTime Frame delta time
     */
    void Render(
        App& app,
        EditorSession& session,
        const ViewportRenderer& renderer,
        GlTexture& texture,
        const Theme& theme,
        KeymapManager& keymap,
        float deltaTime
    );

    /**
     * Show a transient message in the corner of the window.
     * @param message Message text
     * @param type Message type
     * @param duration Seconds on screen
     */
    void ShowToast(
        const std::string& message,
        Toast::Type type = Toast::Type::Info,
        float duration = 3.0f
    );

    bool HasVisibleToasts() const { return !m_toasts.empty(); }

    // Canvas panel (contains all canvas-related state and rendering)
    CanvasPanel m_canvasPanel;

private:
    void HandleShortcuts(EditorSession& session, KeymapManager& keymap);
    void RenderToolsPanel(App& app, EditorSession& session,
                          const Theme& theme, KeymapManager& keymap);
    void RenderColorSettings(EditorSession& session);
    void RenderCanvasSettings(EditorSession& session);
    void RenderStatusBar(const EditorState& state);
    void RenderToasts(float deltaTime, const Theme& theme);
    void RenderResetConfirmation(EditorSession& session);

    void ShowImportDialog(App& app);
    void ShowExportDialog(App& app, const std::string& defaultName);

    // Sync the hex field with the current color unless it is being edited
    void SyncColorInput(const EditorState& state);

    std::vector<Toast> m_toasts;
    float m_toolsPanelWidth = 260.0f;
    float m_statusBarHeight = 28.0f;

    // Color editing
    char m_hexInput[16] = {};
    bool m_hexInputActive = false;
    bool m_hexInvalid = false;

    // Canvas size editing
    int m_resizeWidth = 16;
    int m_resizeHeight = 16;
    int m_lastGridWidth = 0;
    int m_lastGridHeight = 0;

    bool m_showResetConfirm = false;
};

} // namespace Kiseki
