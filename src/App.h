#pragma once

#include "EditorSession.h"
#include "EditorState.h"
#include "ImageIO.h"
#include "Keymap.h"
#include "UI.h"
#include "platform/Time.h"
#include "ViewportRenderer.h"
#include "render/GlTexture.h"
#include "Theme/Themes.h"
#include <memory>
#include <mutex>
#include <string>

// SDL includes for callback types
#include <SDL3/SDL_events.h>
#include <SDL3/SDL_init.h>

// Forward declarations
struct SDL_Window;

// SDL_GLContext is defined by SDL3, just forward declare the struct
struct SDL_GLContextState;
typedef struct SDL_GLContextState* SDL_GLContext;

// Custom deleters for SDL resources (RAII)
struct SDL_WindowDeleter {
    void operator()(SDL_Window* window) const;
};

struct SDL_GLContextDeleter {
    void operator()(SDL_GLContextState* context) const;
};

namespace Kiseki {

/**
 * Main application class.
 * Manages the window, the GL context and ImGui, and owns the editor
 * state, the session and the viewport renderer.
 */
class App {
public:
    App();
    ~App();

    /**
     * Initialize the application.
     * @param title Window title
     * @param width Window width
     * @param height Window height
     * @return true on success
     */
    bool Init(const std::string& title, int width, int height);

    /**
     * Per-frame iteration (called by SDL3 main callbacks).
     * @return SDL_APP_CONTINUE to keep running, SDL_APP_SUCCESS to quit
     */
    SDL_AppResult Iterate();

    /**
     * Handle a single SDL event (called by SDL3 main callbacks).
     * @param event The SDL event to process
     * @return SDL_APP_CONTINUE to keep running, SDL_APP_SUCCESS to quit
     */
    SDL_AppResult HandleEvent(SDL_Event* event);

    /**
     * Shutdown and cleanup. Saves preferences.
     */
    void Shutdown();

    void RequestQuit();

    /**
     * Queue a file for import on the next frame.
     * Safe to call from SDL dialog callbacks.
     */
    void QueueImport(const std::string& path);

    // Queue an export to path on the next frame
    void QueueExport(const std::string& path);

    /**
     * Write texture_<w>x<h>.png into the default export directory.
     */
    void ExportToDefaultDir();

    /**
     * Switch theme, restyle ImGui and update the checkerboard.
     * @param name Theme name (Dark, Light)
     */
    void SetTheme(const std::string& name);

    const Theme& GetTheme() const { return m_theme; }
    SDL_Window* GetWindow() const { return m_window.get(); }

    /**
     * Apply theme to ImGui style.
     */
    void ApplyTheme(const Theme& theme);

private:
    void Render();
    void ProcessPendingFiles();

    void SetupImGui();
    void ShutdownImGui();

    // SDL window and OpenGL context (owned via RAII smart pointers)
    std::unique_ptr<SDL_Window, SDL_WindowDeleter> m_window;
    std::unique_ptr<SDL_GLContextState, SDL_GLContextDeleter> m_glContext;

    // Core systems
    EditorState m_state;
    PngCodec m_codec;
    EditorSession m_session;
    ViewportRenderer m_viewRenderer;
    GlTexture m_texture;
    UI m_ui;
    KeymapManager m_keymap;
    Theme m_theme;
    EditorState::Unsubscribe m_unsubscribeRender;

    // Application state
    bool m_running;
    bool m_imguiInitialized;

    // Frame timing
    Platform::FrameClock m_frameClock;

    // File operations handed over from drops and dialogs
    std::mutex m_pendingMutex;
    std::string m_pendingImportPath;
    std::string m_pendingExportPath;
};

} // namespace Kiseki
