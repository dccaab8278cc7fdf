#include "App.h"
#include "Preferences.h"
#include "platform/Fs.h"
#include "platform/Paths.h"
#include "platform/Time.h"
#include <SDL3/SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_opengl3.h>

#ifdef __APPLE__
#include <OpenGL/gl3.h>
#else
#include <GL/gl.h>
#endif

// SDL resource deleters implementation (outside namespace)
void SDL_WindowDeleter::operator()(SDL_Window* window) const {
    if (window) {
        SDL_DestroyWindow(window);
    }
}

void SDL_GLContextDeleter::operator()(SDL_GLContextState* context) const {
    if (context) {
        SDL_GL_DestroyContext(context);
    }
}

namespace Kiseki {

App::App()
    : m_session(m_state, m_codec)
    , m_running(false)
    , m_imguiInitialized(false)
{
}

App::~App() {
    Shutdown();
}

bool App::Init(const std::string& title, int width, int height) {
    // Initialize SDL (SDL3 returns bool, not int)
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "SDL_Init failed: %s", SDL_GetError());
        return false;
    }

    // OpenGL 3.3 Core Profile
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK,
        SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    // Create window
    m_window.reset(SDL_CreateWindow(
        title.c_str(),
        width, height,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY
    ));

    if (!m_window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Failed to create window: %s", SDL_GetError());
        return false;
    }

    SDL_SetWindowMinimumSize(m_window.get(), 800, 500);

    // Create OpenGL context
    m_glContext.reset(SDL_GL_CreateContext(m_window.get()));
    if (!m_glContext) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Failed to create GL context: %s", SDL_GetError());
        return false;
    }

    SDL_GL_MakeCurrent(m_window.get(), m_glContext.get());
    SDL_GL_SetSwapInterval(1);  // Enable VSync

    // Keep the display surface uploadable at any zoom
    GLint maxTextureSize = 0;
    glGetIntegerv(GL_MAX_TEXTURE_SIZE, &maxTextureSize);
    if (maxTextureSize > 0) {
        m_viewRenderer.SetMaxSurfaceSize(maxTextureSize);
    }

    // Load user preferences
    Preferences::Load();

    InitTheme(m_theme, Preferences::themeName);
    m_viewRenderer.SetCheckerColors(GetCheckerColors(m_theme));
    m_keymap.LoadBindings(Preferences::keymap);

    // Initialize ImGui
    SetupImGui();

    // Re-render the display surface on every state change
    m_unsubscribeRender = m_state.Subscribe(
        [this](const EditorState& state) {
            m_viewRenderer.Render(state, m_session.GetBuffer());
        }
    );

    // Restore tool settings, then record the baseline snapshot
    StatePatch patch;
    patch.brushSize = Preferences::brushSize;
    patch.currentColor = Color::FromHex(Preferences::lastColor);
    m_state.Update(patch);
    m_session.Initialize();

    m_running = true;
    m_frameClock.Reset();
    return true;
}

SDL_AppResult App::Iterate() {
    if (!m_running) {
        return SDL_APP_SUCCESS;
    }

    Render();
    return SDL_APP_CONTINUE;
}

SDL_AppResult App::HandleEvent(SDL_Event* event) {
    ImGui_ImplSDL3_ProcessEvent(event);

    switch (event->type) {
        case SDL_EVENT_QUIT:
            RequestQuit();
            break;

        case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
            if (event->window.windowID == SDL_GetWindowID(m_window.get())) {
                RequestQuit();
            }
            break;

        case SDL_EVENT_DROP_FILE:
            if (event->drop.data) {
                QueueImport(event->drop.data);
            }
            break;
    }

    return m_running ? SDL_APP_CONTINUE : SDL_APP_SUCCESS;
}

void App::Shutdown() {
    if (!m_window) return;

    // Remember tool settings for the next session. Skipped when Init
    // failed before preferences were read.
    if (Preferences::loaded) {
        Preferences::brushSize = m_state.GetBrushSize();
        const Color& color = m_state.GetCurrentColor();
        Preferences::lastColor = color.ToHex(!color.IsOpaque());
        Preferences::themeName = m_theme.name;
        if (!Preferences::Save()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Preferences were not saved");
        }
    }

    if (m_unsubscribeRender) {
        m_unsubscribeRender();
        m_unsubscribeRender = nullptr;
    }

    // GL objects must go before the context
    m_texture.Release();
    ShutdownImGui();

    // Context destroyed before window
    m_glContext.reset();
    m_window.reset();

    SDL_Quit();
}

void App::RequestQuit() {
    m_running = false;
}

void App::QueueImport(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pendingImportPath = path;
}

void App::QueueExport(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pendingExportPath = path;
}

void App::ProcessPendingFiles() {
    std::string importPath;
    std::string exportPath;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        importPath.swap(m_pendingImportPath);
        exportPath.swap(m_pendingExportPath);
    }

    if (!importPath.empty()) {
        std::string error;
        if (m_session.ImportFile(importPath, &error)) {
            m_ui.ShowToast("Imported " + std::to_string(m_state.GetWidth()) +
                           "x" + std::to_string(m_state.GetHeight()) + " image",
                           Toast::Type::Success);
        } else {
            m_ui.ShowToast(error, Toast::Type::Error);
        }
    }

    if (!exportPath.empty()) {
        std::string error;
        if (m_session.ExportFile(exportPath, &error)) {
            m_ui.ShowToast("Exported " + exportPath, Toast::Type::Success);
        } else {
            m_ui.ShowToast(error, Toast::Type::Error);
        }
    }
}

void App::ExportToDefaultDir() {
    std::string dir = Platform::GetDefaultExportDir();
    if (!Platform::EnsureDirectoryExists(dir)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Could not create %s", dir.c_str());
        m_ui.ShowToast("Could not create export folder.", Toast::Type::Error);
        return;
    }
    QueueExport(Platform::JoinPath(dir, m_session.GetExportFileName()));
}

void App::SetTheme(const std::string& name) {
    InitTheme(m_theme, name);
    ApplyTheme(m_theme);
    m_viewRenderer.SetCheckerColors(GetCheckerColors(m_theme));

    // Redraw with the new checkerboard
    m_state.Notify();
}

void App::Render() {
    float deltaTime = m_frameClock.Tick();

    ProcessPendingFiles();

    // Start ImGui frame
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();

    m_ui.Render(*this, m_session, m_viewRenderer, m_texture, m_theme,
                m_keymap, deltaTime);

    ImGui::Render();

    // Clear background
    ImGuiIO& io = ImGui::GetIO();
    glViewport(0, 0,
               static_cast<int>(io.DisplaySize.x * io.DisplayFramebufferScale.x),
               static_cast<int>(io.DisplaySize.y * io.DisplayFramebufferScale.y));
    const Color& bg = m_theme.viewportBackground;
    glClearColor(bg.r / 255.0f, bg.g / 255.0f, bg.b / 255.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    // Swap buffers
    SDL_GL_SwapWindow(m_window.get());
}

void App::SetupImGui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();

    // Preferences live in our own file
    io.IniFilename = nullptr;

    // Setup platform/renderer backends
    ImGui_ImplSDL3_InitForOpenGL(m_window.get(), m_glContext.get());
    ImGui_ImplOpenGL3_Init("#version 330");
    m_imguiInitialized = true;

    ApplyTheme(m_theme);
}

void App::ShutdownImGui() {
    if (!m_imguiInitialized) return;

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    m_imguiInitialized = false;
}

void App::ApplyTheme(const Theme& theme) {
    ImGuiStyle& style = ImGui::GetStyle();

    // Apply base ImGui theme based on brightness
    if (theme.isLight) {
        ImGui::StyleColorsLight();
    } else {
        ImGui::StyleColorsDark();
    }

    auto toVec4 = [](const Color& c, float alpha) {
        return ImVec4(c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, alpha);
    };

    // Accent colors for interactive elements
    style.Colors[ImGuiCol_Button] = toVec4(theme.accent, 0.35f);
    style.Colors[ImGuiCol_ButtonHovered] = toVec4(theme.accent, 0.6f);
    style.Colors[ImGuiCol_ButtonActive] = toVec4(theme.accent, 0.85f);
    style.Colors[ImGuiCol_SliderGrab] = toVec4(theme.accent, 0.8f);
    style.Colors[ImGuiCol_SliderGrabActive] = toVec4(theme.accent, 1.0f);
    style.Colors[ImGuiCol_CheckMark] = toVec4(theme.accent, 1.0f);
    style.Colors[ImGuiCol_Text] = toVec4(theme.textColor, 1.0f);

    style.WindowRounding = 0.0f;
    style.FrameRounding = 4.0f;
    style.GrabRounding = 4.0f;
}

} // namespace Kiseki
