#include "UI.h"
#include "App.h"
#include "Color.h"
#include "EditorSession.h"
#include "Keymap.h"
#include "Limits.h"
#include "ViewportRenderer.h"
#include "platform/Fs.h"
#include "platform/Paths.h"
#include <SDL3/SDL.h>
#include <imgui.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <memory>
#include <string>

namespace Kiseki {

// Swatches offered next to the color input
static const char* kPaletteColors[] = {
    "#000000", "#ffffff", "#ff0000", "#00ff00", "#0000ff",
    "#ffff00", "#ff00ff", "#00ffff", "#ffa500", "#800080",
    "#38bdf8", "#fbbf24", "#f87171", "#4ade80", "#a78bfa"
};

static const int kSizePresets[] = { 8, 16, 32, 64, 128 };

struct ToolButton {
    Tool tool;
    const char* label;
    const char* action;  // Keymap action
};

static const ToolButton kToolButtons[] = {
    { Tool::Pencil,     "Pencil",     "toolPencil" },
    { Tool::Eraser,     "Eraser",     "toolEraser" },
    { Tool::Fill,       "Fill",       "toolFill" },
    { Tool::Eyedropper, "Eyedropper", "toolEyedropper" },
    { Tool::Hand,       "Hand",       "toolHand" }
};

static ImVec4 ToImVec4(const Color& c) {
    return ImVec4(c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, c.a / 255.0f);
}

static bool ToolUsesColor(Tool tool) {
    return tool == Tool::Pencil || tool == Tool::Fill;
}

static bool ToolUsesBrush(Tool tool) {
    return tool == Tool::Pencil || tool == Tool::Eraser;
}

UI::UI() {
}

void UI::Render(
    App& app,
    EditorSession& session,
    const ViewportRenderer& renderer,
    GlTexture& texture,
    const Theme& theme,
    KeymapManager& keymap,
    float deltaTime
) {
    HandleShortcuts(session, keymap);

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImVec2 workPos = viewport->WorkPos;
    ImVec2 workSize = viewport->WorkSize;

    ImGuiWindowFlags panelFlags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoBringToFrontOnFocus;

    // Left: tools
    ImGui::SetNextWindowPos(workPos);
    ImGui::SetNextWindowSize(
        ImVec2(m_toolsPanelWidth, workSize.y - m_statusBarHeight)
    );
    ImGui::Begin("Kiseki/Tools", nullptr, panelFlags);
    RenderToolsPanel(app, session, theme, keymap);
    ImGui::End();

    // Center: canvas
    ImGui::SetNextWindowPos(ImVec2(workPos.x + m_toolsPanelWidth, workPos.y));
    ImGui::SetNextWindowSize(ImVec2(
        workSize.x - m_toolsPanelWidth, workSize.y - m_statusBarHeight
    ));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0, 0));
    ImGui::Begin("Kiseki/Canvas", nullptr,
                 panelFlags | ImGuiWindowFlags_NoScrollbar |
                 ImGuiWindowFlags_NoScrollWithMouse);
    ImGui::PopStyleVar();
    m_canvasPanel.Render(session, renderer, texture, theme);
    ImGui::End();

    // Bottom: status bar
    ImGui::SetNextWindowPos(
        ImVec2(workPos.x, workPos.y + workSize.y - m_statusBarHeight)
    );
    ImGui::SetNextWindowSize(ImVec2(workSize.x, m_statusBarHeight));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(8, 4));
    ImGui::Begin("Kiseki/Status", nullptr,
                 panelFlags | ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();
    RenderStatusBar(session.GetState());
    ImGui::End();

    RenderResetConfirmation(session);
    RenderToasts(deltaTime, theme);
}

void UI::ShowToast(
    const std::string& message,
    Toast::Type type,
    float duration
) {
    Toast toast;
    toast.message = message;
    toast.type = type;
    toast.remainingTime = duration;
    m_toasts.push_back(toast);
}

// ============================================================================
// Input
// ============================================================================

void UI::HandleShortcuts(EditorSession& session, KeymapManager& keymap) {
    // Text fields keep their keystrokes
    if (ImGui::GetIO().WantCaptureKeyboard) return;

    for (const auto& button : kToolButtons) {
        if (keymap.IsActionTriggered(button.action)) {
            session.SetTool(button.tool);
        }
    }

    if (keymap.IsActionTriggered("centerView")) {
        session.CenterView();
    }
    if (keymap.IsActionTriggered("undo")) {
        session.Undo();
    }
    if (keymap.IsActionTriggered("redo")) {
        session.Redo();
    }
}

// ============================================================================
// Tools panel
// ============================================================================

void UI::RenderToolsPanel(
    App& app,
    EditorSession& session,
    const Theme& theme,
    KeymapManager& keymap
) {
    const EditorState& state = session.GetState();

    ImGui::TextColored(ToImVec4(theme.accent), "KISEKI");
    ImGui::Separator();

    // Tool buttons
    ImGui::TextDisabled("Tools");
    for (const auto& button : kToolButtons) {
        bool active = state.GetCurrentTool() == button.tool;
        if (active) {
            ImGui::PushStyleColor(ImGuiCol_Button,
                                  ImGui::GetStyleColorVec4(ImGuiCol_ButtonActive));
        }
        if (ImGui::Button(button.label, ImVec2(-1, 0))) {
            session.SelectTool(button.tool);
        }
        if (active) {
            ImGui::PopStyleColor();
        }
        if (ImGui::IsItemHovered()) {
            std::string shortcut = keymap.GetBindingDisplayName(
                keymap.GetBinding(button.action)
            );
            ImGui::SetTooltip("%s (%s)", button.label, shortcut.c_str());
        }
    }

    // Contextual settings for the active tool
    Tool tool = state.GetCurrentTool();
    if (state.IsSettingsVisible() &&
        (ToolUsesColor(tool) || ToolUsesBrush(tool))) {
        ImGui::Spacing();
        ImGui::Separator();
        if (ToolUsesColor(tool)) {
            RenderColorSettings(session);
        }
        if (ToolUsesBrush(tool)) {
            int brushSize = state.GetBrushSize();
            ImGui::TextDisabled("Brush");
            ImGui::SetNextItemWidth(-1);
            if (ImGui::SliderInt("##brush", &brushSize,
                                 Limits::MIN_BRUSH_SIZE,
                                 Limits::MAX_BRUSH_SIZE, "%dpx")) {
                session.SetBrushSize(brushSize);
            }
        }
    }

    ImGui::Spacing();
    ImGui::Separator();
    RenderCanvasSettings(session);

    // History
    ImGui::Spacing();
    ImGui::Separator();
    ImGui::TextDisabled("History");
    const History& history = state.GetHistory();
    ImGui::BeginDisabled(!history.CanUndo());
    if (ImGui::Button("Undo")) {
        session.Undo();
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    ImGui::BeginDisabled(!history.CanRedo());
    if (ImGui::Button("Redo")) {
        session.Redo();
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    ImGui::TextDisabled("%zu / %zu", history.GetUndoCount(),
                        history.GetMaxEntries());

    // View
    ImGui::Spacing();
    ImGui::Separator();
    ImGui::TextDisabled("View");
    if (ImGui::Button("Fit")) {
        session.AutoFit();
    }
    ImGui::SameLine();
    if (ImGui::Button("Center")) {
        session.CenterView();
    }

    // Files
    ImGui::Spacing();
    ImGui::Separator();
    ImGui::TextDisabled("File");
    if (ImGui::Button("Import...", ImVec2(-1, 0))) {
        ShowImportDialog(app);
    }
    if (ImGui::Button("Export PNG", ImVec2(-1, 0))) {
        app.ExportToDefaultDir();
    }
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Save %s to %s",
                          session.GetExportFileName().c_str(),
                          Platform::GetDefaultExportDir().c_str());
    }
    if (ImGui::Button("Export As...", ImVec2(-1, 0))) {
        ShowExportDialog(app, session.GetExportFileName());
    }

    ImGui::Spacing();
    ImGui::Separator();
    const char* themeLabel = theme.isLight ? "Dark theme" : "Light theme";
    if (ImGui::Button(themeLabel, ImVec2(-1, 0))) {
        app.SetTheme(theme.isLight ? "Dark" : "Light");
    }
    if (ImGui::Button("Reset canvas", ImVec2(-1, 0))) {
        m_showResetConfirm = true;
    }
}

void UI::SyncColorInput(const EditorState& state) {
    if (m_hexInputActive) return;

    const Color& color = state.GetCurrentColor();
    std::string hex = color.ToHex(!color.IsOpaque());
    std::transform(hex.begin(), hex.end(), hex.begin(),
        [](unsigned char c) { return std::toupper(c); });
    snprintf(m_hexInput, sizeof(m_hexInput), "%s", hex.c_str());
    m_hexInvalid = false;
}

void UI::RenderColorSettings(EditorSession& session) {
    const EditorState& state = session.GetState();
    const Color& current = state.GetCurrentColor();

    ImGui::TextDisabled("Color");
    SyncColorInput(state);

    ImGui::ColorButton("##preview", ToImVec4(current),
                       ImGuiColorEditFlags_AlphaPreviewHalf, ImVec2(36, 36));
    ImGui::SameLine();

    ImGui::BeginGroup();
    if (m_hexInvalid) {
        ImGui::PushStyleColor(ImGuiCol_FrameBg, ImVec4(0.6f, 0.15f, 0.15f, 1.0f));
    }
    ImGui::SetNextItemWidth(-1);
    if (ImGui::InputText("##hex", m_hexInput, sizeof(m_hexInput))) {
        auto parsed = Color::ParseHex(m_hexInput);
        if (parsed) {
            session.SetColor(*parsed);
        }
        m_hexInvalid = !parsed.has_value();
    }
    if (m_hexInvalid) {
        ImGui::PopStyleColor();
    }
    m_hexInputActive = ImGui::IsItemActive();

    int alpha = current.a;
    ImGui::SetNextItemWidth(-1);
    if (ImGui::SliderInt("##alpha", &alpha, 0, 255, "Alpha %d")) {
        session.SetColor(current.WithAlpha(static_cast<uint8_t>(alpha)));
    }
    ImGui::EndGroup();

    // Palette swatches keep the current alpha
    const int perRow = 5;
    int index = 0;
    for (const char* hex : kPaletteColors) {
        Color swatch = Color::FromHex(hex);
        ImGui::PushID(index);
        if (ImGui::ColorButton(hex, ToImVec4(swatch),
                               ImGuiColorEditFlags_NoTooltip,
                               ImVec2(28, 28))) {
            session.SetColor(swatch.WithAlpha(current.a));
        }
        ImGui::PopID();
        if (++index % perRow != 0) {
            ImGui::SameLine();
        }
    }
}

void UI::RenderCanvasSettings(EditorSession& session) {
    const EditorState& state = session.GetState();

    // Follow external size changes (import, undo)
    if (state.GetWidth() != m_lastGridWidth ||
        state.GetHeight() != m_lastGridHeight) {
        m_lastGridWidth = state.GetWidth();
        m_lastGridHeight = state.GetHeight();
        m_resizeWidth = m_lastGridWidth;
        m_resizeHeight = m_lastGridHeight;
    }

    ImGui::TextDisabled("Canvas");
    ImGui::SetNextItemWidth(100);
    ImGui::InputInt("W", &m_resizeWidth, 0);
    ImGui::SameLine();
    ImGui::SetNextItemWidth(100);
    ImGui::InputInt("H", &m_resizeHeight, 0);

    for (size_t i = 0; i < sizeof(kSizePresets) / sizeof(kSizePresets[0]); ++i) {
        int size = kSizePresets[i];
        if (i > 0) ImGui::SameLine();
        ImGui::PushID(size);
        if (ImGui::SmallButton(std::to_string(size).c_str())) {
            m_resizeWidth = size;
            m_resizeHeight = size;
        }
        ImGui::PopID();
    }

    if (ImGui::Button("Square")) {
        int side = std::max(m_resizeWidth, m_resizeHeight);
        m_resizeWidth = side;
        m_resizeHeight = side;
    }
    ImGui::SameLine();
    if (ImGui::Button("Apply size")) {
        m_resizeWidth = std::clamp(m_resizeWidth, Limits::MIN_GRID_DIMENSION,
                                   Limits::MAX_GRID_DIMENSION);
        m_resizeHeight = std::clamp(m_resizeHeight, Limits::MIN_GRID_DIMENSION,
                                    Limits::MAX_GRID_DIMENSION);
        session.ResizeCanvas(m_resizeWidth, m_resizeHeight);
    }
}

// ============================================================================
// Status bar, toasts, confirmation
// ============================================================================

void UI::RenderStatusBar(const EditorState& state) {
    if (m_canvasPanel.isHoveringCanvas) {
        ImGui::Text("%d : %d", m_canvasPanel.hoveredCellX,
                    m_canvasPanel.hoveredCellY);
    } else {
        ImGui::TextDisabled("-- : --");
    }

    ImGui::SameLine(0, 20);
    ImGui::TextDisabled("|");
    ImGui::SameLine(0, 10);
    ImGui::Text("%d x %d", state.GetWidth(), state.GetHeight());

    // Default zoom displays as 100%
    ImGui::SameLine(0, 20);
    ImGui::TextDisabled("|");
    ImGui::SameLine(0, 10);
    int percent = static_cast<int>(
        std::round(state.GetZoom() * 100.0f / Limits::DEFAULT_ZOOM)
    );
    ImGui::Text("%d%%", percent);

    ImGui::SameLine(0, 20);
    ImGui::TextDisabled("|");
    ImGui::SameLine(0, 10);
    ImGui::TextDisabled("%s", ToolName(state.GetCurrentTool()));
}

void UI::RenderToasts(float deltaTime, const Theme& theme) {
    float yOffset = 20.0f;
    int index = 0;

    for (auto it = m_toasts.begin(); it != m_toasts.end(); ) {
        it->remainingTime -= deltaTime;

        if (it->remainingTime <= 0.0f) {
            it = m_toasts.erase(it);
            continue;
        }

        ImGuiViewport* viewport = ImGui::GetMainViewport();
        ImVec2 workPos = viewport->WorkPos;
        ImVec2 workSize = viewport->WorkSize;

        ImGui::SetNextWindowPos(
            ImVec2(workPos.x + workSize.x - 320, workPos.y + yOffset)
        );
        ImGui::SetNextWindowSize(ImVec2(300, 0));

        ImGuiWindowFlags flags =
            ImGuiWindowFlags_NoTitleBar |
            ImGuiWindowFlags_NoResize |
            ImGuiWindowFlags_NoMove |
            ImGuiWindowFlags_NoScrollbar |
            ImGuiWindowFlags_NoInputs |
            ImGuiWindowFlags_NoFocusOnAppearing;

        ImGui::Begin(("##toast" + std::to_string(index)).c_str(),
                     nullptr, flags);
        const Color& color = (it->type == Toast::Type::Error ||
                              it->type == Toast::Type::Warning)
            ? theme.toastError : theme.toastInfo;
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextColored(ToImVec4(color), "%s", it->message.c_str());
        ImGui::PopTextWrapPos();
        ImGui::End();

        yOffset += 60.0f;
        ++index;
        ++it;
    }
}

void UI::RenderResetConfirmation(EditorSession& session) {
    if (m_showResetConfirm) {
        ImGui::OpenPopup("Reset canvas?");
        m_showResetConfirm = false;
    }

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));

    if (ImGui::BeginPopupModal("Reset canvas?", nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Clear every pixel? This can be undone.");
        ImGui::Spacing();

        if (ImGui::Button("Reset", ImVec2(120, 0))) {
            session.ResetCanvas();
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(120, 0)) ||
            ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

// ============================================================================
// File dialogs
// ============================================================================

void UI::ShowImportDialog(App& app) {
    static const SDL_DialogFileFilter filters[] = {
        { "PNG Images", "png" }
    };

    // Callback may run on another thread; it only queues the path
    struct CallbackData {
        UI* ui;
        App* app;
    };

    auto dataPtr = std::make_unique<CallbackData>();
    dataPtr->ui = this;
    dataPtr->app = &app;

    SDL_ShowOpenFileDialog(
        [](void* userdata, const char* const* filelist, int filter) {
            (void)filter;
            std::unique_ptr<CallbackData> data(
                static_cast<CallbackData*>(userdata)
            );

            if (filelist == nullptr) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                             "Open dialog failed: %s", SDL_GetError());
                return;
            }
            if (filelist[0] == nullptr) {
                return;  // User canceled
            }

            data->app->QueueImport(filelist[0]);
        },
        dataPtr.release(),
        app.GetWindow(),
        filters, 1,
        nullptr,
        false
    );
}

void UI::ShowExportDialog(App& app, const std::string& defaultName) {
    static const SDL_DialogFileFilter filters[] = {
        { "PNG Images", "png" }
    };

    struct CallbackData {
        UI* ui;
        App* app;
    };

    auto dataPtr = std::make_unique<CallbackData>();
    dataPtr->ui = this;
    dataPtr->app = &app;

    std::string exportDir = Platform::GetDefaultExportDir();
    if (!Platform::EnsureDirectoryExists(exportDir)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Could not create export directory: %s", exportDir.c_str());
    }
    std::string defaultPath = Platform::JoinPath(exportDir, defaultName);

    SDL_ShowSaveFileDialog(
        [](void* userdata, const char* const* filelist, int filter) {
            (void)filter;
            std::unique_ptr<CallbackData> data(
                static_cast<CallbackData*>(userdata)
            );

            if (filelist == nullptr) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                             "Save dialog failed: %s", SDL_GetError());
                return;
            }
            if (filelist[0] == nullptr) {
                return;  // User canceled
            }

            // Ensure .png extension
            std::string path = filelist[0];
            if (path.size() < 4 || path.substr(path.size() - 4) != ".png") {
                path += ".png";
            }
            data->app->QueueExport(path);
        },
        dataPtr.release(),
        app.GetWindow(),
        filters, 1,
        defaultPath.c_str()
    );
}

} // namespace Kiseki
