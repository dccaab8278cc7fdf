// Enable SDL3 main callbacks - SDL owns the event loop
#define SDL_MAIN_USE_CALLBACKS 1

#include "App.h"
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <exception>
#include <memory>

/**
 * SDL3 callback: Application initialization.
 * Called once at startup before any other callbacks.
 */
SDL_AppResult SDL_AppInit(void** appstate, int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    try {
        auto app = std::make_unique<Kiseki::App>();
        if (!app->Init("Kiseki", 1280, 800)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Failed to initialize application");
            return SDL_APP_FAILURE;
        }
        *appstate = app.release();
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Startup failed: %s", e.what());
        return SDL_APP_FAILURE;
    }

    return SDL_APP_CONTINUE;
}

/**
 * SDL3 callback: Per-frame iteration.
 */
SDL_AppResult SDL_AppIterate(void* appstate) {
    Kiseki::App* app = static_cast<Kiseki::App*>(appstate);
    return app->Iterate();
}

/**
 * SDL3 callback: Event handling.
 * Called for each SDL event before the next iteration.
 */
SDL_AppResult SDL_AppEvent(void* appstate, SDL_Event* event) {
    Kiseki::App* app = static_cast<Kiseki::App*>(appstate);
    return app->HandleEvent(event);
}

/**
 * SDL3 callback: Application shutdown.
 * Called once when the app is terminating.
 */
void SDL_AppQuit(void* appstate, SDL_AppResult result) {
    (void)result;

    if (appstate) {
        Kiseki::App* app = static_cast<Kiseki::App*>(appstate);
        app->Shutdown();
        delete app;
    }
}
