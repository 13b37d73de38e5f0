/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "window/viewer_window.hpp"
#include "core/logger.hpp"
#include "input/input_controller.hpp"
#include <SDL3/SDL.h>
#include <glad/glad.h>

namespace goop::vis {

    namespace {
        struct ContextDeleter {
            void operator()(SDL_GLContextState* context) const { SDL_GL_DestroyContext(context); }
        };

        struct WindowDeleter {
            void operator()(SDL_Window* window) const { SDL_DestroyWindow(window); }
        };

        ViewerKey translate_key(const SDL_Keycode key) {
            switch (key) {
            case SDLK_ESCAPE:
                return ViewerKey::Quit;
            case SDLK_D:
                return ViewerKey::ToggleSentinel;
            default:
                return ViewerKey::Other;
            }
        }

        PointerButton translate_button(const Uint8 button) {
            switch (button) {
            case SDL_BUTTON_LEFT: return PointerButton::Primary;
            case SDL_BUTTON_RIGHT: return PointerButton::Secondary;
            default: return PointerButton::Other;
            }
        }

        std::unexpected<std::string> sdl_failure(const char* what) {
            return std::unexpected(fmt::format("{}: {}", what, SDL_GetError()));
        }
    } // namespace

    // Members are destroyed bottom-up: context, then window, then SDL itself.
    struct ViewerWindow::SdlHandles {
        struct VideoSubsystem {
            ~VideoSubsystem() { SDL_Quit(); }
        };

        std::unique_ptr<VideoSubsystem> video;
        std::unique_ptr<SDL_Window, WindowDeleter> window;
        std::unique_ptr<SDL_GLContextState, ContextDeleter> context;
    };

    ViewerWindow::ViewerWindow(const glm::ivec2 size)
        : sdl_(std::make_unique<SdlHandles>()),
          window_size_(size),
          framebuffer_size_(size) {
    }

    ViewerWindow::~ViewerWindow() = default;

    std::expected<std::unique_ptr<ViewerWindow>, std::string>
    ViewerWindow::open(const std::string& title, const glm::ivec2 size) {
        std::unique_ptr<ViewerWindow> self(new ViewerWindow(size));
        SdlHandles& sdl = *self->sdl_;

        if (!SDL_Init(SDL_INIT_VIDEO))
            return sdl_failure("SDL video init failed");
        sdl.video = std::make_unique<SdlHandles::VideoSubsystem>();

        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 4);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
        SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
        SDL_GL_SetAttribute(SDL_GL_MULTISAMPLEBUFFERS, 1);
        SDL_GL_SetAttribute(SDL_GL_MULTISAMPLESAMPLES, 4);

        constexpr SDL_WindowFlags flags =
            SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY | SDL_WINDOW_HIDDEN;
        sdl.window.reset(SDL_CreateWindow(title.c_str(), size.x, size.y, flags));
        if (!sdl.window)
            return sdl_failure("Cannot create window");

        sdl.context.reset(SDL_GL_CreateContext(sdl.window.get()));
        if (!sdl.context)
            return sdl_failure("Cannot create OpenGL 4.3 context");
        if (!SDL_GL_MakeCurrent(sdl.window.get(), sdl.context.get()))
            return sdl_failure("Cannot make the OpenGL context current");

        if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(SDL_GL_GetProcAddress)))
            return std::unexpected(std::string("Cannot load OpenGL functions"));

        LOG_INFO("OpenGL {} on {}",
                 reinterpret_cast<const char*>(glGetString(GL_VERSION)),
                 reinterpret_cast<const char*>(glGetString(GL_RENDERER)));

        if (!SDL_GL_SetSwapInterval(1))
            LOG_DEBUG("VSync unavailable: {}", SDL_GetError());

        self->refreshSize();
        return self;
    }

    void ViewerWindow::show() {
        SDL_ShowWindow(sdl_->window.get());
        SDL_RaiseWindow(sdl_->window.get());
    }

    void ViewerWindow::present() {
        SDL_GL_SwapWindow(sdl_->window.get());
    }

    bool ViewerWindow::refreshSize() {
        glm::ivec2 window{0};
        glm::ivec2 pixels{0};
        SDL_GetWindowSize(sdl_->window.get(), &window.x, &window.y);
        SDL_GetWindowSizeInPixels(sdl_->window.get(), &pixels.x, &pixels.y);

        window_size_ = window;
        const bool changed = pixels != framebuffer_size_;
        framebuffer_size_ = pixels;
        return changed;
    }

    glm::vec2 ViewerWindow::toFramebuffer(const glm::vec2& window_pos) const {
        if (window_size_.x <= 0 || window_size_.y <= 0)
            return window_pos;
        return window_pos * glm::vec2(framebuffer_size_) / glm::vec2(window_size_);
    }

    void ViewerWindow::pumpEvents(InputController* input) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_EVENT_QUIT || event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED) {
                close_requested_ = true;
                continue;
            }
            if (!input)
                continue;

            switch (event.type) {
            case SDL_EVENT_WINDOW_FOCUS_LOST:
                input->onFocusLost();
                break;
            case SDL_EVENT_MOUSE_MOTION:
                input->onPointerMove({event.motion.x, event.motion.y});
                break;
            case SDL_EVENT_MOUSE_BUTTON_DOWN:
            case SDL_EVENT_MOUSE_BUTTON_UP:
                input->onPointerButton(translate_button(event.button.button), event.button.down,
                                       {event.button.x, event.button.y});
                break;
            case SDL_EVENT_KEY_DOWN:
            case SDL_EVENT_KEY_UP:
                input->onKey(translate_key(event.key.key), event.key.down, event.key.repeat);
                break;
            default:
                break;
            }
        }
    }

} // namespace goop::vis
