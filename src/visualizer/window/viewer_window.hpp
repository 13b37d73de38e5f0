/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <glm/glm.hpp>
#include <memory>
#include <string>

struct SDL_Window;
struct SDL_GLContextState;

namespace goop::vis {

    class InputController;

    /**
     * @brief SDL3 window owning an OpenGL 4.3 core context
     *
     * open() initializes SDL video, creates the hidden window and context and loads
     * the GL entry points through glad. Everything is released in reverse order
     * when the window is destroyed.
     */
    class ViewerWindow {
    public:
        static std::expected<std::unique_ptr<ViewerWindow>, std::string>
        open(const std::string& title, glm::ivec2 size);

        ~ViewerWindow();

        ViewerWindow(const ViewerWindow&) = delete;
        ViewerWindow& operator=(const ViewerWindow&) = delete;

        void show();
        void present();

        // Drains the SDL event queue into `input`, which may be null.
        void pumpEvents(InputController* input);

        bool closeRequested() const { return close_requested_; }
        void requestClose() { close_requested_ = true; }

        // Re-reads both sizes; true when the framebuffer size changed.
        bool refreshSize();
        glm::ivec2 framebufferSize() const { return framebuffer_size_; }

        // Window coordinates to framebuffer pixels; they differ on high-density displays.
        glm::vec2 toFramebuffer(const glm::vec2& window_pos) const;

    private:
        struct SdlHandles;

        explicit ViewerWindow(glm::ivec2 size);

        std::unique_ptr<SdlHandles> sdl_;
        glm::ivec2 window_size_;
        glm::ivec2 framebuffer_size_;
        bool close_requested_ = false;
    };

} // namespace goop::vis
