/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>

namespace goop::vis {

    // Keys the viewer reacts to; the window maps everything else to Other.
    enum class ViewerKey {
        Quit,
        ToggleSentinel,
        Other
    };

    enum class PointerButton {
        Primary,
        Secondary,
        Other
    };

    // What the viewer can be asked to do by user input.
    class ViewerActions {
    public:
        virtual ~ViewerActions() = default;

        // `window_pos` is in window coordinates, origin top-left.
        virtual void requestPick(const glm::vec2& window_pos) = 0;
        virtual void toggleDebugSentinel() = 0;
        virtual void requestQuit() = 0;
    };

    /**
     * @brief Turns pointer and key events into viewer actions
     *
     * A primary-button click picks at the release position. Key actions fire on the
     * first press only; auto-repeat is ignored.
     */
    class InputController {
    public:
        explicit InputController(ViewerActions& actions);

        void onPointerButton(PointerButton button, bool pressed, const glm::vec2& window_pos);
        void onPointerMove(const glm::vec2& window_pos);
        void onKey(ViewerKey key, bool pressed, bool repeat);
        void onFocusLost();

        const glm::vec2& pointer() const { return pointer_; }
        bool clickArmed() const { return click_armed_; }

    private:
        ViewerActions& actions_;
        glm::vec2 pointer_{0.0f};
        bool click_armed_ = false;
    };

} // namespace goop::vis
