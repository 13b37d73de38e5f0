/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "input/input_controller.hpp"
#include "core/logger.hpp"

namespace goop::vis {

    InputController::InputController(ViewerActions& actions)
        : actions_(actions) {
    }

    void InputController::onPointerButton(const PointerButton button, const bool pressed,
                                          const glm::vec2& window_pos) {
        pointer_ = window_pos;
        if (button != PointerButton::Primary)
            return;

        if (pressed) {
            click_armed_ = true;
            return;
        }
        if (!click_armed_)
            return;

        click_armed_ = false;
        LOG_TRACE("Click at ({:.1f}, {:.1f})", window_pos.x, window_pos.y);
        actions_.requestPick(window_pos);
    }

    void InputController::onPointerMove(const glm::vec2& window_pos) {
        pointer_ = window_pos;
    }

    void InputController::onKey(const ViewerKey key, const bool pressed, const bool repeat) {
        if (!pressed || repeat)
            return;

        switch (key) {
        case ViewerKey::Quit:
            actions_.requestQuit();
            break;
        case ViewerKey::ToggleSentinel:
            actions_.toggleDebugSentinel();
            break;
        case ViewerKey::Other:
            break;
        }
    }

    void InputController::onFocusLost() {
        click_armed_ = false;
    }

} // namespace goop::vis
