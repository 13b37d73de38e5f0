/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "core/square_board.hpp"
#include "input/input_controller.hpp"
#include "rendering/rendering.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace goop::vis {

    class ViewerWindow;

    /**
     * @brief Interactive window showing one board and its goop
     *
     * Draws the board outline and the fill circles every frame. A left click renders
     * the id pass and logs the cell under the cursor.
     */
    class BoardViewer : public ViewerActions {
    public:
        explicit BoardViewer(const core::param::ViewerParameters& params);
        ~BoardViewer() override;

        BoardViewer(const BoardViewer&) = delete;
        BoardViewer& operator=(const BoardViewer&) = delete;

        // Runs until the window is closed.
        std::expected<void, std::string> run();

        // ViewerActions
        void requestPick(const glm::vec2& window_pos) override;
        void toggleDebugSentinel() override;
        void requestQuit() override;

        const core::SquareBoard& board() const { return board_; }
        std::span<const rendering::FillState> cells() const { return cells_; }

    private:
        std::expected<void, std::string> initialize();
        std::expected<void, std::string> updateView();
        std::expected<void, std::string> renderFrame();
        void pickAt(const glm::vec2& window_pos);

        core::param::ViewerParameters params_;
        core::SquareBoard board_;
        std::vector<rendering::FillState> cells_;

        std::unique_ptr<ViewerWindow> window_;
        std::unique_ptr<InputController> input_controller_;
        std::unique_ptr<rendering::RenderingEngine> engine_;
        std::optional<rendering::ViewTransform> view_;
        rendering::BoardStyle style_;

        std::optional<glm::vec2> pending_pick_;
    };

} // namespace goop::vis
