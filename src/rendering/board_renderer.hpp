/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "gl_resources.hpp"
#include "rendering/rendering.hpp"
#include "shader_manager.hpp"

namespace goop::rendering {

    // Cell outlines of a square board, drawn as lines.
    class BoardRenderer {
    public:
        Result<void> initialize();
        bool isInitialized() const { return initialized_; }

        Result<void> render(const core::SquareBoard& board,
                            const ViewTransform& view,
                            const BoardStyle& style);

    private:
        Result<void> uploadBoard(const core::SquareBoard& board);

        ManagedShader shader_;
        VAO vao_;
        VBO vbo_;
        VBO ebo_;

        uint32_t rows_ = 0;
        uint32_t cols_ = 0;
        GLsizei index_count_ = 0;
        bool initialized_ = false;
    };

} // namespace goop::rendering
