/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "gl_resources.hpp"
#include "rendering/rendering.hpp"
#include "shader_manager.hpp"
#include <span>
#include <vector>

namespace goop::rendering {

    // Draws one square per board node through the circle atlas programs. The
    // visualization program shows fill; the id program writes node ids for picking.
    class AtlasRenderer {
    public:
        AtlasRenderer() = default;
        ~AtlasRenderer() = default;

        Result<void> initialize();
        bool isInitialized() const { return initialized_; }

        Result<void> renderFill(std::span<const FillState> cells,
                                const core::SquareBoard& board,
                                const ViewTransform& view,
                                const AtlasSettings& settings);

        Result<void> renderIds(const core::SquareBoard& board,
                               const ViewTransform& view,
                               const AtlasSettings& settings);

    private:
        // Rebuilds node squares when the board or square scale changed.
        Result<void> prepareBoard(const core::SquareBoard& board, const GoopGeometryBuilder& builder);

        Result<void> draw(const ManagedShader& shader,
                          std::span<const glm::vec2> atlas,
                          const ViewTransform& view,
                          const AtlasSettings& settings);

        ManagedShader fill_shader_;
        ManagedShader id_shader_;

        VAO vao_;
        VBO position_vbo_;
        VBO atlas_vbo_;
        VBO ebo_;

        uint32_t board_rows_ = 0;
        uint32_t board_cols_ = 0;
        float board_fill_scale_ = 0.0f;
        GLsizei index_count_ = 0;
        size_t vertex_count_ = 0;

        bool initialized_ = false;
    };

} // namespace goop::rendering
