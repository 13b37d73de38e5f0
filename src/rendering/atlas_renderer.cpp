/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "atlas_renderer.hpp"
#include "core/logger.hpp"
#include "gl_state_guard.hpp"
#include <fmt/format.h>

namespace goop::rendering {

    Result<void> AtlasRenderer::initialize() {
        if (initialized_) {
            LOG_WARN("AtlasRenderer already initialized!");
            return {};
        }

        LOG_TIMER_TRACE("AtlasRenderer::initialize");

        auto fill_result = load_shader("circle_atlas", "circle_atlas.vert", "circle_atlas.frag");
        if (!fill_result) {
            LOG_ERROR("Failed to load circle atlas shader: {}", fill_result.error().what());
            return std::unexpected(fill_result.error().what());
        }
        fill_shader_ = std::move(*fill_result);

        auto id_result = load_shader("id_atlas", "circle_atlas.vert", "id_atlas.frag");
        if (!id_result) {
            LOG_ERROR("Failed to load id atlas shader: {}", id_result.error().what());
            return std::unexpected(id_result.error().what());
        }
        id_shader_ = std::move(*id_result);

        auto vao_result = create_vao();
        if (!vao_result) {
            LOG_ERROR("Failed to create VAO: {}", vao_result.error());
            return std::unexpected(vao_result.error());
        }

        auto position_result = create_vbo();
        auto atlas_result = create_vbo();
        auto ebo_result = create_vbo();
        if (!position_result || !atlas_result || !ebo_result) {
            return std::unexpected("Failed to create atlas buffers");
        }
        position_vbo_ = std::move(*position_result);
        atlas_vbo_ = std::move(*atlas_result);
        ebo_ = std::move(*ebo_result);

        // a_position and a_atlas live in separate buffers: positions change only with
        // the board, atlas coordinates every frame.
        VAOBuilder builder(std::move(*vao_result));
        builder.attachVBO(position_vbo_)
            .setAttribute({.index = 0,
                           .size = 2,
                           .type = GL_FLOAT,
                           .normalized = GL_FALSE,
                           .stride = sizeof(glm::vec2),
                           .offset = nullptr,
                           .divisor = 0});
        builder.attachVBO(atlas_vbo_)
            .setAttribute({.index = 1,
                           .size = 2,
                           .type = GL_FLOAT,
                           .normalized = GL_FALSE,
                           .stride = sizeof(glm::vec2),
                           .offset = nullptr,
                           .divisor = 0});
        builder.attachEBO(ebo_);
        vao_ = builder.build();

        initialized_ = true;
        LOG_INFO("AtlasRenderer initialized successfully");
        return {};
    }

    Result<void> AtlasRenderer::prepareBoard(const core::SquareBoard& board, const GoopGeometryBuilder& builder) {
        const float fill_scale = builder.options().fill_scale;
        if (index_count_ > 0 && board.rows() == board_rows_ && board.cols() == board_cols_ &&
            fill_scale == board_fill_scale_) {
            return {};
        }

        auto squares = builder.buildSquares(board);
        if (!squares) {
            return std::unexpected(squares.error());
        }

        {
            VAOBinder vao_bind(vao_);
            BufferBinder<GL_ARRAY_BUFFER> bind(position_vbo_);
            upload_buffer<GL_ARRAY_BUFFER>(std::span<const glm::vec2>(squares->positions), GL_STATIC_DRAW);
            glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo_.get());
            upload_buffer<GL_ELEMENT_ARRAY_BUFFER>(std::span<const uint32_t>(squares->indices), GL_STATIC_DRAW);
        }

        board_rows_ = board.rows();
        board_cols_ = board.cols();
        board_fill_scale_ = fill_scale;
        index_count_ = static_cast<GLsizei>(squares->indices.size());
        vertex_count_ = squares->positions.size();

        LOG_DEBUG("Uploaded node squares for {}x{} board", board_rows_, board_cols_);
        return {};
    }

    Result<void> AtlasRenderer::draw(const ManagedShader& shader,
                                     const std::span<const glm::vec2> atlas,
                                     const ViewTransform& view,
                                     const AtlasSettings& settings) {
        if (atlas.size() != vertex_count_) {
            return std::unexpected(fmt::format("Atlas coordinates for {} vertices, board has {}",
                                               atlas.size(), vertex_count_));
        }

        {
            BufferBinder<GL_ARRAY_BUFFER> bind(atlas_vbo_);
            upload_buffer<GL_ARRAY_BUFFER>(atlas, GL_DYNAMIC_DRAW);
        }

        ShaderScope s(shader);
        if (auto result = s->set("u_graph_to_device", view.graphToDevice()); !result)
            return result;
        if (auto result = s->set("u_spacing", settings.geometry.spacing); !result)
            return result;
        if (auto result = s->set("u_index_base", static_cast<int>(settings.geometry.index_base)); !result)
            return result;
        if (auto result = s->set("u_sentinel", settings.policy == OutOfRangePolicy::Sentinel); !result)
            return result;

        VAOBinder vao_bind(vao_);
        glDrawElements(GL_TRIANGLES, index_count_, GL_UNSIGNED_INT, nullptr);

        if (const GLenum err = glGetError(); err != GL_NO_ERROR) {
            return std::unexpected(fmt::format("OpenGL error: 0x{:x}", err));
        }
        return {};
    }

    Result<void> AtlasRenderer::renderFill(const std::span<const FillState> cells,
                                           const core::SquareBoard& board,
                                           const ViewTransform& view,
                                           const AtlasSettings& settings) {
        if (!initialized_) {
            return std::unexpected("Renderer not initialized");
        }
        if (cells.size() != board.nodes()) {
            return std::unexpected(fmt::format("Fill state has {} cells, board has {} nodes",
                                               cells.size(), board.nodes()));
        }

        LOG_TIMER_TRACE("AtlasRenderer::renderFill");
        GLStateGuard state_guard;

        const GoopGeometryBuilder builder(settings.geometry);
        if (auto result = prepareBoard(board, builder); !result)
            return result;

        auto atlas = builder.buildFillAtlas(cells);
        if (!atlas)
            return std::unexpected(atlas.error());

        // Discarded fragments leave the board underneath visible.
        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glDisable(GL_DEPTH_TEST);

        return draw(fill_shader_, *atlas, view, settings);
    }

    Result<void> AtlasRenderer::renderIds(const core::SquareBoard& board,
                                          const ViewTransform& view,
                                          const AtlasSettings& settings) {
        if (!initialized_) {
            return std::unexpected("Renderer not initialized");
        }

        LOG_TIMER_TRACE("AtlasRenderer::renderIds");
        GLStateGuard state_guard;

        const GoopGeometryBuilder builder(settings.geometry);
        if (auto result = prepareBoard(board, builder); !result)
            return result;

        auto atlas = builder.buildPickAtlas(board.nodes());
        if (!atlas)
            return std::unexpected(atlas.error());

        // Ids must land in the target exactly as encoded.
        glDisable(GL_BLEND);
        glDisable(GL_MULTISAMPLE);
        glDisable(GL_DEPTH_TEST);

        return draw(id_shader_, *atlas, view, settings);
    }

} // namespace goop::rendering
