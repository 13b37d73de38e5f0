/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "board_renderer.hpp"
#include "core/logger.hpp"
#include "gl_state_guard.hpp"
#include <fmt/format.h>
#include <vector>

namespace goop::rendering {

    Result<void> BoardRenderer::initialize() {
        if (initialized_)
            return {};

        LOG_TIMER_TRACE("BoardRenderer::initialize");

        auto result = load_shader("board", "board.vert", "board.frag");
        if (!result) {
            LOG_ERROR("Failed to load board shader: {}", result.error().what());
            return std::unexpected(result.error().what());
        }
        shader_ = std::move(*result);

        auto vao_result = create_vao();
        if (!vao_result)
            return std::unexpected(vao_result.error());
        auto vbo_result = create_vbo();
        if (!vbo_result)
            return std::unexpected(vbo_result.error());
        vbo_ = std::move(*vbo_result);
        auto ebo_result = create_vbo();
        if (!ebo_result)
            return std::unexpected(ebo_result.error());
        ebo_ = std::move(*ebo_result);

        VAOBuilder builder(std::move(*vao_result));
        builder.attachVBO(vbo_)
            .setAttribute({.index = 0,
                           .size = 2,
                           .type = GL_FLOAT,
                           .normalized = GL_FALSE,
                           .stride = sizeof(glm::vec2),
                           .offset = nullptr,
                           .divisor = 0});
        builder.attachEBO(ebo_);
        vao_ = builder.build();

        initialized_ = true;
        LOG_DEBUG("BoardRenderer initialized");
        return {};
    }

    Result<void> BoardRenderer::uploadBoard(const core::SquareBoard& board) {
        if (index_count_ > 0 && board.rows() == rows_ && board.cols() == cols_)
            return {};

        const std::vector<glm::vec2> endpoints = board.endpoints();
        std::vector<uint32_t> indices;
        for (const auto& segment : board.boundary_segments()) {
            indices.push_back(segment.start);
            indices.push_back(segment.end);
        }

        VAOBinder vao_bind(vao_);
        BufferBinder<GL_ARRAY_BUFFER> bind(vbo_);
        upload_buffer<GL_ARRAY_BUFFER>(std::span<const glm::vec2>(endpoints), GL_STATIC_DRAW);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo_.get());
        upload_buffer<GL_ELEMENT_ARRAY_BUFFER>(std::span<const uint32_t>(indices), GL_STATIC_DRAW);

        rows_ = board.rows();
        cols_ = board.cols();
        index_count_ = static_cast<GLsizei>(indices.size());
        return {};
    }

    Result<void> BoardRenderer::render(const core::SquareBoard& board,
                                       const ViewTransform& view,
                                       const BoardStyle& style) {
        if (!initialized_)
            return std::unexpected("Board renderer not initialized");
        if (board.nodes() == 0)
            return {};

        GLStateGuard state_guard;

        if (auto result = uploadBoard(board); !result)
            return result;

        glLineWidth(style.line_width);

        ShaderScope s(shader_);
        if (auto result = s->set("u_graph_to_device", view.graphToDevice()); !result)
            return result;
        if (auto result = s->set("u_color", style.line_color); !result)
            return result;

        VAOBinder vao_bind(vao_);
        glDrawElements(GL_LINES, index_count_, GL_UNSIGNED_INT, nullptr);

        if (const GLenum err = glGetError(); err != GL_NO_ERROR) {
            return std::unexpected(fmt::format("OpenGL error: 0x{:x}", err));
        }
        return {};
    }

} // namespace goop::rendering
