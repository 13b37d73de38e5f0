/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "gl_resources.hpp"
#include "core/logger.hpp"
#include <fmt/format.h>

namespace goop::rendering {

    Result<VAO> create_vao() {
        GLuint id = 0;
        glGenVertexArrays(1, &id);
        if (id == 0) {
            return std::unexpected("glGenVertexArrays failed");
        }
        return VAO(id);
    }

    Result<VBO> create_vbo() {
        GLuint id = 0;
        glGenBuffers(1, &id);
        if (id == 0) {
            return std::unexpected("glGenBuffers failed");
        }
        return VBO(id);
    }

    Result<FBO> create_fbo() {
        GLuint id = 0;
        glGenFramebuffers(1, &id);
        if (id == 0) {
            return std::unexpected("glGenFramebuffers failed");
        }
        return FBO(id);
    }

    Result<Texture> create_texture() {
        GLuint id = 0;
        glGenTextures(1, &id);
        if (id == 0) {
            return std::unexpected("glGenTextures failed");
        }
        return Texture(id);
    }

    void VertexAttribute::apply() const {
        glEnableVertexAttribArray(index);
        glVertexAttribPointer(index, size, type, normalized, stride, offset);
        glVertexAttribDivisor(index, divisor);
    }

    VAOBuilder::VAOBuilder(VAO&& vao)
        : vao_(std::move(vao)) {
        glBindVertexArray(vao_.get());
    }

    VAOBuilder::~VAOBuilder() {
        glBindVertexArray(0);
        glBindBuffer(GL_ARRAY_BUFFER, 0);
    }

    VAOBuilder& VAOBuilder::attachVBO(const VBO& vbo) {
        glBindBuffer(GL_ARRAY_BUFFER, vbo.get());
        return *this;
    }

    VAOBuilder& VAOBuilder::setAttribute(const VertexAttribute& attribute) {
        attribute.apply();
        return *this;
    }

    VAOBuilder& VAOBuilder::attachEBO(const VBO& ebo) {
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo.get());
        return *this;
    }

    VAO VAOBuilder::build() {
        // Unbind the VAO before the array buffer so the EBO binding stays recorded.
        glBindVertexArray(0);
        glBindBuffer(GL_ARRAY_BUFFER, 0);
        return std::move(vao_);
    }

    Result<void> check_gl_error(const char* what) {
        if (const GLenum err = glGetError(); err != GL_NO_ERROR) {
            LOG_ERROR("{}: OpenGL error 0x{:x}", what, err);
            return std::unexpected(fmt::format("OpenGL error: 0x{:x}", err));
        }
        return {};
    }

} // namespace goop::rendering
