/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "rendering/rendering.hpp"
#include <glad/glad.h>
#include <span>
#include <utility>

namespace goop::rendering {

    // Move-only owner of a single GL object name.
    template <void (*Deleter)(GLuint)>
    class GLResource {
    public:
        GLResource() = default;
        explicit GLResource(const GLuint id) : id_(id) {}
        ~GLResource() { reset(); }

        GLResource(const GLResource&) = delete;
        GLResource& operator=(const GLResource&) = delete;

        GLResource(GLResource&& other) noexcept : id_(std::exchange(other.id_, 0)) {}
        GLResource& operator=(GLResource&& other) noexcept {
            if (this != &other) {
                reset();
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }

        GLuint get() const { return id_; }
        explicit operator bool() const { return id_ != 0; }

        void reset() {
            if (id_ != 0) {
                Deleter(id_);
                id_ = 0;
            }
        }

    private:
        GLuint id_ = 0;
    };

    namespace detail {
        inline void delete_vao(const GLuint id) { glDeleteVertexArrays(1, &id); }
        inline void delete_buffer(const GLuint id) { glDeleteBuffers(1, &id); }
        inline void delete_framebuffer(const GLuint id) { glDeleteFramebuffers(1, &id); }
        inline void delete_texture(const GLuint id) { glDeleteTextures(1, &id); }
    } // namespace detail

    using VAO = GLResource<detail::delete_vao>;
    using VBO = GLResource<detail::delete_buffer>;
    using FBO = GLResource<detail::delete_framebuffer>;
    using Texture = GLResource<detail::delete_texture>;

    Result<VAO> create_vao();
    Result<VBO> create_vbo();
    Result<FBO> create_fbo();
    Result<Texture> create_texture();

    struct VertexAttribute {
        GLuint index = 0;
        GLint size = 0;
        GLenum type = GL_FLOAT;
        GLboolean normalized = GL_FALSE;
        GLsizei stride = 0;
        const void* offset = nullptr;
        GLuint divisor = 0;

        void apply() const;
    };

    class VAOBinder {
    public:
        explicit VAOBinder(const VAO& vao) { glBindVertexArray(vao.get()); }
        ~VAOBinder() { glBindVertexArray(0); }
        VAOBinder(const VAOBinder&) = delete;
        VAOBinder& operator=(const VAOBinder&) = delete;
    };

    template <GLenum Target>
    class BufferBinder {
    public:
        explicit BufferBinder(const VBO& buffer) { glBindBuffer(Target, buffer.get()); }
        ~BufferBinder() { glBindBuffer(Target, 0); }
        BufferBinder(const BufferBinder&) = delete;
        BufferBinder& operator=(const BufferBinder&) = delete;
    };

    // Replaces the buffer store currently bound to `Target`.
    template <GLenum Target, typename T>
    void upload_buffer(const std::span<const T> data, const GLenum usage) {
        glBufferData(Target, static_cast<GLsizeiptr>(data.size_bytes()), data.data(), usage);
    }

    // Records buffers and attribute layouts into a VAO, then hands it back.
    class VAOBuilder {
    public:
        explicit VAOBuilder(VAO&& vao);
        ~VAOBuilder();

        VAOBuilder(const VAOBuilder&) = delete;
        VAOBuilder& operator=(const VAOBuilder&) = delete;

        template <typename T>
        VAOBuilder& attachVBO(const VBO& vbo, const std::span<const T> data, const GLenum usage) {
            glBindBuffer(GL_ARRAY_BUFFER, vbo.get());
            upload_buffer<GL_ARRAY_BUFFER>(data, usage);
            return *this;
        }

        VAOBuilder& attachVBO(const VBO& vbo);
        VAOBuilder& setAttribute(const VertexAttribute& attribute);

        template <typename T>
        VAOBuilder& attachEBO(const VBO& ebo, const std::span<const T> data, const GLenum usage) {
            glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo.get());
            upload_buffer<GL_ELEMENT_ARRAY_BUFFER>(data, usage);
            return *this;
        }

        VAOBuilder& attachEBO(const VBO& ebo);

        VAO build();

    private:
        VAO vao_;
    };

    Result<void> check_gl_error(const char* what);

} // namespace goop::rendering
