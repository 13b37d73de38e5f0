/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glad/glad.h>

namespace goop::rendering {

    // Saves the pipeline state renderers touch and restores it on scope exit.
    class GLStateGuard {
    public:
        GLStateGuard() {
            glGetIntegerv(GL_CURRENT_PROGRAM, &program_);
            glGetIntegerv(GL_VERTEX_ARRAY_BINDING, &vao_);
            glGetIntegerv(GL_DRAW_FRAMEBUFFER_BINDING, &draw_fbo_);
            glGetIntegerv(GL_READ_FRAMEBUFFER_BINDING, &read_fbo_);
            glGetIntegerv(GL_VIEWPORT, viewport_);
            glGetFloatv(GL_LINE_WIDTH, &line_width_);
            glGetIntegerv(GL_BLEND_SRC_RGB, &blend_src_);
            glGetIntegerv(GL_BLEND_DST_RGB, &blend_dst_);
            blend_ = glIsEnabled(GL_BLEND);
            depth_test_ = glIsEnabled(GL_DEPTH_TEST);
            multisample_ = glIsEnabled(GL_MULTISAMPLE);
        }

        ~GLStateGuard() {
            glUseProgram(static_cast<GLuint>(program_));
            glBindVertexArray(static_cast<GLuint>(vao_));
            glBindFramebuffer(GL_DRAW_FRAMEBUFFER, static_cast<GLuint>(draw_fbo_));
            glBindFramebuffer(GL_READ_FRAMEBUFFER, static_cast<GLuint>(read_fbo_));
            glViewport(viewport_[0], viewport_[1], viewport_[2], viewport_[3]);
            glLineWidth(line_width_);
            glBlendFunc(static_cast<GLenum>(blend_src_), static_cast<GLenum>(blend_dst_));
            set_enabled(GL_BLEND, blend_);
            set_enabled(GL_DEPTH_TEST, depth_test_);
            set_enabled(GL_MULTISAMPLE, multisample_);
        }

        GLStateGuard(const GLStateGuard&) = delete;
        GLStateGuard& operator=(const GLStateGuard&) = delete;

    private:
        static void set_enabled(const GLenum cap, const GLboolean enabled) {
            if (enabled)
                glEnable(cap);
            else
                glDisable(cap);
        }

        GLint program_ = 0;
        GLint vao_ = 0;
        GLint draw_fbo_ = 0;
        GLint read_fbo_ = 0;
        GLint viewport_[4] = {};
        GLfloat line_width_ = 1.0f;
        GLint blend_src_ = GL_ONE;
        GLint blend_dst_ = GL_ZERO;
        GLboolean blend_ = GL_FALSE;
        GLboolean depth_test_ = GL_FALSE;
        GLboolean multisample_ = GL_FALSE;
    };

} // namespace goop::rendering
