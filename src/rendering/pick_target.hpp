/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "gl_resources.hpp"
#include "rendering/rendering.hpp"
#include <glm/glm.hpp>

namespace goop::rendering {

    // Single-sample RGBA8 framebuffer holding one id color per covered pixel.
    class PickTarget {
    public:
        Result<void> resize(const glm::ivec2& size);

        GLuint framebuffer() const { return fbo_.get(); }
        const glm::ivec2& size() const { return size_; }

    private:
        FBO fbo_;
        Texture color_;
        glm::ivec2 size_{0};
    };

} // namespace goop::rendering
