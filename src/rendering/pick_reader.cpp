/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/pick_reader.hpp"
#include "core/logger.hpp"
#include "pick_target.hpp"
#include <algorithm>
#include <cstdlib>
#include <fmt/format.h>
#include <vector>

namespace goop::rendering {

    PickSample classify_pick_sample(const core::Rgba8& rgba, const uint32_t tolerance) {
        if (rgba[3] < 255) {
            return {PickSample::Kind::Background, 0};
        }

        const uint32_t value = core::decode_id_rgba8(rgba);
        const core::Rgba8 clean = core::encode_id_rgba8(value);
        for (size_t c = 0; c < 3; ++c) {
            if (static_cast<uint32_t>(std::abs(static_cast<int>(rgba[c]) - static_cast<int>(clean[c]))) > tolerance) {
                return {PickSample::Kind::Ambiguous, 0};
            }
        }
        return {PickSample::Kind::Entity, value};
    }

    std::optional<CircleIndex> resolve_pick(const std::span<const core::Rgba8> samples,
                                            const size_t center,
                                            const PickOptions& options) {
        if (center >= samples.size()) {
            return std::nullopt;
        }

        const PickSample hit = classify_pick_sample(samples[center], options.tolerance);
        if (hit.kind != PickSample::Kind::Entity) {
            return std::nullopt;
        }

        for (size_t i = 0; i < samples.size(); ++i) {
            if (i == center)
                continue;
            const PickSample other = classify_pick_sample(samples[i], options.tolerance);
            if (other.kind == PickSample::Kind::Background)
                continue;
            if (other != hit) {
                LOG_TRACE("Pick rejected: neighbor sample disagrees with id {}", hit.value);
                return std::nullopt;
            }
        }
        return hit.value + options.index_base;
    }

    Result<void> PickTarget::resize(const glm::ivec2& size) {
        if (size.x <= 0 || size.y <= 0) {
            return std::unexpected(fmt::format("Invalid pick target size {}x{}", size.x, size.y));
        }
        if (fbo_ && size == size_) {
            return {};
        }

        auto tex_result = create_texture();
        if (!tex_result) {
            return std::unexpected(tex_result.error());
        }
        auto fbo_result = create_fbo();
        if (!fbo_result) {
            return std::unexpected(fbo_result.error());
        }

        glBindTexture(GL_TEXTURE_2D, tex_result->get());
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, size.x, size.y, 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glBindTexture(GL_TEXTURE_2D, 0);

        glBindFramebuffer(GL_FRAMEBUFFER, fbo_result->get());
        glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, tex_result->get(), 0);
        const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        if (status != GL_FRAMEBUFFER_COMPLETE) {
            return std::unexpected(fmt::format("Pick FBO incomplete: 0x{:x}", status));
        }

        color_ = std::move(*tex_result);
        fbo_ = std::move(*fbo_result);
        size_ = size;
        LOG_DEBUG("Pick target resized to {}x{}", size.x, size.y);
        return {};
    }

    PickReader::PickReader() = default;
    PickReader::~PickReader() = default;

    glm::ivec2 PickReader::size() const {
        return target_ ? target_->size() : glm::ivec2(0);
    }

    std::expected<void, std::string> PickReader::initialize(const glm::ivec2& size) {
        if (target_) {
            return {};
        }
        auto target = std::make_unique<PickTarget>();
        if (auto result = target->resize(size); !result) {
            LOG_ERROR("Failed to create pick target: {}", result.error());
            return result;
        }
        target_ = std::move(target);
        return {};
    }

    std::expected<void, std::string> PickReader::beginFrame(const glm::ivec2& size) {
        if (!target_) {
            return std::unexpected("PickReader not initialized");
        }
        if (auto result = target_->resize(size); !result) {
            return result;
        }

        glBindFramebuffer(GL_FRAMEBUFFER, target_->framebuffer());
        glViewport(0, 0, size.x, size.y);
        glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        return {};
    }

    void PickReader::endFrame() {
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
    }

    std::expected<std::optional<CircleIndex>, std::string> PickReader::pick(const glm::ivec2& window_px) const {
        if (!target_) {
            return std::unexpected("PickReader not initialized");
        }

        const glm::ivec2 size = target_->size();
        if (window_px.x < 0 || window_px.y < 0 || window_px.x >= size.x || window_px.y >= size.y) {
            return std::optional<CircleIndex>{};
        }

        // GL rows run bottom-up.
        const int cx = window_px.x;
        const int cy = size.y - 1 - window_px.y;
        const int r = static_cast<int>(options_.radius);
        const int x0 = std::max(cx - r, 0);
        const int y0 = std::max(cy - r, 0);
        const int x1 = std::min(cx + r, size.x - 1);
        const int y1 = std::min(cy + r, size.y - 1);
        const int w = x1 - x0 + 1;
        const int h = y1 - y0 + 1;

        std::vector<core::Rgba8> samples(static_cast<size_t>(w) * h);

        // Blocks until the id frame is complete.
        glFinish();

        GLint prev_read_fbo = 0;
        GLint prev_alignment = 4;
        glGetIntegerv(GL_READ_FRAMEBUFFER_BINDING, &prev_read_fbo);
        glGetIntegerv(GL_PACK_ALIGNMENT, &prev_alignment);

        glBindFramebuffer(GL_READ_FRAMEBUFFER, target_->framebuffer());
        glReadBuffer(GL_COLOR_ATTACHMENT0);
        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glReadPixels(x0, y0, w, h, GL_RGBA, GL_UNSIGNED_BYTE, samples.data());
        const GLenum err = glGetError();

        glPixelStorei(GL_PACK_ALIGNMENT, prev_alignment);
        glBindFramebuffer(GL_READ_FRAMEBUFFER, static_cast<GLuint>(prev_read_fbo));

        if (err != GL_NO_ERROR) {
            LOG_ERROR("glReadPixels failed: 0x{:x}", err);
            return std::unexpected(fmt::format("OpenGL error: 0x{:x}", err));
        }

        const size_t center = static_cast<size_t>(cy - y0) * w + static_cast<size_t>(cx - x0);
        const auto index = resolve_pick(samples, center, options_);
        if (index) {
            LOG_DEBUG("Picked circle {} at ({}, {})", *index, window_px.x, window_px.y);
        } else {
            LOG_TRACE("Nothing picked at ({}, {})", window_px.x, window_px.y);
        }
        return index;
    }

} // namespace goop::rendering
