/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/id_codec.hpp"
#include "rendering/circle_atlas.hpp"
#include <cstdint>
#include <expected>
#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace goop::rendering {

    // One texel of the id target, interpreted.
    struct PickSample {
        enum class Kind {
            Background, // Nothing drawn here (alpha below full)
            Ambiguous,  // Drawn, but not a clean id color, e.g. a blended edge
            Entity
        };

        Kind kind = Kind::Background;
        uint32_t value = 0; // Decoded id; meaningful for Entity only

        bool operator==(const PickSample&) const = default;
    };

    // `tolerance` is the largest per-channel difference, in 8-bit steps, between the
    // sample and the clean encoding of the id it decodes to.
    PickSample classify_pick_sample(const core::Rgba8& rgba, uint32_t tolerance);

    struct PickOptions {
        uint32_t tolerance = 2;
        uint32_t radius = 0;
        uint32_t index_base = 0;
    };

    // Resolves a block of samples to at most one circle. The sample at `center` must
    // be an entity, and every other non-background sample must agree with it.
    std::optional<CircleIndex> resolve_pick(std::span<const core::Rgba8> samples,
                                            size_t center,
                                            const PickOptions& options);

    class PickTarget;

    /**
     * @brief Reads circle ids back from the off-screen id target
     *
     * pick() blocks until every queued GL command has completed, then reads the
     * texels around the requested window pixel. It runs on the thread that owns the
     * GL context.
     */
    class PickReader {
    public:
        PickReader();
        ~PickReader();

        PickReader(const PickReader&) = delete;
        PickReader& operator=(const PickReader&) = delete;

        std::expected<void, std::string> initialize(const glm::ivec2& size);
        bool isInitialized() const { return target_ != nullptr; }

        // Resizes the target when `size` differs and binds it as the draw
        // framebuffer, cleared to transparent black.
        std::expected<void, std::string> beginFrame(const glm::ivec2& size);
        void endFrame();

        // Window pixel, origin top-left. Out-of-bounds pixels pick nothing.
        std::expected<std::optional<CircleIndex>, std::string> pick(const glm::ivec2& window_px) const;

        void setOptions(const PickOptions& options) { options_ = options; }
        const PickOptions& options() const { return options_; }

        glm::ivec2 size() const;

    private:
        std::unique_ptr<PickTarget> target_;
        PickOptions options_;
    };

} // namespace goop::rendering
