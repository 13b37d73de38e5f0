/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/square_board.hpp"
#include "rendering/circle_atlas.hpp"
#include "rendering/goop_geometry.hpp"
#include "rendering/pick_reader.hpp"
#include "rendering/view_transform.hpp"
#include <expected>
#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace goop::rendering {

    template <typename T>
    using Result = std::expected<T, std::string>;

    struct BoardStyle {
        glm::vec4 line_color{0.55f, 0.55f, 0.6f, 1.0f};
        float line_width = 2.0f;
        glm::vec4 background{0.08f, 0.08f, 0.1f, 1.0f};
    };

    struct AtlasSettings {
        GeometryOptions geometry;
        OutOfRangePolicy policy = OutOfRangePolicy::Discard;
    };

    class RenderingEngine {
    public:
        static std::unique_ptr<RenderingEngine> create();

        virtual ~RenderingEngine() = default;

        // Requires a current GL context.
        virtual Result<void> initialize() = 0;
        virtual void shutdown() = 0;
        virtual bool isInitialized() const = 0;

        virtual void setAtlasSettings(const AtlasSettings& settings) = 0;
        virtual const AtlasSettings& atlasSettings() const = 0;

        virtual void setPickOptions(const PickOptions& options) = 0;

        // Clears the default framebuffer to the style's background.
        virtual Result<void> beginFrame(const ViewTransform& view, const BoardStyle& style) = 0;

        virtual Result<void> renderBoard(const core::SquareBoard& board,
                                         const ViewTransform& view,
                                         const BoardStyle& style = {}) = 0;

        // `cells` holds one entry per board node.
        virtual Result<void> renderFill(std::span<const FillState> cells,
                                        const core::SquareBoard& board,
                                        const ViewTransform& view) = 0;

        // Draws every node's id circle into the off-screen pick target.
        virtual Result<void> renderPickFrame(const core::SquareBoard& board,
                                             const ViewTransform& view,
                                             const glm::ivec2& viewport_size) = 0;

        // Node under `window_px` in the last pick frame, if any.
        virtual Result<std::optional<CircleIndex>> pick(const glm::ivec2& window_px) = 0;
    };

} // namespace goop::rendering
