/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <glm/glm.hpp>
#include <optional>
#include <string>

namespace goop::rendering {

    // 2D affine transforms as column-major homogeneous 3x3 matrices. A point (x, y)
    // is extended to (x, y, 1) before multiplication.

    glm::mat3 scale_transform(float sx, float sy);
    glm::mat3 translate_transform(float dx, float dy);

    // Applies `rhs` first, then `lhs`.
    glm::mat3 compose(const glm::mat3& lhs, const glm::mat3& rhs);

    std::optional<glm::mat3> inverse(const glm::mat3& m);

    glm::vec2 apply(const glm::mat3& m, const glm::vec2& point);

    // Axis-aligned rectangle in graph space.
    struct ViewRect {
        glm::vec2 min{0.0f};
        glm::vec2 max{1.0f};

        float width() const { return max.x - min.x; }
        float height() const { return max.y - min.y; }
    };

    // Maps `rect` onto (-1,-1)..(1,1), shrunk by `margin` around the center.
    glm::mat3 graph_to_game(const ViewRect& rect, float margin = 0.95f);

    // Maps (0,0)..bounds onto (-1,-1)..(1,1), shrunk by `margin`.
    glm::mat3 graph_to_game(const glm::vec2& bounds, float margin = 0.95f);

    // Squeezes game space along one axis so it keeps its aspect ratio inside the
    // viewport, centered. Aspects are width / height.
    glm::mat3 game_to_device(float game_aspect, float device_aspect);

    // Window pixels (origin top-left, y down) to normalized device coordinates.
    glm::mat3 window_to_device(float width, float height);

    /**
     * @brief The set of transforms for one view of the board
     *
     * Rebuilt whenever the view rectangle or the viewport changes, and left alone
     * for the duration of a frame.
     */
    class ViewTransform {
    public:
        static std::expected<ViewTransform, std::string> create(const ViewRect& view_rect,
                                                                const glm::ivec2& viewport_size,
                                                                float margin = 0.95f);

        const glm::mat3& graphToDevice() const { return graph_to_device_; }
        const glm::mat3& deviceToGraph() const { return device_to_graph_; }
        const glm::mat3& windowToGraph() const { return window_to_graph_; }
        const glm::ivec2& viewportSize() const { return viewport_size_; }
        const ViewRect& viewRect() const { return view_rect_; }

        glm::vec2 windowToGraph(const glm::vec2& window_px) const { return apply(window_to_graph_, window_px); }

    private:
        ViewTransform() = default;

        ViewRect view_rect_;
        glm::ivec2 viewport_size_{0};
        glm::mat3 graph_to_device_{1.0f};
        glm::mat3 device_to_graph_{1.0f};
        glm::mat3 window_to_graph_{1.0f};
    };

} // namespace goop::rendering
