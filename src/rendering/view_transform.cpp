/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/view_transform.hpp"
#include "core/logger.hpp"
#include <cmath>
#include <fmt/format.h>

namespace goop::rendering {

    glm::mat3 scale_transform(const float sx, const float sy) {
        glm::mat3 m(1.0f);
        m[0][0] = sx;
        m[1][1] = sy;
        return m;
    }

    glm::mat3 translate_transform(const float dx, const float dy) {
        glm::mat3 m(1.0f);
        m[2][0] = dx;
        m[2][1] = dy;
        return m;
    }

    glm::mat3 compose(const glm::mat3& lhs, const glm::mat3& rhs) {
        return lhs * rhs;
    }

    std::optional<glm::mat3> inverse(const glm::mat3& m) {
        const float det = glm::determinant(m);
        if (det == 0.0f || !std::isfinite(det)) {
            return std::nullopt;
        }
        return glm::inverse(m);
    }

    glm::vec2 apply(const glm::mat3& m, const glm::vec2& point) {
        const glm::vec3 h = m * glm::vec3(point, 1.0f);
        return {h.x / h.z, h.y / h.z};
    }

    glm::mat3 graph_to_game(const ViewRect& rect, const float margin) {
        const glm::mat3 to_unit_square = compose(translate_transform(-1.0f, -1.0f),
                                                 compose(scale_transform(2.0f / rect.width(), 2.0f / rect.height()),
                                                         translate_transform(-rect.min.x, -rect.min.y)));
        return compose(scale_transform(margin, margin), to_unit_square);
    }

    glm::mat3 graph_to_game(const glm::vec2& bounds, const float margin) {
        return graph_to_game(ViewRect{glm::vec2(0.0f), bounds}, margin);
    }

    glm::mat3 game_to_device(const float game_aspect, const float device_aspect) {
        if (device_aspect > game_aspect) {
            // Window wider than the game: pillarbox.
            return scale_transform(game_aspect / device_aspect, 1.0f);
        }
        // Game wider than the window: letterbox.
        return scale_transform(1.0f, device_aspect / game_aspect);
    }

    glm::mat3 window_to_device(const float width, const float height) {
        return compose(translate_transform(-1.0f, 1.0f),
                       scale_transform(2.0f / width, -2.0f / height));
    }

    std::expected<ViewTransform, std::string> ViewTransform::create(const ViewRect& view_rect,
                                                                    const glm::ivec2& viewport_size,
                                                                    const float margin) {
        if (!(view_rect.width() > 0.0f) || !(view_rect.height() > 0.0f)) {
            return std::unexpected(fmt::format("Degenerate view rectangle ({}, {})..({}, {})",
                                               view_rect.min.x, view_rect.min.y, view_rect.max.x, view_rect.max.y));
        }
        if (viewport_size.x <= 0 || viewport_size.y <= 0) {
            return std::unexpected(fmt::format("Invalid viewport size {}x{}", viewport_size.x, viewport_size.y));
        }
        if (!(margin > 0.0f)) {
            return std::unexpected(fmt::format("Invalid view margin {}", margin));
        }

        const float game_aspect = view_rect.width() / view_rect.height();
        const float device_aspect = static_cast<float>(viewport_size.x) / static_cast<float>(viewport_size.y);

        ViewTransform view;
        view.view_rect_ = view_rect;
        view.viewport_size_ = viewport_size;
        view.graph_to_device_ = compose(game_to_device(game_aspect, device_aspect), graph_to_game(view_rect, margin));

        const auto device_to_graph = inverse(view.graph_to_device_);
        if (!device_to_graph) {
            return std::unexpected("graph_to_device transform is not invertible");
        }
        view.device_to_graph_ = *device_to_graph;
        view.window_to_graph_ = compose(view.device_to_graph_,
                                        window_to_device(static_cast<float>(viewport_size.x),
                                                         static_cast<float>(viewport_size.y)));

        LOG_TRACE("View transform rebuilt for {}x{} viewport", viewport_size.x, viewport_size.y);
        return view;
    }

} // namespace goop::rendering
