/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/goop_geometry.hpp"
#include "core/id_codec.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace goop::rendering {

    void push_corners(std::vector<glm::vec2>& out, const glm::vec2& center, const float half_size) {
        out.emplace_back(center.x + half_size, center.y + half_size);
        out.emplace_back(center.x - half_size, center.y + half_size);
        out.emplace_back(center.x - half_size, center.y - half_size);
        out.emplace_back(center.x + half_size, center.y - half_size);
    }

    GoopGeometryBuilder::GoopGeometryBuilder(const GeometryOptions& options)
        : options_(options) {
    }

    float GoopGeometryBuilder::fillHalfSize(const uint32_t fill) const {
        const uint32_t clamped = std::clamp<uint32_t>(fill, 1, options_.max_fill);
        return std::sqrt(static_cast<float>(options_.max_fill) / static_cast<float>(clamped));
    }

    std::expected<NodeSquares, std::string> GoopGeometryBuilder::buildSquares(const core::SquareBoard& board) const {
        const size_t nodes = board.nodes();
        if (nodes == 0) {
            return std::unexpected("Board has no nodes");
        }

        NodeSquares squares;
        squares.positions.reserve(nodes * 4);
        squares.indices.reserve(nodes * 6);

        const float half_size = board.radius() * options_.fill_scale;
        for (core::Node node = 0; node < nodes; ++node) {
            push_corners(squares.positions, board.center(node), half_size);

            const uint32_t base = node * 4;
            squares.indices.insert(squares.indices.end(),
                                   {base + 0, base + 1, base + 2,
                                    base + 2, base + 3, base + 0});
        }
        return squares;
    }

    std::expected<std::vector<glm::vec2>, std::string>
    GoopGeometryBuilder::buildFillAtlas(const std::span<const FillState> cells) const {
        std::vector<glm::vec2> atlas;
        atlas.reserve(cells.size() * 4);

        size_t clamped = 0;
        for (const auto& cell : cells) {
            if (cell && cell->fill > 0) {
                if (cell->fill > options_.max_fill)
                    ++clamped;
                const glm::vec2 center = AtlasFragmentShader::slot_center(cell->owner_index, options_.spacing);
                push_corners(atlas, center, fillHalfSize(cell->fill));
            } else {
                push_corners(atlas, emptyCenter(), 1.0f);
            }
        }

        if (clamped > 0) {
            LOG_WARN("{} cells exceed max fill {}; drawn as full", clamped, options_.max_fill);
        }
        return atlas;
    }

    std::expected<std::vector<glm::vec2>, std::string>
    GoopGeometryBuilder::buildPickAtlas(const size_t node_count) const {
        if (node_count > core::MAX_IDS) {
            return std::unexpected(fmt::format(
                "Board with {} nodes cannot be picked (at most {} ids)", node_count, core::MAX_IDS));
        }

        std::vector<glm::vec2> atlas;
        atlas.reserve(node_count * 4);
        for (size_t node = 0; node < node_count; ++node) {
            const int64_t slot = static_cast<int64_t>(node) + options_.index_base;
            push_corners(atlas, AtlasFragmentShader::slot_center(slot, options_.spacing), 1.0f);
        }
        return atlas;
    }

} // namespace goop::rendering
