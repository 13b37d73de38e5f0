/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/square_board.hpp"
#include "rendering/circle_atlas.hpp"
#include <cstdint>
#include <expected>
#include <glm/glm.hpp>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace goop::rendering {

    struct CellFill {
        CircleIndex owner_index = 0;
        uint32_t fill = 0;
    };

    // Per node; std::nullopt for an unoccupied cell.
    using FillState = std::optional<CellFill>;

    struct GeometryOptions {
        float fill_scale = 0.8f;
        uint32_t max_fill = 15;
        float spacing = 15.0f;
        uint32_t index_base = 0;
    };

    // One square per node. Vertices 4n..4n+3 belong to node n, counterclockwise
    // from the first quadrant; indices 6n..6n+5 are its two triangles.
    struct NodeSquares {
        std::vector<glm::vec2> positions;
        std::vector<uint32_t> indices;
    };

    /**
     * @brief Builds the vertex data that places atlas circles onto board cells
     *
     * Node positions are fixed for a board. Atlas coordinates run parallel to them
     * and choose which circle a node shows, and how large it appears: a smaller
     * fill stretches the atlas square, so the circle covers less of the node.
     */
    class GoopGeometryBuilder {
    public:
        explicit GoopGeometryBuilder(const GeometryOptions& options = {});

        const GeometryOptions& options() const { return options_; }

        std::expected<NodeSquares, std::string> buildSquares(const core::SquareBoard& board) const;

        // One entry per node, parallel to buildSquares().positions.
        std::expected<std::vector<glm::vec2>, std::string> buildFillAtlas(std::span<const FillState> cells) const;

        // Node n shows the circle whose id decodes back to n.
        std::expected<std::vector<glm::vec2>, std::string> buildPickAtlas(size_t node_count) const;

        // Atlas square for an occupied node; half-size sqrt(max_fill / fill).
        float fillHalfSize(uint32_t fill) const;

        // Center of the atlas square that empty nodes use. It lies left of -spacing.
        glm::vec2 emptyCenter() const { return {-2.0f * options_.spacing, 0.0f}; }

    private:
        GeometryOptions options_;
    };

    // Appends the corners of the square centered at `center` with half side `half_size`.
    void push_corners(std::vector<glm::vec2>& out, const glm::vec2& center, float half_size);

} // namespace goop::rendering
