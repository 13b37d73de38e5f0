/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <vector>

namespace goop::core {

    using Node = uint32_t;

    // A boundary line between two lattice points, as indices into SquareBoard::endpoints().
    // `neighbor` is the node on the other side of the line, if any.
    struct BoundarySegment {
        uint32_t start = 0;
        uint32_t end = 0;
        Node node = 0;
        std::optional<Node> neighbor;
    };

    /**
     * @brief A board of 1x1 square cells in graph space
     *
     * A board with `rows` rows and `cols` columns spans (0,0)..(cols,rows) in graph
     * space. Nodes are numbered in row-major order, bottom to top, left to right.
     * A cell's neighbors are the cells above, below, left and right of it.
     */
    class GOOP_CORE_API SquareBoard {
    public:
        SquareBoard(uint32_t rows, uint32_t cols);

        uint32_t rows() const { return rows_; }
        uint32_t cols() const { return cols_; }

        size_t nodes() const { return static_cast<size_t>(rows_) * cols_; }
        size_t edges() const;

        // Up, right, down, left; missing neighbors at the board edge are skipped.
        std::vector<Node> neighbors(Node node) const;

        // Upper-right corner of the board's bounding box; the lower-left is the origin.
        glm::vec2 bounds() const { return {static_cast<float>(cols_), static_cast<float>(rows_)}; }
        glm::vec2 center(Node node) const;

        // Radius of the largest circle that fits in every cell.
        float radius() const { return 0.5f; }

        // Lattice points, row-major from the origin: (rows + 1) * (cols + 1) of them.
        std::vector<glm::vec2> endpoints() const;

        // Every cell side exactly once. Shared sides name the lower-numbered node.
        std::vector<BoundarySegment> boundary_segments() const;

        std::optional<Node> node_at(const glm::vec2& point) const;

    private:
        uint32_t lattice_index(uint32_t row, uint32_t col) const { return row * (cols_ + 1) + col; }

        uint32_t rows_;
        uint32_t cols_;
    };

} // namespace goop::core
