/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/square_board.hpp"
#include <cmath>

namespace goop::core {

    SquareBoard::SquareBoard(const uint32_t rows, const uint32_t cols)
        : rows_(rows),
          cols_(cols) {
    }

    size_t SquareBoard::edges() const {
        if (rows_ == 0 || cols_ == 0)
            return 0;
        return static_cast<size_t>(rows_) * (cols_ - 1) + static_cast<size_t>(cols_) * (rows_ - 1);
    }

    std::vector<Node> SquareBoard::neighbors(const Node node) const {
        std::vector<Node> result;
        if (node >= nodes())
            return result;

        const uint32_t row = node / cols_;
        const uint32_t col = node % cols_;
        if (row + 1 < rows_)
            result.push_back(node + cols_);
        if (col + 1 < cols_)
            result.push_back(node + 1);
        if (row >= 1)
            result.push_back(node - cols_);
        if (col >= 1)
            result.push_back(node - 1);
        return result;
    }

    glm::vec2 SquareBoard::center(const Node node) const {
        const uint32_t row = node / cols_;
        const uint32_t col = node % cols_;
        return {static_cast<float>(col) + 0.5f, static_cast<float>(row) + 0.5f};
    }

    std::vector<glm::vec2> SquareBoard::endpoints() const {
        std::vector<glm::vec2> points;
        points.reserve(static_cast<size_t>(rows_ + 1) * (cols_ + 1));
        for (uint32_t row = 0; row <= rows_; ++row) {
            for (uint32_t col = 0; col <= cols_; ++col) {
                points.emplace_back(static_cast<float>(col), static_cast<float>(row));
            }
        }
        return points;
    }

    std::vector<BoundarySegment> SquareBoard::boundary_segments() const {
        std::vector<BoundarySegment> segments;
        if (nodes() == 0)
            return segments;

        for (uint32_t row = 0; row < rows_; ++row) {
            for (uint32_t col = 0; col < cols_; ++col) {
                const Node node = row * cols_ + col;

                // Bottom and left sides belong to this cell only on the board edge;
                // otherwise the cell below or to the left already emitted them.
                if (row == 0)
                    segments.push_back({lattice_index(0, col), lattice_index(0, col + 1), node, std::nullopt});
                if (col == 0)
                    segments.push_back({lattice_index(row, 0), lattice_index(row + 1, 0), node, std::nullopt});

                // Top side
                std::optional<Node> above;
                if (row + 1 < rows_)
                    above = node + cols_;
                segments.push_back({lattice_index(row + 1, col), lattice_index(row + 1, col + 1), node, above});

                // Right side
                std::optional<Node> right;
                if (col + 1 < cols_)
                    right = node + 1;
                segments.push_back({lattice_index(row, col + 1), lattice_index(row + 1, col + 1), node, right});
            }
        }
        return segments;
    }

    std::optional<Node> SquareBoard::node_at(const glm::vec2& point) const {
        if (!(point.x >= 0.0f && point.y >= 0.0f))
            return std::nullopt;
        const auto col = static_cast<uint32_t>(std::floor(point.x));
        const auto row = static_cast<uint32_t>(std::floor(point.y));
        if (col >= cols_ || row >= rows_)
            return std::nullopt;
        return row * cols_ + col;
    }

} // namespace goop::core
