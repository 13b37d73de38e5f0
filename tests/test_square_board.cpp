/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/square_board.hpp"
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <set>
#include <utility>

using namespace goop::core;

TEST(SquareBoard, CountsNodesAndEdges) {
    const SquareBoard board(3, 4);
    EXPECT_EQ(board.nodes(), 12u);
    EXPECT_EQ(board.edges(), 17u);
    EXPECT_EQ(board.bounds(), glm::vec2(4.0f, 3.0f));

    EXPECT_EQ(SquareBoard(1, 1).edges(), 0u);
    EXPECT_EQ(SquareBoard(0, 5).nodes(), 0u);
    EXPECT_EQ(SquareBoard(0, 5).edges(), 0u);
}

TEST(SquareBoard, NeighborsInUpRightDownLeftOrder) {
    const SquareBoard board(3, 4);
    EXPECT_EQ(board.neighbors(0), (std::vector<Node>{4, 1}));
    EXPECT_EQ(board.neighbors(5), (std::vector<Node>{9, 6, 1, 4}));
    EXPECT_EQ(board.neighbors(11), (std::vector<Node>{7, 10}));
    EXPECT_EQ(board.neighbors(3), (std::vector<Node>{7, 2}));
    EXPECT_TRUE(board.neighbors(12).empty());
}

TEST(SquareBoard, NeighborRelationIsSymmetric) {
    const SquareBoard board(5, 7);
    size_t directed = 0;
    for (Node a = 0; a < board.nodes(); ++a) {
        for (const Node b : board.neighbors(a)) {
            const auto back = board.neighbors(b);
            EXPECT_NE(std::find(back.begin(), back.end(), a), back.end());
            ++directed;
        }
    }
    EXPECT_EQ(directed, 2 * board.edges());
}

TEST(SquareBoard, CentersAreCellMidpoints) {
    const SquareBoard board(3, 4);
    EXPECT_EQ(board.center(0), glm::vec2(0.5f, 0.5f));
    EXPECT_EQ(board.center(5), glm::vec2(1.5f, 1.5f));
    EXPECT_EQ(board.center(11), glm::vec2(3.5f, 2.5f));
    EXPECT_FLOAT_EQ(board.radius(), 0.5f);
}

TEST(SquareBoard, EndpointsAreLatticePoints) {
    const SquareBoard board(3, 4);
    const auto points = board.endpoints();
    ASSERT_EQ(points.size(), 20u);
    EXPECT_EQ(points.front(), glm::vec2(0.0f, 0.0f));
    EXPECT_EQ(points[4], glm::vec2(4.0f, 0.0f));
    EXPECT_EQ(points[5], glm::vec2(0.0f, 1.0f));
    EXPECT_EQ(points.back(), glm::vec2(4.0f, 3.0f));
}

TEST(SquareBoard, BoundarySegmentsCoverEverySideOnce) {
    const SquareBoard board(3, 4);
    const auto segments = board.boundary_segments();
    const auto points = board.endpoints();

    // Interior sides plus the perimeter
    EXPECT_EQ(segments.size(), board.edges() + 2 * (3 + 4));

    std::set<std::pair<uint32_t, uint32_t>> seen;
    size_t shared = 0;
    for (const auto& s : segments) {
        ASSERT_LT(s.start, points.size());
        ASSERT_LT(s.end, points.size());
        EXPECT_TRUE(seen.insert({std::min(s.start, s.end), std::max(s.start, s.end)}).second);

        // Unit length, axis aligned
        const glm::vec2 d = points[s.end] - points[s.start];
        EXPECT_FLOAT_EQ(std::abs(d.x) + std::abs(d.y), 1.0f);

        if (s.neighbor) {
            ++shared;
            EXPECT_GT(*s.neighbor, s.node);
        }
    }
    EXPECT_EQ(shared, board.edges());
}

TEST(SquareBoard, NodeAtFindsContainingCell) {
    const SquareBoard board(3, 4);
    EXPECT_EQ(board.node_at({1.2f, 2.7f}), 9u);
    EXPECT_EQ(board.node_at({0.0f, 0.0f}), 0u);
    EXPECT_EQ(board.node_at({3.99f, 2.99f}), 11u);
    EXPECT_EQ(board.node_at({4.0f, 0.5f}), std::nullopt);
    EXPECT_EQ(board.node_at({0.5f, 3.0f}), std::nullopt);
    EXPECT_EQ(board.node_at({-0.1f, 0.5f}), std::nullopt);

    for (Node n = 0; n < board.nodes(); ++n) {
        EXPECT_EQ(board.node_at(board.center(n)), n);
    }
}
