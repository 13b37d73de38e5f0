/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/id_codec.hpp"
#include "visualizer/demo_fill.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace goop;

TEST(DemoFill, OwnerIndicesQuantizeColors) {
    const std::vector<std::array<uint8_t, 3>> colors{{255, 68, 51}, {0, 0, 0}};
    EXPECT_EQ(vis::owner_indices(colors, 0), (std::vector<rendering::CircleIndex>{0xF34, 0}));
    EXPECT_EQ(vis::owner_indices(colors, 1), (std::vector<rendering::CircleIndex>{0xF35, 1}));
}

TEST(DemoFill, SameSeedSameBoard) {
    const core::SquareBoard board(6, 7);
    const std::vector<rendering::CircleIndex> owners{3, 9, 27};
    const auto a = vis::make_demo_fill(board, owners, 15, 5);
    const auto b = vis::make_demo_fill(board, owners, 15, 5);
    ASSERT_EQ(a.size(), board.nodes());
    for (size_t i = 0; i < a.size(); ++i) {
        ASSERT_EQ(a[i].has_value(), b[i].has_value());
        if (a[i]) {
            EXPECT_EQ(a[i]->owner_index, b[i]->owner_index);
            EXPECT_EQ(a[i]->fill, b[i]->fill);
        }
    }
}

TEST(DemoFill, CellsUseGivenOwnersAndFillRange) {
    const core::SquareBoard board(20, 20);
    const std::vector<rendering::CircleIndex> owners{3, 9, 27};
    const auto cells = vis::make_demo_fill(board, owners, 4, 11);

    size_t occupied = 0;
    for (const auto& cell : cells) {
        if (!cell)
            continue;
        ++occupied;
        EXPECT_NE(std::find(owners.begin(), owners.end(), cell->owner_index), owners.end());
        EXPECT_GE(cell->fill, 1u);
        EXPECT_LE(cell->fill, 4u);
    }
    // About three quarters of 400 cells
    EXPECT_GT(occupied, 200u);
    EXPECT_LT(occupied, cells.size());
}

TEST(DemoFill, NoOwnersLeavesBoardEmpty) {
    const core::SquareBoard board(3, 3);
    const auto cells = vis::make_demo_fill(board, {}, 15, 1);
    ASSERT_EQ(cells.size(), 9u);
    EXPECT_TRUE(std::none_of(cells.begin(), cells.end(), [](const auto& c) { return c.has_value(); }));
}
