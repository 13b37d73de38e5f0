/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/square_board.hpp"
#include "rendering/goop_geometry.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace goop::vis {

    // Circle index for each owner color, quantized to the 4-bit id levels.
    std::vector<rendering::CircleIndex> owner_indices(std::span<const std::array<uint8_t, 3>> colors,
                                                      uint32_t index_base);

    // A reproducible board state: about a quarter of the cells are empty, the rest
    // belong to a random owner with a fill in 1..max_fill.
    std::vector<rendering::FillState> make_demo_fill(const core::SquareBoard& board,
                                                     std::span<const rendering::CircleIndex> owners,
                                                     uint32_t max_fill,
                                                     uint64_t seed);

} // namespace goop::vis
