/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "demo_fill.hpp"
#include "core/id_codec.hpp"
#include "core/xorshift.hpp"

namespace goop::vis {

    std::vector<rendering::CircleIndex> owner_indices(const std::span<const std::array<uint8_t, 3>> colors,
                                                      const uint32_t index_base) {
        std::vector<rendering::CircleIndex> indices;
        indices.reserve(colors.size());
        for (const auto& c : colors) {
            indices.push_back(core::index_for_rgb8(c[0], c[1], c[2]) + index_base);
        }
        return indices;
    }

    std::vector<rendering::FillState> make_demo_fill(const core::SquareBoard& board,
                                                     const std::span<const rendering::CircleIndex> owners,
                                                     const uint32_t max_fill,
                                                     const uint64_t seed) {
        std::vector<rendering::FillState> cells(board.nodes());
        if (owners.empty() || max_fill == 0)
            return cells;

        auto rng = core::XorShift128Plus::fromSeed(seed);
        for (auto& cell : cells) {
            const uint64_t r = rng.next_u64();
            if (r % 4 == 0)
                continue;
            cell = rendering::CellFill{
                .owner_index = owners[(r >> 8) % owners.size()],
                .fill = 1 + static_cast<uint32_t>((r >> 24) % max_fill)};
        }
        return cells;
    }

} // namespace goop::vis
