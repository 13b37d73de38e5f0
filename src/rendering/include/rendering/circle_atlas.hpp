/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <span>
#include <vector>

namespace goop::rendering {

    // The circle atlas is an unbounded procedural texture: along atlas x, slot `i`
    // holds a unit-radius circle centered at (i * spacing, 0). Every fragment in a
    // circle is colored with the encoded id of its slot. The atlas is never stored;
    // circle_atlas.frag and id_atlas.frag evaluate it per fragment, and this class
    // evaluates it identically on the CPU.

    using CircleIndex = uint32_t;

    enum class OutOfRangePolicy {
        Discard,
        Sentinel
    };

    struct AtlasParams {
        float spacing = 15.0f;
        uint32_t index_base = 0;
        OutOfRangePolicy policy = OutOfRangePolicy::Discard;
    };

    inline constexpr glm::vec4 SENTINEL_COLOR{1.0f, 0.0f, 1.0f, 1.0f};

    // std::nullopt means the fragment is discarded.
    using FragmentOutput = std::optional<glm::vec4>;

    class AtlasFragmentShader {
    public:
        static FragmentOutput shade(const glm::vec2& atlas, const AtlasParams& params);

        static std::vector<FragmentOutput> shade_span(std::span<const glm::vec2> atlas, const AtlasParams& params);

        // Nearest slot to `x`, rounding half up. Negative results are possible.
        static int64_t slot_index(float x, float spacing);

        static glm::vec2 slot_center(int64_t index, float spacing);

        // True when `index` names one of the 4096 valid circles.
        static bool in_range(int64_t index, uint32_t index_base);
    };

} // namespace goop::rendering
