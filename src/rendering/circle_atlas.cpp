/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/circle_atlas.hpp"
#include "core/id_codec.hpp"
#include <algorithm>
#include <cmath>

namespace goop::rendering {

    int64_t AtlasFragmentShader::slot_index(const float x, const float spacing) {
        return static_cast<int64_t>(std::floor(x / spacing + 0.5f));
    }

    glm::vec2 AtlasFragmentShader::slot_center(const int64_t index, const float spacing) {
        return {static_cast<float>(index) * spacing, 0.0f};
    }

    bool AtlasFragmentShader::in_range(const int64_t index, const uint32_t index_base) {
        return index >= static_cast<int64_t>(index_base) &&
               index < static_cast<int64_t>(index_base) + static_cast<int64_t>(core::MAX_IDS);
    }

    FragmentOutput AtlasFragmentShader::shade(const glm::vec2& atlas, const AtlasParams& params) {
        // Everything left of slot -1 is reserved for geometry that must never draw.
        if (atlas.x < -params.spacing)
            return std::nullopt;

        const int64_t index = slot_index(atlas.x, params.spacing);
        if (!in_range(index, params.index_base)) {
            if (params.policy == OutOfRangePolicy::Sentinel)
                return SENTINEL_COLOR;
            return std::nullopt;
        }

        if (glm::length(atlas - slot_center(index, params.spacing)) > 1.0f)
            return std::nullopt;

        return core::encode_id(static_cast<uint32_t>(index - params.index_base));
    }

    std::vector<FragmentOutput> AtlasFragmentShader::shade_span(const std::span<const glm::vec2> atlas,
                                                                const AtlasParams& params) {
        std::vector<FragmentOutput> out(atlas.size());
        std::transform(atlas.begin(), atlas.end(), out.begin(),
                       [&params](const glm::vec2& a) { return shade(a, params); });
        return out;
    }

} // namespace goop::rendering
