/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/id_codec.hpp"
#include <algorithm>
#include <cmath>

namespace goop::core {

    namespace {
        constexpr float LEVEL_MAX = static_cast<float>(ID_LEVELS - 1);

        uint32_t to_level(const float channel) {
            const float level = std::floor(channel * LEVEL_MAX + 0.5f);
            return static_cast<uint32_t>(std::clamp(level, 0.0f, LEVEL_MAX));
        }

        uint32_t byte_to_level(const uint8_t channel) {
            return (static_cast<uint32_t>(channel) + RGBA8_LEVEL_STEP / 2) / RGBA8_LEVEL_STEP;
        }
    } // namespace

    glm::vec4 encode_id(const uint32_t value) {
        const uint32_t id = value & ID_MASK;
        const uint32_t r = (id >> 8) & 0xF;
        const uint32_t b = (id >> 4) & 0xF;
        const uint32_t g = id & 0xF;
        return {static_cast<float>(r) / LEVEL_MAX,
                static_cast<float>(g) / LEVEL_MAX,
                static_cast<float>(b) / LEVEL_MAX,
                1.0f};
    }

    uint32_t decode_id(const glm::vec4& color) {
        return to_level(color.r) << 8 | to_level(color.b) << 4 | to_level(color.g);
    }

    Rgba8 encode_id_rgba8(const uint32_t value) {
        const uint32_t id = value & ID_MASK;
        return {static_cast<uint8_t>(((id >> 8) & 0xF) * RGBA8_LEVEL_STEP),
                static_cast<uint8_t>((id & 0xF) * RGBA8_LEVEL_STEP),
                static_cast<uint8_t>(((id >> 4) & 0xF) * RGBA8_LEVEL_STEP),
                255};
    }

    uint32_t decode_id_rgba8(const Rgba8& rgba) {
        return byte_to_level(rgba[0]) << 8 | byte_to_level(rgba[2]) << 4 | byte_to_level(rgba[1]);
    }

    uint32_t index_for_rgb8(const uint8_t r, const uint8_t g, const uint8_t b) {
        return decode_id_rgba8({r, g, b, 255});
    }

} // namespace goop::core
