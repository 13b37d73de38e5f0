/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <array>
#include <cstdint>
#include <glm/glm.hpp>

namespace goop::core {

    // Twelve-bit identifiers carried through a quantized RGBA color.
    //
    // The value is split into three 4-bit fields. Bits 8-11 go to red, bits 4-7 to
    // BLUE and bits 0-3 to GREEN. The circle atlas shaders use the same layout, so
    // this order is a wire format between the GPU and the pick readback; do not
    // reorder it. Alpha is always 1 and carries no identity.

    inline constexpr uint32_t ID_BITS = 12;
    inline constexpr uint32_t ID_LEVELS = 16;
    inline constexpr uint32_t MAX_IDS = 1u << ID_BITS;
    inline constexpr uint32_t ID_MASK = MAX_IDS - 1;

    // One quantization level in 8-bit UNORM: k/15 is exactly k*17/255.
    inline constexpr uint32_t RGBA8_LEVEL_STEP = 255 / (ID_LEVELS - 1);

    using Rgba8 = std::array<uint8_t, 4>;

    GOOP_CORE_API glm::vec4 encode_id(uint32_t value);

    // Rounds each channel to the nearest level and clamps it to [0, 15].
    // Never fails; callers decide whether the color was clean.
    GOOP_CORE_API uint32_t decode_id(const glm::vec4& color);

    GOOP_CORE_API Rgba8 encode_id_rgba8(uint32_t value);
    GOOP_CORE_API uint32_t decode_id_rgba8(const Rgba8& rgba);

    // Index whose encoded color is the 4-bit quantization of an owner's display color.
    GOOP_CORE_API uint32_t index_for_rgb8(uint8_t r, uint8_t g, uint8_t b);

} // namespace goop::core
