/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/id_codec.hpp"
#include "rendering/circle_atlas.hpp"
#include <array>
#include <gtest/gtest.h>

using namespace goop::rendering;

namespace {

    AtlasParams params(const float spacing,
                       const uint32_t index_base = 0,
                       const OutOfRangePolicy policy = OutOfRangePolicy::Discard) {
        return {.spacing = spacing, .index_base = index_base, .policy = policy};
    }

    uint32_t shaded_id(const glm::vec2& atlas, const AtlasParams& p) {
        const auto out = AtlasFragmentShader::shade(atlas, p);
        EXPECT_TRUE(out.has_value());
        return out ? goop::core::decode_id(*out) : UINT32_MAX;
    }

} // namespace

TEST(CircleAtlas, SlotCentersCarryTheirIndex) {
    const auto p = params(15.0f);
    for (const uint32_t index : {0u, 1u, 5u, 255u, 4095u}) {
        EXPECT_EQ(shaded_id({index * 15.0f, 0.0f}, p), index);
    }
}

TEST(CircleAtlas, UnitSpacingSlotCenter) {
    EXPECT_EQ(shaded_id({7.0f, 0.0f}, params(1.0f)), 7u);
}

TEST(CircleAtlas, WholeUnitDiscIsCovered) {
    const auto p = params(15.0f);
    const glm::vec2 center{7 * 15.0f, 0.0f};
    for (const glm::vec2 offset : {glm::vec2{0.99f, 0.0f}, glm::vec2{0.0f, -0.99f},
                                   glm::vec2{0.7f, 0.7f}, glm::vec2{-0.5f, 0.3f}}) {
        EXPECT_EQ(shaded_id(center + offset, p), 7u);
    }
}

TEST(CircleAtlas, OutsideTheDiscIsDiscarded) {
    // Off-axis at spacing 1, where 1.1 stays within the slot.
    EXPECT_FALSE(AtlasFragmentShader::shade({3.0f, 1.1f}, params(1.0f)));
    // On-axis at the default spacing.
    EXPECT_FALSE(AtlasFragmentShader::shade({3 * 15.0f + 1.1f, 0.0f}, params(15.0f)));
    EXPECT_FALSE(AtlasFragmentShader::shade({3 * 15.0f + 0.8f, 0.8f}, params(15.0f)));
}

TEST(CircleAtlas, OnAxisOffsetAtUnitSpacingRoundsToNextSlot) {
    // 3 + 1.1 is closer to slot 4 than to slot 3.
    EXPECT_EQ(AtlasFragmentShader::slot_index(4.1f, 1.0f), 4);
    EXPECT_EQ(shaded_id({4.1f, 0.0f}, params(1.0f)), 4u);
}

TEST(CircleAtlas, SlotIndexRoundsHalfUp) {
    EXPECT_EQ(AtlasFragmentShader::slot_index(1.5f, 1.0f), 2);
    EXPECT_EQ(AtlasFragmentShader::slot_index(1.49f, 1.0f), 1);
    EXPECT_EQ(AtlasFragmentShader::slot_index(22.5f, 15.0f), 2);
    EXPECT_EQ(AtlasFragmentShader::slot_index(-0.5f, 1.0f), 0);
    EXPECT_EQ(AtlasFragmentShader::slot_index(-0.51f, 1.0f), -1);
}

TEST(CircleAtlas, RangeCoversExactly4096Slots) {
    EXPECT_TRUE(AtlasFragmentShader::in_range(0, 0));
    EXPECT_TRUE(AtlasFragmentShader::in_range(4095, 0));
    EXPECT_FALSE(AtlasFragmentShader::in_range(4096, 0));
    EXPECT_FALSE(AtlasFragmentShader::in_range(-1, 0));

    EXPECT_FALSE(AtlasFragmentShader::in_range(0, 1));
    EXPECT_TRUE(AtlasFragmentShader::in_range(4096, 1));
    EXPECT_FALSE(AtlasFragmentShader::in_range(4097, 1));
}

TEST(CircleAtlas, OutOfRangeSlotFollowsPolicy) {
    const glm::vec2 far_slot{5000 * 15.0f, 0.0f};
    EXPECT_FALSE(AtlasFragmentShader::shade(far_slot, params(15.0f)));

    const auto sentinel = AtlasFragmentShader::shade(far_slot, params(15.0f, 0, OutOfRangePolicy::Sentinel));
    ASSERT_TRUE(sentinel);
    EXPECT_EQ(*sentinel, SENTINEL_COLOR);

    // The sentinel fills the whole slot, not just its disc.
    const auto corner = AtlasFragmentShader::shade(far_slot + glm::vec2{5.0f, 5.0f},
                                                   params(15.0f, 0, OutOfRangePolicy::Sentinel));
    ASSERT_TRUE(corner);
    EXPECT_EQ(*corner, SENTINEL_COLOR);
}

TEST(CircleAtlas, FarLeftIsAlwaysDiscarded) {
    for (const auto policy : {OutOfRangePolicy::Discard, OutOfRangePolicy::Sentinel}) {
        EXPECT_FALSE(AtlasFragmentShader::shade({-1.5f, 0.0f}, params(1.0f, 0, policy)));
        EXPECT_FALSE(AtlasFragmentShader::shade({-15.01f, 0.0f}, params(15.0f, 0, policy)));
    }
}

TEST(CircleAtlas, SlotMinusOneIsOutOfRange) {
    const glm::vec2 slot_minus_one{-15.0f, 0.0f};
    EXPECT_FALSE(AtlasFragmentShader::shade(slot_minus_one, params(15.0f)));

    const auto out = AtlasFragmentShader::shade(slot_minus_one, params(15.0f, 0, OutOfRangePolicy::Sentinel));
    ASSERT_TRUE(out);
    EXPECT_EQ(*out, SENTINEL_COLOR);
}

TEST(CircleAtlas, IndexBaseShiftsEncodedIds) {
    const auto p = params(15.0f, 1);
    EXPECT_FALSE(AtlasFragmentShader::shade({0.0f, 0.0f}, p));
    EXPECT_EQ(shaded_id({15.0f, 0.0f}, p), 0u);
    EXPECT_EQ(shaded_id({4096 * 15.0f, 0.0f}, p), 4095u);
}

TEST(CircleAtlas, ShadeSpanMatchesShade) {
    const auto p = params(15.0f);
    const std::array<glm::vec2, 4> atlas{glm::vec2{0.0f, 0.0f}, glm::vec2{15.0f, 2.0f},
                                         glm::vec2{-40.0f, 0.0f}, glm::vec2{30.5f, 0.5f}};
    const auto out = AtlasFragmentShader::shade_span(atlas, p);
    ASSERT_EQ(out.size(), atlas.size());
    for (size_t i = 0; i < atlas.size(); ++i) {
        EXPECT_EQ(out[i], AtlasFragmentShader::shade(atlas[i], p)) << "at " << i;
    }
    EXPECT_TRUE(out[0]);
    EXPECT_FALSE(out[1]);
    EXPECT_FALSE(out[2]);
    EXPECT_TRUE(out[3]);
}
