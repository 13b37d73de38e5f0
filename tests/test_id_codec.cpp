/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/id_codec.hpp"
#include <gtest/gtest.h>

using namespace goop::core;

TEST(IdCodec, ZeroIsBlackWithFullAlpha) {
    const glm::vec4 c = encode_id(0);
    EXPECT_FLOAT_EQ(c.r, 0.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);
}

TEST(IdCodec, FieldsMapToRedBlueGreen) {
    // 0x132: red carries 1, blue carries 3, green carries 2
    const glm::vec4 c = encode_id(0x132);
    EXPECT_FLOAT_EQ(c.r, 1.0f / 15.0f);
    EXPECT_FLOAT_EQ(c.g, 2.0f / 15.0f);
    EXPECT_FLOAT_EQ(c.b, 3.0f / 15.0f);

    const Rgba8 bytes = encode_id_rgba8(0x132);
    EXPECT_EQ(bytes, (Rgba8{17, 34, 51, 255}));
}

TEST(IdCodec, MaxIdIsWhite) {
    EXPECT_EQ(encode_id_rgba8(MAX_IDS - 1), (Rgba8{255, 255, 255, 255}));
}

TEST(IdCodec, EveryIdSurvivesFloatAndByteEncoding) {
    for (uint32_t id = 0; id < MAX_IDS; ++id) {
        ASSERT_EQ(decode_id(encode_id(id)), id);
        ASSERT_EQ(decode_id_rgba8(encode_id_rgba8(id)), id);
    }
}

TEST(IdCodec, ValuesWrapToTwelveBits) {
    EXPECT_EQ(decode_id(encode_id(MAX_IDS + 7)), 7u);
}

TEST(IdCodec, DecodeRoundsToNearestLevel) {
    // Slightly off the exact levels, as a blended pixel may be.
    const glm::vec4 noisy{1.0f / 15.0f + 0.02f, 2.0f / 15.0f - 0.02f, 3.0f / 15.0f + 0.01f, 1.0f};
    EXPECT_EQ(decode_id(noisy), 0x132u);

    EXPECT_EQ(decode_id_rgba8({18, 33, 52, 255}), 0x132u);
}

TEST(IdCodec, DecodeClampsOutOfRangeChannels) {
    EXPECT_EQ(decode_id({-0.5f, 2.0f, 0.0f, 1.0f}), 0x00Fu);
}

TEST(IdCodec, OwnerColorQuantizesToNearestLevels) {
    // 255 -> 15, 68 -> 4, 51 -> 3
    EXPECT_EQ(index_for_rgb8(255, 68, 51), 0xF34u);
    // 8 rounds down to level 0, 9 rounds up to level 1
    EXPECT_EQ(index_for_rgb8(8, 0, 0), 0u);
    EXPECT_EQ(index_for_rgb8(9, 0, 0), 0x100u);
}

TEST(IdCodec, OwnerIndexEncodesBackToQuantizedColor) {
    const Rgba8 color = encode_id_rgba8(index_for_rgb8(255, 68, 51));
    EXPECT_EQ(color, (Rgba8{255, 68, 51, 255}));

    // 100 lies between levels 5 (85) and 6 (102)
    EXPECT_EQ(encode_id_rgba8(index_for_rgb8(100, 0, 0))[0], 102);
}
