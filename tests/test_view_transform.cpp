/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/view_transform.hpp"
#include <gtest/gtest.h>

using namespace goop::rendering;

namespace {

    constexpr float EPS = 1e-4f;

    void expect_near(const glm::vec2& actual, const glm::vec2& expected, const float eps = EPS) {
        EXPECT_NEAR(actual.x, expected.x, eps);
        EXPECT_NEAR(actual.y, expected.y, eps);
    }

} // namespace

TEST(ViewTransform, ComposeAppliesRightOperandFirst) {
    const glm::mat3 m = compose(translate_transform(1.0f, 2.0f), scale_transform(3.0f, 4.0f));
    expect_near(apply(m, {1.0f, 1.0f}), {4.0f, 6.0f});
}

TEST(ViewTransform, InverseOfSingularMatrixIsEmpty) {
    EXPECT_FALSE(inverse(scale_transform(0.0f, 1.0f)));

    const auto inv = inverse(compose(translate_transform(-3.0f, 5.0f), scale_transform(2.0f, 0.5f)));
    ASSERT_TRUE(inv);
    expect_near(apply(*inv, apply(compose(translate_transform(-3.0f, 5.0f), scale_transform(2.0f, 0.5f)),
                                  {0.25f, -8.0f})),
                {0.25f, -8.0f});
}

TEST(ViewTransform, GraphToGameMapsBoundsInsideMargin) {
    const glm::mat3 m = graph_to_game(glm::vec2{16.0f, 12.0f}, 0.95f);
    expect_near(apply(m, {0.0f, 0.0f}), {-0.95f, -0.95f});
    expect_near(apply(m, {16.0f, 12.0f}), {0.95f, 0.95f});
    expect_near(apply(m, {8.0f, 6.0f}), {0.0f, 0.0f});
}

TEST(ViewTransform, WindowToDeviceFlipsY) {
    const glm::mat3 m = window_to_device(200.0f, 100.0f);
    expect_near(apply(m, {0.0f, 0.0f}), {-1.0f, 1.0f});
    expect_near(apply(m, {200.0f, 100.0f}), {1.0f, -1.0f});
    expect_near(apply(m, {100.0f, 50.0f}), {0.0f, 0.0f});
}

TEST(ViewTransform, WideViewportPillarboxes) {
    // 16x12 board (4:3) in a 16:9 viewport
    auto view = ViewTransform::create({.min = {0.0f, 0.0f}, .max = {16.0f, 12.0f}}, {1280, 720});
    ASSERT_TRUE(view) << view.error();

    expect_near(apply(view->graphToDevice(), {0.0f, 0.0f}), {-0.7125f, -0.95f});
    expect_near(apply(view->graphToDevice(), {16.0f, 12.0f}), {0.7125f, 0.95f});

    // Window pixels of the same corners, origin top-left
    expect_near(view->windowToGraph({184.0f, 702.0f}), {0.0f, 0.0f}, 1e-3f);
    expect_near(view->windowToGraph({1096.0f, 18.0f}), {16.0f, 12.0f}, 1e-3f);
    expect_near(view->windowToGraph({640.0f, 360.0f}), {8.0f, 6.0f}, 1e-3f);
}

TEST(ViewTransform, TallViewportLetterboxes) {
    auto view = ViewTransform::create({.min = {0.0f, 0.0f}, .max = {4.0f, 1.0f}}, {100, 100});
    ASSERT_TRUE(view) << view.error();
    expect_near(apply(view->graphToDevice(), {4.0f, 1.0f}), {0.95f, 0.2375f});
    expect_near(apply(view->graphToDevice(), {0.0f, 0.0f}), {-0.95f, -0.2375f});
}

TEST(ViewTransform, DeviceToGraphInvertsGraphToDevice) {
    auto view = ViewTransform::create({.min = {-2.0f, 3.0f}, .max = {6.0f, 7.0f}}, {640, 480}, 0.8f);
    ASSERT_TRUE(view) << view.error();
    for (const glm::vec2 p : {glm::vec2{-2.0f, 3.0f}, glm::vec2{1.5f, 4.25f}, glm::vec2{6.0f, 7.0f}}) {
        expect_near(apply(view->deviceToGraph(), apply(view->graphToDevice(), p)), p);
    }
}

TEST(ViewTransform, ViewRectIsNotAffectedByViewport) {
    auto view = ViewTransform::create({.min = {0.0f, 0.0f}, .max = {3.0f, 3.0f}}, {300, 900});
    ASSERT_TRUE(view) << view.error();
    EXPECT_EQ(view->viewportSize(), glm::ivec2(300, 900));
    EXPECT_FLOAT_EQ(view->viewRect().width(), 3.0f);
}

TEST(ViewTransform, RejectsDegenerateInput) {
    EXPECT_FALSE(ViewTransform::create({.min = {0.0f, 0.0f}, .max = {0.0f, 5.0f}}, {100, 100}));
    EXPECT_FALSE(ViewTransform::create({.min = {2.0f, 0.0f}, .max = {1.0f, 5.0f}}, {100, 100}));
    EXPECT_FALSE(ViewTransform::create({.min = {0.0f, 0.0f}, .max = {1.0f, 1.0f}}, {0, 100}));
    EXPECT_FALSE(ViewTransform::create({.min = {0.0f, 0.0f}, .max = {1.0f, 1.0f}}, {100, -1}));
    EXPECT_FALSE(ViewTransform::create({.min = {0.0f, 0.0f}, .max = {1.0f, 1.0f}}, {100, 100}, 0.0f));
}
