/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "board_viewer.hpp"
#include "core/logger.hpp"
#include "demo_fill.hpp"
#include "window/viewer_window.hpp"
#include <cmath>

namespace goop::vis {

    namespace {
        rendering::AtlasSettings atlas_settings_from(const core::param::AtlasParameters& atlas) {
            return rendering::AtlasSettings{
                .geometry = {
                    .fill_scale = atlas.fill_scale,
                    .max_fill = atlas.max_fill,
                    .spacing = atlas.spacing,
                    .index_base = atlas.index_base},
                .policy = atlas.debug_sentinel ? rendering::OutOfRangePolicy::Sentinel
                                               : rendering::OutOfRangePolicy::Discard};
        }

        const char* policy_name(const rendering::OutOfRangePolicy policy) {
            return policy == rendering::OutOfRangePolicy::Sentinel ? "sentinel" : "discard";
        }
    } // namespace

    BoardViewer::BoardViewer(const core::param::ViewerParameters& params)
        : params_(params),
          board_(params.board.rows, params.board.cols),
          engine_(rendering::RenderingEngine::create()) {
        const auto owners = owner_indices(params_.board.owner_colors, params_.atlas.index_base);
        cells_ = make_demo_fill(board_, owners, params_.atlas.max_fill, params_.board.demo_seed);
        input_controller_ = std::make_unique<InputController>(*this);
    }

    BoardViewer::~BoardViewer() {
        if (engine_) {
            engine_->shutdown();
        }
    }

    std::expected<void, std::string> BoardViewer::initialize() {
        auto window = ViewerWindow::open("Goop Battle", {params_.window.width, params_.window.height});
        if (!window) {
            return std::unexpected(fmt::format("Failed to create the viewer window: {}", window.error()));
        }
        window_ = std::move(*window);

        if (auto result = engine_->initialize(); !result) {
            return std::unexpected(fmt::format("Failed to initialize rendering: {}", result.error()));
        }
        engine_->setAtlasSettings(atlas_settings_from(params_.atlas));
        engine_->setPickOptions({.tolerance = params_.pick.tolerance,
                                 .radius = params_.pick.radius,
                                 .index_base = params_.atlas.index_base});

        if (auto result = updateView(); !result) {
            return result;
        }

        LOG_INFO("Board {}x{} with {} cells, {} owners",
                 board_.cols(), board_.rows(), board_.nodes(), params_.board.owner_colors.size());
        window_->show();
        return {};
    }

    std::expected<void, std::string> BoardViewer::updateView() {
        const glm::ivec2 fb_size = window_->framebufferSize();
        // Minimized windows report an empty framebuffer; keep the last view.
        if (fb_size.x <= 0 || fb_size.y <= 0) {
            return {};
        }

        auto view = rendering::ViewTransform::create({.min = {0.0f, 0.0f}, .max = board_.bounds()},
                                                     fb_size, params_.window.margin);
        if (!view) {
            return std::unexpected(view.error());
        }
        view_ = std::move(*view);
        LOG_DEBUG("View rebuilt for {}x{} framebuffer", fb_size.x, fb_size.y);
        return {};
    }

    std::expected<void, std::string> BoardViewer::run() {
        if (auto result = initialize(); !result) {
            return result;
        }

        while (!window_->closeRequested()) {
            window_->pumpEvents(input_controller_.get());

            if (window_->refreshSize()) {
                if (auto result = updateView(); !result) {
                    return result;
                }
            }

            if (pending_pick_) {
                pickAt(*pending_pick_);
                pending_pick_.reset();
            }

            if (auto result = renderFrame(); !result) {
                return result;
            }
            window_->present();
        }

        LOG_INFO("Viewer closed");
        return {};
    }

    std::expected<void, std::string> BoardViewer::renderFrame() {
        if (!view_) {
            return {};
        }
        if (auto result = engine_->beginFrame(*view_, style_); !result) {
            return result;
        }
        if (auto result = engine_->renderBoard(board_, *view_, style_); !result) {
            return result;
        }
        return engine_->renderFill(cells_, board_, *view_);
    }

    void BoardViewer::pickAt(const glm::vec2& window_pos) {
        if (!view_) {
            return;
        }

        if (auto result = engine_->renderPickFrame(board_, *view_, view_->viewportSize()); !result) {
            LOG_ERROR("Id pass failed: {}", result.error());
            return;
        }

        const glm::vec2 fb_pos = window_->toFramebuffer(window_pos);
        const glm::ivec2 pixel(static_cast<int>(std::floor(fb_pos.x)), static_cast<int>(std::floor(fb_pos.y)));

        const auto picked = engine_->pick(pixel);
        if (!picked) {
            LOG_ERROR("Pick failed: {}", picked.error());
            return;
        }

        const glm::vec2 graph_pos = view_->windowToGraph(fb_pos);
        if (!*picked) {
            LOG_INFO("No cell at ({:.2f}, {:.2f})", graph_pos.x, graph_pos.y);
            return;
        }

        const core::Node node = **picked - params_.atlas.index_base;
        if (node >= board_.nodes()) {
            LOG_WARN("Picked id {} is outside the board", **picked);
            return;
        }

        const glm::vec2 c = board_.center(node);
        const auto& cell = cells_[node];
        if (cell) {
            LOG_INFO("Cell {} (row {}, col {}) at ({:.1f}, {:.1f}): owner {} fill {}",
                     node, node / board_.cols(), node % board_.cols(), c.x, c.y,
                     cell->owner_index, cell->fill);
        } else {
            LOG_INFO("Cell {} (row {}, col {}) at ({:.1f}, {:.1f}): empty",
                     node, node / board_.cols(), node % board_.cols(), c.x, c.y);
        }
    }

    void BoardViewer::requestPick(const glm::vec2& window_pos) {
        // Handled between frames by run().
        pending_pick_ = window_pos;
    }

    void BoardViewer::toggleDebugSentinel() {
        auto settings = engine_->atlasSettings();
        settings.policy = settings.policy == rendering::OutOfRangePolicy::Sentinel
                              ? rendering::OutOfRangePolicy::Discard
                              : rendering::OutOfRangePolicy::Sentinel;
        engine_->setAtlasSettings(settings);
        params_.atlas.debug_sentinel = settings.policy == rendering::OutOfRangePolicy::Sentinel;
        LOG_INFO("Out-of-range circles: {}", policy_name(settings.policy));
    }

    void BoardViewer::requestQuit() {
        if (window_) {
            window_->requestClose();
        }
    }

} // namespace goop::vis
