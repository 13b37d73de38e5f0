/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering_engine_impl.hpp"
#include "core/logger.hpp"
#include "gl_resources.hpp"

namespace goop::rendering {

    std::unique_ptr<RenderingEngine> RenderingEngine::create() {
        return std::make_unique<RenderingEngineImpl>();
    }

    RenderingEngineImpl::RenderingEngineImpl() {
        LOG_DEBUG("Initializing RenderingEngineImpl");
    }

    RenderingEngineImpl::~RenderingEngineImpl() {
        shutdown();
    }

    Result<void> RenderingEngineImpl::initialize() {
        LOG_TIMER("RenderingEngine::initialize");

        if (isInitialized()) {
            LOG_TRACE("RenderingEngine already initialized, skipping");
            return {};
        }

        LOG_INFO("Initializing rendering engine...");

        board_renderer_ = std::make_unique<BoardRenderer>();
        if (auto result = board_renderer_->initialize(); !result) {
            LOG_ERROR("Failed to initialize board renderer: {}", result.error());
            shutdown();
            return std::unexpected(result.error());
        }
        LOG_DEBUG("Board renderer initialized");

        atlas_renderer_ = std::make_unique<AtlasRenderer>();
        if (auto result = atlas_renderer_->initialize(); !result) {
            LOG_ERROR("Failed to initialize atlas renderer: {}", result.error());
            shutdown();
            return std::unexpected(result.error());
        }
        LOG_DEBUG("Atlas renderer initialized");

        // The pick target is created at its real size by the first pick frame.
        pick_reader_ = std::make_unique<PickReader>();
        pick_reader_->setOptions(pick_options_);

        LOG_INFO("Rendering engine initialized successfully");
        return {};
    }

    void RenderingEngineImpl::shutdown() {
        if (!board_renderer_ && !atlas_renderer_ && !pick_reader_)
            return;
        LOG_DEBUG("Shutting down rendering engine");
        pick_reader_.reset();
        atlas_renderer_.reset();
        board_renderer_.reset();
        pick_frame_valid_ = false;
    }

    bool RenderingEngineImpl::isInitialized() const {
        return board_renderer_ && board_renderer_->isInitialized() &&
               atlas_renderer_ && atlas_renderer_->isInitialized() &&
               pick_reader_ != nullptr;
    }

    void RenderingEngineImpl::setPickOptions(const PickOptions& options) {
        pick_options_ = options;
        if (pick_reader_)
            pick_reader_->setOptions(options);
    }

    Result<void> RenderingEngineImpl::beginFrame(const ViewTransform& view, const BoardStyle& style) {
        const glm::ivec2 size = view.viewportSize();
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glViewport(0, 0, size.x, size.y);
        glClearColor(style.background.r, style.background.g, style.background.b, style.background.a);
        glClear(GL_COLOR_BUFFER_BIT);
        return check_gl_error("beginFrame");
    }

    Result<void> RenderingEngineImpl::renderBoard(const core::SquareBoard& board,
                                                  const ViewTransform& view,
                                                  const BoardStyle& style) {
        if (!isInitialized())
            return std::unexpected("Rendering engine not initialized");
        return board_renderer_->render(board, view, style);
    }

    Result<void> RenderingEngineImpl::renderFill(const std::span<const FillState> cells,
                                                 const core::SquareBoard& board,
                                                 const ViewTransform& view) {
        if (!isInitialized())
            return std::unexpected("Rendering engine not initialized");

        auto result = atlas_renderer_->renderFill(cells, board, view, atlas_settings_);
        if (!result) {
            LOG_ERROR("Fill render failed: {}", result.error());
        }
        return result;
    }

    Result<void> RenderingEngineImpl::renderPickFrame(const core::SquareBoard& board,
                                                      const ViewTransform& view,
                                                      const glm::ivec2& viewport_size) {
        if (!isInitialized())
            return std::unexpected("Rendering engine not initialized");

        LOG_TIMER_TRACE("RenderingEngine::renderPickFrame");
        pick_frame_valid_ = false;

        if (!pick_reader_->isInitialized()) {
            if (auto result = pick_reader_->initialize(viewport_size); !result)
                return result;
        }
        if (auto result = pick_reader_->beginFrame(viewport_size); !result) {
            LOG_ERROR("Failed to bind pick target: {}", result.error());
            return result;
        }

        auto result = atlas_renderer_->renderIds(board, view, atlas_settings_);
        pick_reader_->endFrame();
        if (!result) {
            LOG_ERROR("Pick frame render failed: {}", result.error());
            return result;
        }

        pick_frame_valid_ = true;
        return {};
    }

    Result<std::optional<CircleIndex>> RenderingEngineImpl::pick(const glm::ivec2& window_px) {
        if (!isInitialized())
            return std::unexpected("Rendering engine not initialized");
        if (!pick_frame_valid_)
            return std::unexpected("No pick frame rendered");
        return pick_reader_->pick(window_px);
    }

} // namespace goop::rendering
