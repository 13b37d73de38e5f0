/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "atlas_renderer.hpp"
#include "board_renderer.hpp"
#include "rendering/pick_reader.hpp"
#include "rendering/rendering.hpp"

namespace goop::rendering {

    class RenderingEngineImpl : public RenderingEngine {
    public:
        RenderingEngineImpl();
        ~RenderingEngineImpl() override;

        Result<void> initialize() override;
        void shutdown() override;
        bool isInitialized() const override;

        void setAtlasSettings(const AtlasSettings& settings) override { atlas_settings_ = settings; }
        const AtlasSettings& atlasSettings() const override { return atlas_settings_; }

        void setPickOptions(const PickOptions& options) override;

        Result<void> beginFrame(const ViewTransform& view, const BoardStyle& style) override;

        Result<void> renderBoard(const core::SquareBoard& board,
                                 const ViewTransform& view,
                                 const BoardStyle& style) override;

        Result<void> renderFill(std::span<const FillState> cells,
                                const core::SquareBoard& board,
                                const ViewTransform& view) override;

        Result<void> renderPickFrame(const core::SquareBoard& board,
                                     const ViewTransform& view,
                                     const glm::ivec2& viewport_size) override;

        Result<std::optional<CircleIndex>> pick(const glm::ivec2& window_px) override;

    private:
        std::unique_ptr<BoardRenderer> board_renderer_;
        std::unique_ptr<AtlasRenderer> atlas_renderer_;
        std::unique_ptr<PickReader> pick_reader_;

        AtlasSettings atlas_settings_;
        PickOptions pick_options_;
        bool pick_frame_valid_ = false;
    };

} // namespace goop::rendering
