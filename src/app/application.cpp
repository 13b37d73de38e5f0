/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/logger.hpp"
#include "visualizer/board_viewer.hpp"

#include <cstdlib>

namespace goop::app {

    namespace {

        void initLogging(const core::param::ViewerParameters& params) {
            auto level = core::parse_log_level(params.log_level);
            // LOG_LEVEL only applies while the configuration leaves the default in place.
            if (const char* env = std::getenv("LOG_LEVEL"); env && params.log_level == "info") {
                level = core::parse_log_level(env);
            }
            core::Logger::get().init(level, params.log_file);
        }

    } // namespace

    int Application::run(const core::param::ViewerParameters& params) {
        initLogging(params);

        LOG_INFO("Goop Battle starting: {}x{} board, spacing {}, index base {}",
                 params.board.cols, params.board.rows, params.atlas.spacing, params.atlas.index_base);

        vis::BoardViewer viewer(params);
        if (const auto result = viewer.run(); !result) {
            LOG_ERROR("Viewer error: {}", result.error());
            core::Logger::get().flush();
            return 1;
        }

        core::Logger::get().flush();
        return 0;
    }

} // namespace goop::app
