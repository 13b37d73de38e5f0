/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace goop::core {
    namespace param {

        struct GOOP_CORE_API AtlasParameters {
            float spacing = 15.0f;        // Distance between circle slots along atlas x
            uint32_t index_base = 0;      // First valid circle index (0 or 1)
            bool debug_sentinel = false;  // Paint out-of-range slots magenta instead of discarding
            uint32_t max_fill = 15;       // Fill level that covers a whole cell
            float fill_scale = 0.8f;      // Node square half-size relative to the cell radius

            nlohmann::json to_json() const;
            static AtlasParameters from_json(const nlohmann::json& j);
        };

        struct GOOP_CORE_API PickParameters {
            uint32_t tolerance = 2; // Per-channel slack, in 8-bit steps
            uint32_t radius = 0;    // Sample a (2r+1)^2 neighborhood

            nlohmann::json to_json() const;
            static PickParameters from_json(const nlohmann::json& j);
        };

        struct GOOP_CORE_API BoardParameters {
            uint32_t rows = 12;
            uint32_t cols = 16;
            std::vector<std::array<uint8_t, 3>> owner_colors = {
                {255, 68, 51},
                {51, 136, 255},
                {68, 204, 85},
                {238, 187, 34}};
            uint64_t demo_seed = 1;

            nlohmann::json to_json() const;
            static BoardParameters from_json(const nlohmann::json& j);
        };

        struct GOOP_CORE_API WindowParameters {
            int width = 1280;
            int height = 720;
            float margin = 0.95f;

            nlohmann::json to_json() const;
            static WindowParameters from_json(const nlohmann::json& j);
        };

        struct GOOP_CORE_API ViewerParameters {
            AtlasParameters atlas;
            PickParameters pick;
            BoardParameters board;
            WindowParameters window;
            std::string log_level = "info";
            std::string log_file;

            nlohmann::json to_json() const;
            static ViewerParameters from_json(const nlohmann::json& j);
        };

        // Empty on success, otherwise a description of the first offending value.
        GOOP_CORE_API std::expected<void, std::string> validate(const ViewerParameters& params);

        GOOP_CORE_API std::expected<ViewerParameters, std::string> load_viewer_parameters(const std::filesystem::path& path);

        GOOP_CORE_API std::expected<void, std::string> save_viewer_parameters(
            const ViewerParameters& params,
            const std::filesystem::path& output_path);

    } // namespace param
} // namespace goop::core
