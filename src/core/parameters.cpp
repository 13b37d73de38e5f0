/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/id_codec.hpp"
#include "core/logger.hpp"
#include "core/resource_paths.hpp"
#include <cmath>
#include <expected>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace goop::core {
    namespace param {
        namespace {
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(fmt::format("Config file not found: {}", path_to_utf8(path)));
                }

                std::ifstream file;
                if (!open_file_for_read(path, file)) {
                    return std::unexpected(fmt::format("Cannot open config: {}", path_to_utf8(path)));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(fmt::format("JSON parse error in {}: {}", path_to_utf8(path), e.what()));
                }
            }

            // Keys absent from the file keep the value already in `field`.
            template <typename T>
            void read_optional(const nlohmann::json& j, const char* key, T& field) {
                if (j.contains(key)) {
                    field = j.at(key).get<T>();
                }
            }
        } // namespace

        nlohmann::json AtlasParameters::to_json() const {
            nlohmann::json j;
            j["spacing"] = spacing;
            j["index_base"] = index_base;
            j["debug_sentinel"] = debug_sentinel;
            j["max_fill"] = max_fill;
            j["fill_scale"] = fill_scale;
            return j;
        }

        AtlasParameters AtlasParameters::from_json(const nlohmann::json& j) {
            AtlasParameters params;
            read_optional(j, "spacing", params.spacing);
            read_optional(j, "index_base", params.index_base);
            read_optional(j, "debug_sentinel", params.debug_sentinel);
            read_optional(j, "max_fill", params.max_fill);
            read_optional(j, "fill_scale", params.fill_scale);
            return params;
        }

        nlohmann::json PickParameters::to_json() const {
            nlohmann::json j;
            j["tolerance"] = tolerance;
            j["radius"] = radius;
            return j;
        }

        PickParameters PickParameters::from_json(const nlohmann::json& j) {
            PickParameters params;
            read_optional(j, "tolerance", params.tolerance);
            read_optional(j, "radius", params.radius);
            return params;
        }

        nlohmann::json BoardParameters::to_json() const {
            nlohmann::json j;
            j["rows"] = rows;
            j["cols"] = cols;
            j["owner_colors"] = owner_colors;
            j["demo_seed"] = demo_seed;
            return j;
        }

        BoardParameters BoardParameters::from_json(const nlohmann::json& j) {
            BoardParameters params;
            read_optional(j, "rows", params.rows);
            read_optional(j, "cols", params.cols);
            read_optional(j, "owner_colors", params.owner_colors);
            read_optional(j, "demo_seed", params.demo_seed);
            return params;
        }

        nlohmann::json WindowParameters::to_json() const {
            nlohmann::json j;
            j["width"] = width;
            j["height"] = height;
            j["margin"] = margin;
            return j;
        }

        WindowParameters WindowParameters::from_json(const nlohmann::json& j) {
            WindowParameters params;
            read_optional(j, "width", params.width);
            read_optional(j, "height", params.height);
            read_optional(j, "margin", params.margin);
            return params;
        }

        nlohmann::json ViewerParameters::to_json() const {
            nlohmann::json j;
            j["atlas"] = atlas.to_json();
            j["pick"] = pick.to_json();
            j["board"] = board.to_json();
            j["window"] = window.to_json();
            j["log_level"] = log_level;
            j["log_file"] = log_file;
            return j;
        }

        ViewerParameters ViewerParameters::from_json(const nlohmann::json& j) {
            ViewerParameters params;
            if (j.contains("atlas")) {
                params.atlas = AtlasParameters::from_json(j["atlas"]);
            }
            if (j.contains("pick")) {
                params.pick = PickParameters::from_json(j["pick"]);
            }
            if (j.contains("board")) {
                params.board = BoardParameters::from_json(j["board"]);
            }
            if (j.contains("window")) {
                params.window = WindowParameters::from_json(j["window"]);
            }
            read_optional(j, "log_level", params.log_level);
            read_optional(j, "log_file", params.log_file);
            return params;
        }

        std::expected<void, std::string> validate(const ViewerParameters& params) {
            const auto& atlas = params.atlas;
            if (!(atlas.spacing > 0.0f)) {
                return std::unexpected(fmt::format("atlas.spacing must be positive, got {}", atlas.spacing));
            }
            if (atlas.max_fill == 0) {
                return std::unexpected("atlas.max_fill must be at least 1");
            }
            // The smallest fill draws an atlas square of half-size sqrt(max_fill); it must
            // stay clear of the neighboring circle, which starts one unit before its slot.
            const float min_spacing = std::sqrt(static_cast<float>(atlas.max_fill)) + 1.0f;
            if (atlas.spacing < min_spacing) {
                return std::unexpected(fmt::format(
                    "atlas.spacing {} is too small for max_fill {} (need at least {:.3f})",
                    atlas.spacing, atlas.max_fill, min_spacing));
            }
            if (atlas.index_base > 1) {
                return std::unexpected(fmt::format("atlas.index_base must be 0 or 1, got {}", atlas.index_base));
            }
            if (!(atlas.fill_scale > 0.0f && atlas.fill_scale <= 1.0f)) {
                return std::unexpected(fmt::format("atlas.fill_scale must be in (0, 1], got {}", atlas.fill_scale));
            }

            const auto& board = params.board;
            const uint64_t cells = static_cast<uint64_t>(board.rows) * board.cols;
            if (cells == 0 || cells > MAX_IDS) {
                return std::unexpected(fmt::format(
                    "board must have between 1 and {} cells, got {}x{}", MAX_IDS, board.rows, board.cols));
            }

            if (params.pick.tolerance > 8) {
                return std::unexpected(fmt::format("pick.tolerance must be in 0..8, got {}", params.pick.tolerance));
            }
            if (params.pick.radius > 4) {
                return std::unexpected(fmt::format("pick.radius must be in 0..4, got {}", params.pick.radius));
            }

            const auto& window = params.window;
            if (window.width <= 0 || window.height <= 0) {
                return std::unexpected(fmt::format("window size must be positive, got {}x{}", window.width, window.height));
            }
            if (!(window.margin > 0.0f && window.margin <= 1.0f)) {
                return std::unexpected(fmt::format("window.margin must be in (0, 1], got {}", window.margin));
            }
            return {};
        }

        std::expected<ViewerParameters, std::string> load_viewer_parameters(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            ViewerParameters params;
            try {
                params = ViewerParameters::from_json(*json_result);
            } catch (const std::exception& e) {
                return std::unexpected(fmt::format("Error parsing viewer parameters in {}: {}", path_to_utf8(path), e.what()));
            }

            if (auto valid = validate(params); !valid) {
                return std::unexpected(fmt::format("Invalid config {}: {}", path_to_utf8(path), valid.error()));
            }

            LOG_DEBUG("Loaded config: {}", path_to_utf8(path));
            return params;
        }

        std::expected<void, std::string> save_viewer_parameters(
            const ViewerParameters& params,
            const std::filesystem::path& output_path) {
            try {
                const std::filesystem::path filepath = (output_path.extension() == ".json")
                                                           ? output_path
                                                           : output_path / "goop_battle.json";
                std::ofstream file;
                if (!open_file_for_write(filepath, file)) {
                    return std::unexpected(fmt::format("Cannot write: {}", path_to_utf8(filepath)));
                }

                file << params.to_json().dump(4);
                LOG_INFO("Saved config: {}", path_to_utf8(filepath));
                return {};
            } catch (const std::exception& e) {
                return std::unexpected(fmt::format("Error saving viewer parameters: {}", e.what()));
            }
        }

    } // namespace param
} // namespace goop::core
