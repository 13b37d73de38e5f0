/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/resource_paths.hpp"
#include <args.hxx>
#include <expected>
#include <fmt/format.h>

namespace {

    void apply_overrides(goop::core::param::ViewerParameters& params,
                         ::args::ValueFlag<uint32_t>& rows,
                         ::args::ValueFlag<uint32_t>& cols,
                         ::args::ValueFlag<float>& spacing,
                         ::args::ValueFlag<uint32_t>& index_base,
                         ::args::Flag& debug_sentinel,
                         ::args::ValueFlag<int>& width,
                         ::args::ValueFlag<int>& height,
                         ::args::ValueFlag<uint64_t>& seed,
                         ::args::ValueFlag<std::string>& log_level,
                         ::args::ValueFlag<std::string>& log_file) {
        if (rows)
            params.board.rows = ::args::get(rows);
        if (cols)
            params.board.cols = ::args::get(cols);
        if (seed)
            params.board.demo_seed = ::args::get(seed);
        if (spacing)
            params.atlas.spacing = ::args::get(spacing);
        if (index_base)
            params.atlas.index_base = ::args::get(index_base);
        if (debug_sentinel)
            params.atlas.debug_sentinel = true;
        if (width)
            params.window.width = ::args::get(width);
        if (height)
            params.window.height = ::args::get(height);
        if (log_level)
            params.log_level = ::args::get(log_level);
        if (log_file)
            params.log_file = ::args::get(log_file);
    }

} // anonymous namespace

std::expected<goop::core::args::ParsedArgs, std::string>
goop::core::args::parse_args(const std::vector<std::string>& args) {
    if (args.empty()) {
        return std::unexpected("Missing program name");
    }

    try {
        ::args::ArgumentParser parser(
            "Goop Battle: board viewer with GPU circle-atlas rendering and color-ID picking.\n",
            "\nCONTROLS:\n"
            "Left click -- pick the cell under the cursor\n"
            "D -- toggle the out-of-range debug color\n"
            "Esc -- quit\n"
            "\n"
            "ENVIRONMENT:\n"
            "GOOP_RESOURCE_DIR -- Override the shader/resource directory\n");
        parser.helpParams.width = 120;

        ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});

        ::args::Group config_sep(parser, " ");
        ::args::Group config_group(parser, "CONFIGURATION:");
        ::args::ValueFlag<std::string> config_file(config_group, "config_file", "Goop Battle config file (json)", {"config"});

        ::args::Group board_sep(parser, " ");
        ::args::Group board_group(parser, "BOARD:");
        ::args::ValueFlag<uint32_t> rows(board_group, "rows", "Board rows", {"rows"});
        ::args::ValueFlag<uint32_t> cols(board_group, "cols", "Board columns", {"cols"});
        ::args::ValueFlag<uint64_t> seed(board_group, "seed", "Seed for the demo fill", {"seed"});

        ::args::Group atlas_sep(parser, " ");
        ::args::Group atlas_group(parser, "ATLAS:");
        ::args::ValueFlag<float> spacing(atlas_group, "spacing", "Distance between circle slots (default: 15)", {"spacing"});
        ::args::ValueFlag<uint32_t> index_base(atlas_group, "index_base", "First valid circle index, 0 or 1 (default: 0)", {"index-base"});
        ::args::Flag debug_sentinel(atlas_group, "debug_sentinel", "Draw out-of-range slots in magenta instead of discarding", {"debug-sentinel"});

        ::args::Group window_sep(parser, " ");
        ::args::Group window_group(parser, "WINDOW:");
        ::args::ValueFlag<int> width(window_group, "width", "Window width in px (default: 1280)", {"width"});
        ::args::ValueFlag<int> height(window_group, "height", "Window height in px (default: 720)", {"height"});

        ::args::Group logging_sep(parser, " ");
        ::args::Group logging_group(parser, "LOGGING:");
        ::args::ValueFlag<std::string> log_level(logging_group, "level", "Log level: trace, debug, info, perf, warn, error, critical, off", {"log-level"});
        ::args::ValueFlag<std::string> log_file(logging_group, "file", "Also write the log to this file", {"log-file"});

        try {
            parser.Prog(args.front());
            parser.ParseArgs(std::vector<std::string>(args.begin() + 1, args.end()));
        } catch (const ::args::Help&) {
            fmt::print("{}", parser.Help());
            return HelpMode{};
        } catch (const ::args::ParseError& e) {
            return std::unexpected(fmt::format("Parse error: {}\n{}", e.what(), parser.Help()));
        } catch (const ::args::ValidationError& e) {
            return std::unexpected(fmt::format("Invalid argument: {}", e.what()));
        }

        ViewerMode mode;
        if (config_file) {
            auto loaded = param::load_viewer_parameters(utf8_to_path(::args::get(config_file)));
            if (!loaded) {
                return std::unexpected(fmt::format("Config load failed: {}", loaded.error()));
            }
            mode.params = std::move(*loaded);
        }

        apply_overrides(mode.params, rows, cols, spacing, index_base, debug_sentinel,
                        width, height, seed, log_level, log_file);

        if (auto valid = param::validate(mode.params); !valid) {
            return std::unexpected(valid.error());
        }
        return mode;

    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("Failed to parse arguments: {}", e.what()));
    }
}

std::expected<goop::core::args::ParsedArgs, std::string>
goop::core::args::parse_args(const int argc, const char* const argv[]) {
    return parse_args(std::vector<std::string>(argv, argv + argc));
}
