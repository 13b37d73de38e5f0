/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "core/parameters.hpp"
#include <expected>
#include <string>
#include <variant>
#include <vector>

namespace goop::core::args {

    // --help was given; the help text has already been printed.
    struct HelpMode {};

    struct ViewerMode {
        param::ViewerParameters params;
    };

    using ParsedArgs = std::variant<HelpMode, ViewerMode>;

    // Reads --config first, then applies the remaining flags on top of it and validates
    // the result. `args` includes the program name.
    GOOP_CORE_API std::expected<ParsedArgs, std::string> parse_args(const std::vector<std::string>& args);

    GOOP_CORE_API std::expected<ParsedArgs, std::string> parse_args(int argc, const char* const argv[]);

} // namespace goop::core::args
