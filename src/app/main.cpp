/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/argument_parser.hpp"

#include <fmt/format.h>
#include <variant>

int main(int argc, char* argv[]) {
    auto parsed = goop::core::args::parse_args(argc, argv);
    if (!parsed) {
        fmt::print(stderr, "{}\n", parsed.error());
        return 1;
    }

    if (std::holds_alternative<goop::core::args::HelpMode>(*parsed)) {
        return 0;
    }

    const auto& mode = std::get<goop::core::args::ViewerMode>(*parsed);
    goop::app::Application app;
    return app.run(mode.params);
}
