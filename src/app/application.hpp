/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"

namespace goop::app {

    class Application {
    public:
        // Returns the process exit code.
        int run(const core::param::ViewerParameters& params);
    };

} // namespace goop::app
