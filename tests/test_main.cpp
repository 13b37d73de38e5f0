/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    // Quiet by default; LOG_LEVEL=debug etc. for more output.
    auto log_level = goop::core::LogLevel::Warn;
    if (const char* env = std::getenv("LOG_LEVEL")) {
        log_level = goop::core::parse_log_level(env);
    }
    goop::core::Logger::get().init(log_level);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
