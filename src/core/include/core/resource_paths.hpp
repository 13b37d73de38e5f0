/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace goop::core {

    // UTF-8 text of a path, for messages and libraries taking char strings.
    inline std::string path_to_utf8(const std::filesystem::path& p) {
        const std::u8string text = p.u8string();
        return {text.begin(), text.end()};
    }

    inline std::filesystem::path utf8_to_path(const std::string& text) {
        return std::filesystem::path(std::u8string(text.begin(), text.end()));
    }

    // Directory of the running binary, or the working directory when it cannot be resolved.
    inline std::filesystem::path executable_dir() {
        std::error_code ec;
        const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec || exe.empty())
            return std::filesystem::current_path(ec);
        return exe.parent_path();
    }

    /**
     * @brief Root of the runtime resources
     *
     * Checked in order: GOOP_RESOURCE_DIR, an installed tree (bin/../share/GoopBattle),
     * a build tree (resources/ beside the binary). Falls back to the binary's directory.
     */
    inline std::filesystem::path resource_dir() {
        if (const char* env = std::getenv("GOOP_RESOURCE_DIR"); env && *env)
            return utf8_to_path(env);

        const auto bin = executable_dir();
        std::error_code ec;
        for (const auto& candidate : {bin.parent_path() / "share" / "GoopBattle", bin / "resources"}) {
            if (std::filesystem::is_directory(candidate, ec))
                return candidate;
        }
        return bin;
    }

    inline std::filesystem::path shader_path(const std::string& file_name) {
        return resource_dir() / "shaders" / file_name;
    }

} // namespace goop::core
