/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "shader_manager.hpp"
#include "core/logger.hpp"
#include "core/resource_paths.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <glm/gtc/type_ptr.hpp>
#include <sstream>
#include <vector>

namespace goop::rendering {

    namespace {
        std::expected<std::string, ShaderError> read_shader_file(const std::filesystem::path& path) {
            std::ifstream file;
            if (!goop::core::open_file_for_read(path, file)) {
                return std::unexpected(ShaderError(fmt::format("Cannot open shader: {}", goop::core::path_to_utf8(path))));
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }

        std::expected<GLuint, ShaderError> compile_stage(const GLenum stage, const std::string& source,
                                                         const std::string& label) {
            const GLuint shader = glCreateShader(stage);
            if (shader == 0) {
                return std::unexpected(ShaderError(fmt::format("glCreateShader failed for {}", label)));
            }
            const char* src = source.c_str();
            glShaderSource(shader, 1, &src, nullptr);
            glCompileShader(shader);

            GLint ok = GL_FALSE;
            glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
            if (ok != GL_TRUE) {
                GLint length = 0;
                glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
                std::vector<char> log(static_cast<size_t>(std::max(length, 1)));
                glGetShaderInfoLog(shader, length, nullptr, log.data());
                glDeleteShader(shader);
                return std::unexpected(ShaderError(fmt::format("Failed to compile {}: {}", label, log.data())));
            }
            return shader;
        }
    } // namespace

    Shader::Shader(std::string name, const GLuint program)
        : name_(std::move(name)),
          program_(program) {
    }

    Shader::~Shader() {
        if (program_ != 0) {
            glDeleteProgram(program_);
        }
    }

    void Shader::bind() const { glUseProgram(program_); }
    void Shader::unbind() const { glUseProgram(0); }

    Result<GLint> Shader::location(const std::string_view uniform) {
        std::string key(uniform);
        if (const auto it = locations_.find(key); it != locations_.end()) {
            return it->second;
        }
        const GLint loc = glGetUniformLocation(program_, key.c_str());
        if (loc < 0) {
            return std::unexpected(fmt::format("Uniform '{}' not found in shader '{}'", key, name_));
        }
        locations_.emplace(std::move(key), loc);
        return loc;
    }

    Result<void> Shader::set(const std::string_view uniform, const float value) {
        auto loc = location(uniform);
        if (!loc)
            return std::unexpected(loc.error());
        glUniform1f(*loc, value);
        return {};
    }

    Result<void> Shader::set(const std::string_view uniform, const int value) {
        auto loc = location(uniform);
        if (!loc)
            return std::unexpected(loc.error());
        glUniform1i(*loc, value);
        return {};
    }

    Result<void> Shader::set(const std::string_view uniform, const unsigned int value) {
        auto loc = location(uniform);
        if (!loc)
            return std::unexpected(loc.error());
        glUniform1ui(*loc, value);
        return {};
    }

    Result<void> Shader::set(const std::string_view uniform, const bool value) {
        return set(uniform, static_cast<int>(value));
    }

    Result<void> Shader::set(const std::string_view uniform, const glm::vec2& value) {
        auto loc = location(uniform);
        if (!loc)
            return std::unexpected(loc.error());
        glUniform2fv(*loc, 1, glm::value_ptr(value));
        return {};
    }

    Result<void> Shader::set(const std::string_view uniform, const glm::vec4& value) {
        auto loc = location(uniform);
        if (!loc)
            return std::unexpected(loc.error());
        glUniform4fv(*loc, 1, glm::value_ptr(value));
        return {};
    }

    Result<void> Shader::set(const std::string_view uniform, const glm::mat3& value) {
        auto loc = location(uniform);
        if (!loc)
            return std::unexpected(loc.error());
        glUniformMatrix3fv(*loc, 1, GL_FALSE, glm::value_ptr(value));
        return {};
    }

    ShaderScope::ShaderScope(const ManagedShader& shader)
        : shader_(&*shader) {
        shader_->bind();
    }

    ShaderScope::~ShaderScope() {
        shader_->unbind();
    }

    std::expected<ManagedShader, ShaderError> create_shader_from_source(
        const std::string& name,
        const std::string& vert_source,
        const std::string& frag_source) {

        auto vert = compile_stage(GL_VERTEX_SHADER, vert_source, name + " (vertex)");
        if (!vert) {
            return std::unexpected(vert.error());
        }
        auto frag = compile_stage(GL_FRAGMENT_SHADER, frag_source, name + " (fragment)");
        if (!frag) {
            glDeleteShader(*vert);
            return std::unexpected(frag.error());
        }

        const GLuint program = glCreateProgram();
        glAttachShader(program, *vert);
        glAttachShader(program, *frag);
        glLinkProgram(program);
        glDetachShader(program, *vert);
        glDetachShader(program, *frag);
        glDeleteShader(*vert);
        glDeleteShader(*frag);

        GLint ok = GL_FALSE;
        glGetProgramiv(program, GL_LINK_STATUS, &ok);
        if (ok != GL_TRUE) {
            GLint length = 0;
            glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
            std::vector<char> log(static_cast<size_t>(std::max(length, 1)));
            glGetProgramInfoLog(program, length, nullptr, log.data());
            glDeleteProgram(program);
            return std::unexpected(ShaderError(fmt::format("Failed to link {}: {}", name, log.data())));
        }

        LOG_DEBUG("Shader '{}' linked (program {})", name, program);
        return ManagedShader(std::make_shared<Shader>(name, program));
    }

    std::expected<ManagedShader, ShaderError> load_shader(
        const std::string& name,
        const std::string& vert_file,
        const std::string& frag_file) {
        LOG_TIMER_TRACE("load_shader");

        auto vert_source = read_shader_file(goop::core::shader_path(vert_file));
        if (!vert_source) {
            return std::unexpected(vert_source.error());
        }
        auto frag_source = read_shader_file(goop::core::shader_path(frag_file));
        if (!frag_source) {
            return std::unexpected(frag_source.error());
        }
        return create_shader_from_source(name, *vert_source, *frag_source);
    }

} // namespace goop::rendering
