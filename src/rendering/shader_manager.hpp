/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "rendering/rendering.hpp"
#include <expected>
#include <glad/glad.h>
#include <glm/glm.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace goop::rendering {

    class ShaderError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // A linked program with a cache of uniform locations.
    class Shader {
    public:
        Shader(std::string name, GLuint program);
        ~Shader();

        Shader(const Shader&) = delete;
        Shader& operator=(const Shader&) = delete;

        const std::string& name() const { return name_; }
        GLuint program() const { return program_; }

        void bind() const;
        void unbind() const;

        Result<void> set(std::string_view uniform, float value);
        Result<void> set(std::string_view uniform, int value);
        Result<void> set(std::string_view uniform, unsigned int value);
        Result<void> set(std::string_view uniform, bool value);
        Result<void> set(std::string_view uniform, const glm::vec2& value);
        Result<void> set(std::string_view uniform, const glm::vec4& value);
        Result<void> set(std::string_view uniform, const glm::mat3& value);

    private:
        Result<GLint> location(std::string_view uniform);

        std::string name_;
        GLuint program_ = 0;
        std::unordered_map<std::string, GLint> locations_;
    };

    // Shared handle to a Shader; empty until a program is loaded into it.
    class ManagedShader {
    public:
        ManagedShader() = default;
        explicit ManagedShader(std::shared_ptr<Shader> shader) : shader_(std::move(shader)) {}

        bool valid() const { return shader_ != nullptr; }
        Shader* operator->() const { return shader_.get(); }
        Shader& operator*() const { return *shader_; }

    private:
        std::shared_ptr<Shader> shader_;
    };

    // Binds a program for the lifetime of the scope.
    class ShaderScope {
    public:
        explicit ShaderScope(const ManagedShader& shader);
        ~ShaderScope();

        ShaderScope(const ShaderScope&) = delete;
        ShaderScope& operator=(const ShaderScope&) = delete;

        Shader* operator->() const { return shader_; }

    private:
        Shader* shader_;
    };

    // Compiles and links `vert_file` and `frag_file` from the shader resource directory.
    std::expected<ManagedShader, ShaderError> load_shader(
        const std::string& name,
        const std::string& vert_file,
        const std::string& frag_file);

    std::expected<ManagedShader, ShaderError> create_shader_from_source(
        const std::string& name,
        const std::string& vert_source,
        const std::string& frag_source);

} // namespace goop::rendering
