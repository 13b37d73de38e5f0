/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include "core/export.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace goop::core {

    enum class LogLevel : uint8_t {
        Trace,
        Debug,
        Info,
        Performance,
        Warn,
        Error,
        Critical,
        Off
    };

    // Derived from the source file of each call site.
    enum class LogModule : uint8_t {
        Core,
        Config,
        Rendering,
        Picking,
        Viewer,
        Input,
        Window,
        Other
    };

    // "trace", "debug", "info", "perf", "warn", "error", "critical" or "off";
    // anything else is Info.
    GOOP_LOGGER_API LogLevel parse_log_level(std::string_view name);

    GOOP_LOGGER_API std::string_view log_module_name(LogModule module);

    /**
     * @brief Process-wide logger on top of spdlog
     *
     * Messages below the current level are dropped before formatting. Each line is
     * tagged with its module and call site. init() may be called again to change
     * sinks; until then messages go to stdout at Info.
     */
    class GOOP_LOGGER_API Logger {
    public:
        static Logger& get();

        // With a log file, the file receives every level and the console filters.
        void init(LogLevel console_level = LogLevel::Info,
                  const std::string& log_file = "",
                  const std::string& filter_pattern = "");

        void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }

        bool should_log(LogLevel level) const { return level >= this->level() && level != LogLevel::Off; }

        // Silences one module without touching the others.
        void mute(LogModule module, bool muted = true);

        void flush();

        void write(LogLevel level, const std::source_location& where, std::string_view message);

        template <typename... Args>
        void write(LogLevel level, const std::source_location& where,
                   fmt::format_string<Args...> format, Args&&... args) {
            if (!should_log(level))
                return;
            write(level, where, std::string_view(fmt::format(format, std::forward<Args>(args)...)));
        }

    private:
        Logger();
        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        struct Sinks;
        std::unique_ptr<Sinks> sinks_;
        std::atomic<LogLevel> level_{LogLevel::Info};
        std::atomic<uint32_t> muted_modules_{0};
    };

    // Logs how long its scope took when it is destroyed.
    class GOOP_LOGGER_API ScopeTimer {
    public:
        explicit ScopeTimer(std::string label, LogLevel level = LogLevel::Performance,
                            std::source_location where = std::source_location::current());
        ~ScopeTimer();

        ScopeTimer(const ScopeTimer&) = delete;
        ScopeTimer& operator=(const ScopeTimer&) = delete;

    private:
        std::string label_;
        LogLevel level_;
        std::source_location where_;
        std::chrono::steady_clock::time_point start_;
    };

} // namespace goop::core

#define GOOP_LOG(level, ...) \
    ::goop::core::Logger::get().write(level, std::source_location::current(), __VA_ARGS__)

#define LOG_TRACE(...)    GOOP_LOG(::goop::core::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...)    GOOP_LOG(::goop::core::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)     GOOP_LOG(::goop::core::LogLevel::Info, __VA_ARGS__)
#define LOG_PERF(...)     GOOP_LOG(::goop::core::LogLevel::Performance, __VA_ARGS__)
#define LOG_WARN(...)     GOOP_LOG(::goop::core::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...)    GOOP_LOG(::goop::core::LogLevel::Error, __VA_ARGS__)
#define LOG_CRITICAL(...) GOOP_LOG(::goop::core::LogLevel::Critical, __VA_ARGS__)

#define GOOP_LOG_CONCAT_INNER(a, b) a##b
#define GOOP_LOG_CONCAT(a, b)       GOOP_LOG_CONCAT_INNER(a, b)

#define LOG_TIMER(label) \
    ::goop::core::ScopeTimer GOOP_LOG_CONCAT(goop_scope_timer_, __LINE__)(label)
#define LOG_TIMER_TRACE(label) \
    ::goop::core::ScopeTimer GOOP_LOG_CONCAT(goop_scope_timer_, __LINE__)(label, ::goop::core::LogLevel::Trace)
