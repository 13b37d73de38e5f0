/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <array>
#include <filesystem>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace goop::core {

    namespace {
        constexpr const char* LINE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";

        spdlog::level::level_enum spdlog_level(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info:
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        // First match wins, so more specific path fragments come first.
        constexpr std::array<std::pair<std::string_view, LogModule>, 10> MODULE_PATHS{{
            {"/pick_", LogModule::Picking},
            {"/rendering/", LogModule::Rendering},
            {"/window/", LogModule::Window},
            {"/input/", LogModule::Input},
            {"/visualizer/", LogModule::Viewer},
            {"/app/", LogModule::Viewer},
            {"/parameters.", LogModule::Config},
            {"/argument_parser.", LogModule::Config},
            {"/core/", LogModule::Core},
            {"/tests/", LogModule::Other},
        }};

        LogModule module_of(const std::string_view file) {
            for (const auto& [fragment, module] : MODULE_PATHS) {
                if (file.find(fragment) != std::string_view::npos)
                    return module;
            }
            return LogModule::Other;
        }

        uint32_t module_bit(const LogModule module) {
            return 1u << static_cast<uint32_t>(module);
        }
    } // namespace

    LogLevel parse_log_level(const std::string_view name) {
        static constexpr std::array<std::pair<std::string_view, LogLevel>, 10> NAMES{{
            {"trace", LogLevel::Trace},
            {"debug", LogLevel::Debug},
            {"info", LogLevel::Info},
            {"perf", LogLevel::Performance},
            {"performance", LogLevel::Performance},
            {"warn", LogLevel::Warn},
            {"warning", LogLevel::Warn},
            {"error", LogLevel::Error},
            {"critical", LogLevel::Critical},
            {"off", LogLevel::Off},
        }};
        for (const auto& [key, level] : NAMES) {
            if (key == name)
                return level;
        }
        return LogLevel::Info;
    }

    std::string_view log_module_name(const LogModule module) {
        switch (module) {
        case LogModule::Core: return "Core";
        case LogModule::Config: return "Config";
        case LogModule::Rendering: return "Rendering";
        case LogModule::Picking: return "Picking";
        case LogModule::Viewer: return "Viewer";
        case LogModule::Input: return "Input";
        case LogModule::Window: return "Window";
        case LogModule::Other: return "Other";
        }
        return "Other";
    }

    struct Logger::Sinks {
        std::mutex mutex;
        std::shared_ptr<spdlog::logger> out;
        std::string filter;
    };

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger()
        : sinks_(std::make_unique<Sinks>()) {
        sinks_->out = std::make_shared<spdlog::logger>(
            "goop", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        sinks_->out->set_pattern(LINE_PATTERN);
        sinks_->out->set_level(spdlog::level::trace);
    }

    Logger::~Logger() {
        if (sinks_ && sinks_->out)
            sinks_->out->flush();
    }

    void Logger::init(const LogLevel console_level,
                      const std::string& log_file,
                      const std::string& filter_pattern) {
        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(spdlog_level(console_level));
        sinks.push_back(std::move(console));

        std::string file_error;
        if (!log_file.empty()) {
            try {
                auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file->set_level(spdlog::level::trace);
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        auto out = std::make_shared<spdlog::logger>("goop", sinks.begin(), sinks.end());
        out->set_pattern(LINE_PATTERN);
        out->set_level(spdlog::level::trace);
        out->flush_on(spdlog::level::err);

        {
            std::lock_guard lock(sinks_->mutex);
            sinks_->out = std::move(out);
            sinks_->filter = filter_pattern;
        }

        // A file sink wants every message; the console sink then does its own filtering.
        set_level(sinks.size() > 1 ? LogLevel::Trace : console_level);

        if (!file_error.empty())
            LOG_WARN("Cannot open log file {}: {}", log_file, file_error);
    }

    void Logger::mute(const LogModule module, const bool muted) {
        if (muted)
            muted_modules_.fetch_or(module_bit(module), std::memory_order_relaxed);
        else
            muted_modules_.fetch_and(~module_bit(module), std::memory_order_relaxed);
    }

    void Logger::flush() {
        std::lock_guard lock(sinks_->mutex);
        sinks_->out->flush();
    }

    void Logger::write(const LogLevel level, const std::source_location& where, const std::string_view message) {
        if (!should_log(level))
            return;

        const LogModule module = module_of(where.file_name());
        if (muted_modules_.load(std::memory_order_relaxed) & module_bit(module))
            return;

        std::lock_guard lock(sinks_->mutex);
        if (!sinks_->filter.empty() && message.find(sinks_->filter) == std::string_view::npos)
            return;

        const std::string file = std::filesystem::path(where.file_name()).filename().string();
        sinks_->out->log(spdlog_level(level), "[{}] {}{}:{} {}",
                         log_module_name(module),
                         level == LogLevel::Performance ? "[PERF] " : "",
                         file, where.line(), message);
    }

    ScopeTimer::ScopeTimer(std::string label, const LogLevel level, const std::source_location where)
        : label_(std::move(label)),
          level_(level),
          where_(where),
          start_(std::chrono::steady_clock::now()) {
    }

    ScopeTimer::~ScopeTimer() {
        auto& logger = Logger::get();
        if (!logger.should_log(level_))
            return;
        const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
        logger.write(level_, where_, "{} took {:.3f} ms", label_, elapsed.count());
    }

} // namespace goop::core
