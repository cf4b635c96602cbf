#include "common/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <vector>

namespace guard {
namespace common {

namespace {

constexpr const char* kLoggerName = "session_guard";
constexpr const char* kAuditLoggerName = "audit";

std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<spdlog::logger> g_audit_logger;

void LogLevelFallback(const std::string& level,
                      std::string_view reason,
                      spdlog::level::level_enum fallback) noexcept {
    std::fprintf(stderr,
                 "session_guard logger: invalid level \"%s\" (%s); fallback to %s\n",
                 level.c_str(),
                 std::string(reason).c_str(),
                 spdlog::level::to_string_view(fallback).data());
}

spdlog::level::level_enum SafeParseLevel(
    const std::string& level, spdlog::level::level_enum fallback) noexcept {
    std::string normalized = level;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (normalized == "warning") {
        normalized = "warn";
    } else if (normalized == "error") {
        normalized = "err";
    }

    static constexpr std::array<std::string_view, 7> kValidLevels{
        "trace", "debug", "info", "warn", "err", "critical", "off"};

    auto it = std::find(kValidLevels.begin(), kValidLevels.end(), normalized);
    if (it == kValidLevels.end()) {
        LogLevelFallback(level, "not recognized", fallback);
        return fallback;
    }

    try {
        return spdlog::level::from_str(normalized);
    } catch (const spdlog::spdlog_ex& ex) {
        LogLevelFallback(level, ex.what(), fallback);
        return fallback;
    }
}

void EnsureParentDirectory(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory " + parent.string() + ": " + ec.message());
    }
}

spdlog::sink_ptr MakeFileSink(const std::string& file) {
    std::filesystem::path log_path{file};
    EnsureParentDirectory(log_path);
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true);
}

} // namespace

void InitLogger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file.empty()) {
        sinks.push_back(MakeFileSink(config.file));
    }
    g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    g_logger->set_level(SafeParseLevel(config.level, spdlog::level::info));
    g_logger->set_pattern(config.pattern);
    spdlog::set_default_logger(g_logger);

    // 审计日志: 单独文件时只写文件, 否则复用主日志的输出
    if (!config.audit_file.empty()) {
        g_audit_logger = std::make_shared<spdlog::logger>(kAuditLoggerName, MakeFileSink(config.audit_file));
        g_audit_logger->set_pattern("%v");
    } else {
        g_audit_logger = std::make_shared<spdlog::logger>(kAuditLoggerName, sinks.begin(), sinks.end());
        g_audit_logger->set_pattern(config.pattern);
    }
    g_audit_logger->set_level(spdlog::level::info);
    g_audit_logger->flush_on(spdlog::level::info);
}

void ShutdownLogger() {
    if (g_logger) {
        g_logger->flush();
    }
    if (g_audit_logger) {
        g_audit_logger->flush();
    }
    g_audit_logger.reset();
    g_logger.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        g_logger = spdlog::default_logger();
        // shutdown 之后默认日志器为空
        if (!g_logger) {
            g_logger = std::make_shared<spdlog::logger>(
                kLoggerName, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
    }
    return g_logger;
}

std::shared_ptr<spdlog::logger> GetAuditLogger() {
    if (!g_audit_logger) {
        g_audit_logger = GetLogger();
    }
    return g_audit_logger;
}

}
}
