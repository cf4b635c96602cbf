#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace guard {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();
// 获取审计日志器
std::shared_ptr<spdlog::logger> GetAuditLogger();

// 日志宏定义
#define GUARD_LOG_DEBUG(...) ::guard::common::GetLogger()->debug(__VA_ARGS__)
#define GUARD_LOG_INFO(...)  ::guard::common::GetLogger()->info(__VA_ARGS__)
#define GUARD_LOG_WARN(...)  ::guard::common::GetLogger()->warn(__VA_ARGS__)
#define GUARD_LOG_ERROR(...) ::guard::common::GetLogger()->error(__VA_ARGS__)

}
}
