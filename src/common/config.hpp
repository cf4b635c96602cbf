#pragma once

#include <string>
#include <string_view>

namespace guard {
namespace common {

// 服务器配置结构体
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50061;
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
    // 审计日志 (为空则与主日志共用输出)
    std::string audit_file = "";
};

// Redis配置结构体
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 200;
    int socket_timeout_ms = 500;
    bool enabled = false;
};

// 缓存配置结构体
struct CacheConfig {
    RedisConfig redis;
    // 所有键的命名空间前缀
    std::string key_prefix = "guard:";
};

// 令牌与会话策略
struct AuthConfig {
    std::string access_secret = "";
    std::string refresh_secret = "";
    std::string fingerprint_salt = "";
    std::string issuer = "session-guard";
    std::string access_audience = "guard-access";
    std::string refresh_audience = "guard-refresh";
    int access_ttl_seconds = 15 * 60;
    int refresh_ttl_seconds = 7 * 24 * 60 * 60;
    int session_retention_seconds = 7 * 24 * 60 * 60;
    int blacklist_ttl_seconds = 24 * 60 * 60;
    int max_sessions = 5;
};

// 单个限流规则
struct RateLimitRule {
    int max_attempts = 10;
    int window_seconds = 15 * 60;
};

// 限流配置结构体
struct RateLimitConfig {
    bool enabled = true;
    RateLimitRule login{10, 15 * 60};
    RateLimitRule refresh{15, 5 * 60};
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    CacheConfig cache;
    AuthConfig auth;
    RateLimitConfig rate_limit;
};

}
}
