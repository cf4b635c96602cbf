#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace guard {
namespace common {

namespace {
AppConfig g_config;
bool g_config_initialized = false; // 全局配置初始化标志

// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("SESSION_GUARD_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

// 解析单条限流规则
void ReadRule(const nlohmann::json& j, RateLimitRule& rule) {
    rule.max_attempts = j.value("max_attempts", rule.max_attempts);
    rule.window_seconds = j.value("window_seconds", rule.window_seconds);
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    auto cfg = FromJson(json);
    ApplyEnvOverrides(cfg);
    Validate(cfg);
    return cfg;
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

const AppConfig& GlobalConfig() {
    if (!g_config_initialized) {
        g_config = ConfigLoader::LoadFromEnvOrDefault();
        g_config_initialized = true;
    }
    return g_config;
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 密钥优先从环境变量注入
void ConfigLoader::ApplyEnvOverrides(AppConfig& config) {
    if (const char* env = std::getenv("GUARD_ACCESS_SECRET")) {
        config.auth.access_secret = env;
    }
    if (const char* env = std::getenv("GUARD_REFRESH_SECRET")) {
        config.auth.refresh_secret = env;
    }
    if (const char* env = std::getenv("GUARD_FINGERPRINT_SALT")) {
        config.auth.fingerprint_salt = env;
    }
}

void ConfigLoader::Validate(const AppConfig& config) {
    const auto& auth = config.auth;
    if (auth.access_secret.empty() || auth.refresh_secret.empty()) {
        throw std::runtime_error("auth.access_secret and auth.refresh_secret must be set");
    }
    if (auth.access_secret == auth.refresh_secret) {
        throw std::runtime_error("auth.access_secret and auth.refresh_secret must differ");
    }
    if (auth.access_audience == auth.refresh_audience) {
        throw std::runtime_error("access and refresh audiences must differ");
    }
    if (auth.max_sessions < 1) {
        throw std::runtime_error("auth.max_sessions must be at least 1");
    }
    if (auth.access_ttl_seconds <= 0 || auth.refresh_ttl_seconds <= 0 || auth.session_retention_seconds <= 0
        || auth.blacklist_ttl_seconds <= 0) {
        throw std::runtime_error("auth TTL values must be positive");
    }
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Server配置
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
    }
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
        cfg.logging.audit_file = logging.value("audit_file", cfg.logging.audit_file);
    }
    // Cache配置
    if (j.contains("cache")) {
        const auto& cache = j["cache"];
        cfg.cache.key_prefix = cache.value("key_prefix", cfg.cache.key_prefix);
        if (cache.contains("redis")) {
            const auto& redis = cache["redis"];
            cfg.cache.redis.host = redis.value("host", cfg.cache.redis.host);
            cfg.cache.redis.port = redis.value("port", cfg.cache.redis.port);
            cfg.cache.redis.password = redis.value("password", cfg.cache.redis.password);
            cfg.cache.redis.db = redis.value("db", cfg.cache.redis.db);
            cfg.cache.redis.pool_size = redis.value("pool_size", cfg.cache.redis.pool_size);
            cfg.cache.redis.connection_timeout_ms = redis.value("connection_timeout_ms", cfg.cache.redis.connection_timeout_ms);
            cfg.cache.redis.socket_timeout_ms = redis.value("socket_timeout_ms", cfg.cache.redis.socket_timeout_ms);
            cfg.cache.redis.enabled = redis.value("enabled", cfg.cache.redis.enabled);
        }
    }
    // Auth配置
    if (j.contains("auth")) {
        const auto& auth = j["auth"];
        cfg.auth.access_secret = auth.value("access_secret", cfg.auth.access_secret);
        cfg.auth.refresh_secret = auth.value("refresh_secret", cfg.auth.refresh_secret);
        cfg.auth.fingerprint_salt = auth.value("fingerprint_salt", cfg.auth.fingerprint_salt);
        cfg.auth.issuer = auth.value("issuer", cfg.auth.issuer);
        cfg.auth.access_audience = auth.value("access_audience", cfg.auth.access_audience);
        cfg.auth.refresh_audience = auth.value("refresh_audience", cfg.auth.refresh_audience);
        cfg.auth.access_ttl_seconds = auth.value("access_ttl_seconds", cfg.auth.access_ttl_seconds);
        cfg.auth.refresh_ttl_seconds = auth.value("refresh_ttl_seconds", cfg.auth.refresh_ttl_seconds);
        cfg.auth.session_retention_seconds = auth.value("session_retention_seconds", cfg.auth.session_retention_seconds);
        cfg.auth.blacklist_ttl_seconds = auth.value("blacklist_ttl_seconds", cfg.auth.blacklist_ttl_seconds);
        cfg.auth.max_sessions = auth.value("max_sessions", cfg.auth.max_sessions);
    }
    // RateLimit配置
    if (j.contains("rate_limit")) {
        const auto& rate_limit = j["rate_limit"];
        cfg.rate_limit.enabled = rate_limit.value("enabled", cfg.rate_limit.enabled);
        if (rate_limit.contains("login")) {
            ReadRule(rate_limit["login"], cfg.rate_limit.login);
        }
        if (rate_limit.contains("refresh")) {
            ReadRule(rate_limit["refresh"], cfg.rate_limit.refresh);
        }
    }
    return cfg;
}

}
}
