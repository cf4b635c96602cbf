#include "cache/in_memory_kv_store.hpp"
#include "cache/redis_client.hpp"
#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "config_path.hpp"
#include "core/ratelimit/rate_limiter.hpp"
#include "core/session/session_engine.hpp"
#include "core/user/user_directory.hpp"
#include "server/session_service_impl.hpp"

#include <cstdio>
#include <cstdlib>
#include <csignal>
#include <chrono>
#include <grpcpp/grpcpp.h>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

// 创建键值存储: 存储是会话与吊销状态的唯一来源, Redis 连不上时不启动
// 关闭 Redis 时使用进程内存储, 只适合单实例
std::shared_ptr<guard::cache::KvStore> CreateKvStore(const guard::common::AppConfig& config) {
    if (!config.cache.redis.enabled) {
        GUARD_LOG_WARN("Redis disabled; using in-memory session store (single instance only)");
        return std::make_shared<guard::cache::InMemoryKvStore>();
    }
    auto client = std::make_shared<guard::cache::RedisClient>(config.cache.redis);
    auto status = client->Connect();
    if (!status.IsOk()) {
        GUARD_LOG_ERROR("Redis init failed: {}", status.Message());
        return nullptr;
    }
    return client;
}

std::shared_ptr<guard::core::RateLimiter> CreateLimiter(const guard::common::AppConfig& config
                                                        , const std::shared_ptr<guard::cache::KvStore>& store
                                                        , const std::string& scope
                                                        , const guard::common::RateLimitRule& rule) {
    if (!config.rate_limit.enabled) {
        return nullptr;
    }
    return std::make_shared<guard::core::RateLimiter>(store, config.cache.key_prefix, scope, rule);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("SESSION_GUARD_CONFIG")) {
        config_path = env;
    } else {
        config_path = guard::common::GetConfigPath("app.example.json");
    }

    guard::common::AppConfig config;
    try {
        config = guard::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    guard::common::InitLogger(config.logging);
    GUARD_LOG_INFO("Session guard starting with config {}", config_path);

    auto store = CreateKvStore(config);
    if (!store) {
        guard::common::ShutdownLogger();
        return EXIT_FAILURE;
    }
    auto users = std::make_shared<guard::core::StoredUserDirectory>(store, config.cache.key_prefix);
    auto engine = std::make_shared<guard::core::SessionSecurityEngine>(config.auth
                                                                       , store
                                                                       , users
                                                                       , nullptr
                                                                       , config.cache.key_prefix);
    guard::server::SessionGuardServiceImpl service(engine
                                                   , users
                                                   , CreateLimiter(config, store, "login", config.rate_limit.login)
                                                   , CreateLimiter(config, store, "refresh", config.rate_limit.refresh));

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        GUARD_LOG_ERROR("Failed to start gRPC server on {}", address);
        return EXIT_FAILURE;
    }

    GUARD_LOG_INFO("Session guard listening on {}", address);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        GUARD_LOG_WARN("Signal {} received, shutting down gRPC server...", static_cast<int>(g_stop_signal));
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();
    guard::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
