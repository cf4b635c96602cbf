#include "common/config_loader.hpp"
#include "common/status.hpp"
#include "core/token/token_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <TOKEN> [CONFIG_PATH]\n";
        std::cerr << "Example: " << argv[0] << " eyJhbGciOi... config/app.example.json\n";
        return 1;
    }

    std::string token = argv[1];
    guard::common::AppConfig config;
    try {
        config = argc >= 3 ? guard::common::ConfigLoader::Load(argv[2])
                           : guard::common::ConfigLoader::LoadFromEnvOrDefault();
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load config: " << ex.what() << "\n";
        return 1;
    }

    guard::core::TokenCodec codec(config.auth, nullptr);
    nlohmann::json out;
    out["jti"] = guard::core::TokenCodec::PeekTokenId(token);

    // 先按访问令牌校验, 失败再按刷新令牌校验
    auto access = codec.VerifyAccess(token);
    if (access.IsOk()) {
        const auto& c = access.claims;
        out["type"] = "access";
        out["sub"] = c.user_id;
        out["email"] = c.email;
        out["role"] = c.role;
        out["sid"] = c.session_id;
        out["fpr"] = c.device_fingerprint;
        out["iat"] = c.issued_at;
        out["exp"] = c.expires_at;
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    auto refresh = codec.VerifyRefresh(token);
    if (refresh.IsOk()) {
        const auto& c = refresh.claims;
        out["type"] = "refresh";
        out["sub"] = c.user_id;
        out["sid"] = c.session_id;
        out["ver"] = c.token_version;
        out["iat"] = c.issued_at;
        out["exp"] = c.expires_at;
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    out["access_error"] = guard::core::TokenErrorToString(access.error);
    out["access_detail"] = access.detail;
    out["refresh_error"] = guard::core::TokenErrorToString(refresh.error);
    out["refresh_detail"] = refresh.detail;
    std::cerr << out.dump(2) << "\n";
    return 1;
}
