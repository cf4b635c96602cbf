#include "common/audit_log.hpp"

#include "common/logger.hpp"

#include <string>

namespace guard {
namespace common {

void Audit(std::string_view event, nlohmann::json fields, const Clock* clock) {
    if (!fields.is_object()) {
        fields = nlohmann::json{{"detail", std::move(fields)}};
    }
    fields["event"] = std::string(event);
    fields["ts"] = clock != nullptr ? clock->NowMillis() : SystemClock().NowMillis();
    // 用户输入 (UA 等) 可能含非法 UTF-8, 替换而不是抛异常
    GetAuditLogger()->info(fields.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

}
}
