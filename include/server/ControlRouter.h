#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "common/GuardConfig.h"
#include "core/contracts/IExchangeGateway.h"
#include "core/orchestration/PanicOrchestrator.h"

namespace riskguard {
namespace server {

struct ControlResponse {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

// 제어 엔드포인트 라우팅 (소켓과 무관한 순수 디스패치)
//   POST /panic, POST /panic/reset, GET /panic/status, GET /healthz, GET /
class ControlRouter {
public:
    ControlRouter(
        std::shared_ptr<core::PanicOrchestrator> orchestrator,
        std::shared_ptr<core::IExchangeGateway> gateway,
        HttpConfig config,
        nlohmann::json config_summary = nlohmann::json::object()
    );

    ControlResponse handle(
        const std::string& method,
        const std::string& target,
        const std::string& remote_ip,
        const std::string& body = ""
    );

    bool isAllowed(const std::string& remote_ip) const;

private:
    ControlResponse triggerPanic(const std::string& body);
    ControlResponse resetPanic();
    ControlResponse panicStatus();
    ControlResponse health();
    ControlResponse index();

    std::shared_ptr<core::PanicOrchestrator> orchestrator_;
    std::shared_ptr<core::IExchangeGateway> gateway_;
    HttpConfig config_;
    nlohmann::json config_summary_;
};

} // namespace server
} // namespace riskguard
