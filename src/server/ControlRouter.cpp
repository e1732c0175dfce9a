#include "server/ControlRouter.h"

#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "core/model/RecordSchema.h"

#include <algorithm>

namespace riskguard {
namespace server {

namespace {
std::string normalizeIp(const std::string& ip) {
    // IPv4-mapped IPv6 (::ffff:127.0.0.1)
    const std::string mapped = "::ffff:";
    if (ip.compare(0, mapped.size(), mapped) == 0) {
        return ip.substr(mapped.size());
    }
    return ip;
}

std::string stripQuery(const std::string& target) {
    const auto pos = target.find('?');
    return (pos == std::string::npos) ? target : target.substr(0, pos);
}

ControlResponse error(int status, const std::string& message) {
    ControlResponse res;
    res.status = status;
    res.body = {{"error", message}, {"timestamp", common::toIso8601(common::nowMs())}};
    return res;
}

const char* resetCodeToString(core::ResetCode code) {
    switch (code) {
        case core::ResetCode::OK: return "ok";
        case core::ResetCode::NOT_ARMED: return "not_armed";
        case core::ResetCode::RUN_IN_PROGRESS: return "run_in_progress";
        case core::ResetCode::NOT_FLAT: return "not_flat";
        case core::ResetCode::GATEWAY_UNAVAILABLE: return "gateway_unavailable";
        case core::ResetCode::STORE_WRITE_FAILED: return "store_write_failed";
    }
    return "unknown";
}
} // namespace

ControlRouter::ControlRouter(
    std::shared_ptr<core::PanicOrchestrator> orchestrator,
    std::shared_ptr<core::IExchangeGateway> gateway,
    HttpConfig config,
    nlohmann::json config_summary
)
    : orchestrator_(std::move(orchestrator))
    , gateway_(std::move(gateway))
    , config_(std::move(config))
    , config_summary_(std::move(config_summary)) {}

bool ControlRouter::isAllowed(const std::string& remote_ip) const {
    const std::string ip = normalizeIp(remote_ip);
    return std::find(config_.allowlist.begin(), config_.allowlist.end(), ip) != config_.allowlist.end() ||
           std::find(config_.allowlist.begin(), config_.allowlist.end(), remote_ip) != config_.allowlist.end();
}

ControlResponse ControlRouter::handle(
    const std::string& method,
    const std::string& target,
    const std::string& remote_ip,
    const std::string& body
) {
    if (!isAllowed(remote_ip)) {
        LOG_WARN("Control request from non-allowlisted address {} rejected ({} {})", remote_ip, method, target);
        ControlResponse res = error(403, "Access denied");
        res.body["client_ip"] = remote_ip;
        return res;
    }

    const std::string path = stripQuery(target);
    try {
        if (path == "/panic") {
            if (method != "POST") return error(405, "method not allowed");
            return triggerPanic(body);
        }
        if (path == "/panic/reset") {
            if (method != "POST") return error(405, "method not allowed");
            return resetPanic();
        }
        if (path == "/panic/status") {
            if (method != "GET") return error(405, "method not allowed");
            return panicStatus();
        }
        if (path == "/healthz") {
            if (method != "GET") return error(405, "method not allowed");
            return health();
        }
        if (path == "/") {
            if (method != "GET") return error(405, "method not allowed");
            return index();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Control request {} {} failed: {}", method, path, e.what());
        return error(500, e.what());
    }
    return error(404, "not found");
}

ControlResponse ControlRouter::triggerPanic(const std::string& body) {
    std::string reason = "control endpoint";
    if (!body.empty()) {
        try {
            const auto parsed = nlohmann::json::parse(body);
            if (parsed.is_object() && parsed.contains("reason") && parsed["reason"].is_string()) {
                reason = parsed["reason"].get<std::string>();
            }
        } catch (const nlohmann::json::exception&) {
            // 본문이 JSON 이 아니어도 패닉은 실행한다
        }
    }

    LOG_WARN("[API] Panic request received: {}", reason);
    const auto outcome = orchestrator_->trigger(reason);

    ControlResponse res;
    res.body = core::toJson(outcome.report);
    res.body["state"] = core::panicStateToString(outcome.state);

    if (outcome.accepted) {
        res.status = (outcome.state == core::PanicState::LOCKED) ? 200 : 500;
        return res;
    }
    if (core::execution::PanicStateMachine::isTerminal(outcome.state)) {
        res.status = 200;
        res.body["already_locked"] = true;
        return res;
    }
    res.status = 202;
    res.body["in_progress"] = true;
    return res;
}

ControlResponse ControlRouter::resetPanic() {
    LOG_WARN("[API] Reset request received");
    const auto outcome = orchestrator_->reset();

    ControlResponse res;
    res.body = {
        {"success", outcome.ok()},
        {"code", resetCodeToString(outcome.code)},
        {"message", outcome.message},
        {"positions_remaining", outcome.positions_remaining},
        {"orders_remaining", outcome.orders_remaining},
        {"state", core::panicStateToString(orchestrator_->state())}
    };

    switch (outcome.code) {
        case core::ResetCode::OK:
            res.status = 200;
            break;
        case core::ResetCode::NOT_FLAT:
        case core::ResetCode::NOT_ARMED:
        case core::ResetCode::RUN_IN_PROGRESS:
            res.status = 409;
            break;
        case core::ResetCode::GATEWAY_UNAVAILABLE:
            res.status = 503;
            break;
        case core::ResetCode::STORE_WRITE_FAILED:
            res.status = 500;
            break;
    }
    return res;
}

ControlResponse ControlRouter::panicStatus() {
    const auto status = orchestrator_->status();

    ControlResponse res;
    res.body["state"] = core::panicStateToString(status.state);
    res.body["running"] = status.running;
    res.body["lock"] = core::toJson(status.lock);
    res.body["trading_disabled"] = core::toJson(status.trading_disabled);
    res.body["last_report"] = status.last_report.has_value()
        ? core::toJson(*status.last_report)
        : nlohmann::json(nullptr);
    res.body["config"] = config_summary_;
    return res;
}

ControlResponse ControlRouter::health() {
    const auto status = orchestrator_->status();

    bool reachable = false;
    try {
        gateway_->getMarginState();
        reachable = true;
    } catch (const std::exception& e) {
        LOG_WARN("Health check: gateway unreachable: {}", e.what());
    }

    ControlResponse res;
    res.status = 200;
    res.body = {
        {"status", "healthy"},
        {"timestamp", common::toIso8601(common::nowMs())},
        {"trading_enabled", !status.trading_disabled.disabled && !status.lock.armed},
        {"panic_armed", status.lock.armed},
        {"state", core::panicStateToString(status.state)},
        {"gateway_reachable", reachable}
    };
    return res;
}

ControlResponse ControlRouter::index() {
    ControlResponse res;
    res.body = {
        {"name", "RiskGuard panic control"},
        {"endpoints", {
            {"POST /panic", "Execute emergency panic procedure"},
            {"POST /panic/reset", "Reset panic state"},
            {"GET /panic/status", "Panic system status"},
            {"GET /healthz", "Health check"}
        }},
        {"state", core::panicStateToString(orchestrator_->state())}
    };
    return res;
}

} // namespace server
} // namespace riskguard
