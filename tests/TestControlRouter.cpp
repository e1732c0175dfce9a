#include "core/state/LockStoreJson.h"
#include "core/state/RunJournalJsonl.h"
#include "server/ControlRouter.h"
#include "support/FakeAlertSink.h"
#include "support/FakeExchangeGateway.h"
#include "support/TempDir.h"

#include <cassert>
#include <iostream>

using namespace riskguard;
using riskguard::testing::FakeAlertSink;
using riskguard::testing::FakeExchangeGateway;
using riskguard::testing::TempDir;

namespace {

struct RouterFixture {
    explicit RouterFixture(const std::string& name)
        : dir(name)
        , gateway(std::make_shared<FakeExchangeGateway>()) {
        PanicConfig panic;
        panic.verify_timeout_sec = 1;
        panic.verify_poll_ms = 20;
        panic.lock_file = dir.file("panic.lock").string();
        panic.trading_disabled_file = dir.file("trading_disabled.json").string();
        panic.journal_file = dir.file("panic_runs.jsonl").string();

        BackoffConfig backoff;
        backoff.initial_ms = 1;
        backoff.max_ms = 2;
        backoff.max_retries = 1;

        locks = std::make_shared<core::LockStoreJson>(panic.lock_file, panic.trading_disabled_file);
        orchestrator = std::make_shared<core::PanicOrchestrator>(
            gateway, locks, std::make_shared<core::RunJournalJsonl>(panic.journal_file),
            std::make_shared<FakeAlertSink>(), panic, backoff);

        HttpConfig http;
        http.allowlist = {"127.0.0.1", "::1"};
        router = std::make_unique<server::ControlRouter>(orchestrator, gateway, http,
                                                         nlohmann::json{{"alert_channel", "log"}});
    }

    TempDir dir;
    std::shared_ptr<FakeExchangeGateway> gateway;
    std::shared_ptr<core::LockStoreJson> locks;
    std::shared_ptr<core::PanicOrchestrator> orchestrator;
    std::unique_ptr<server::ControlRouter> router;
};

void testAllowlist() {
    RouterFixture f("router_allowlist");
    const auto denied = f.router->handle("GET", "/panic/status", "10.0.0.8");
    assert(denied.status == 403);
    assert(denied.body["client_ip"] == "10.0.0.8");

    assert(f.router->handle("GET", "/panic/status", "127.0.0.1").status == 200);
    assert(f.router->handle("GET", "/panic/status", "::1").status == 200);
    assert(f.router->handle("GET", "/panic/status", "::ffff:127.0.0.1").status == 200);

    // 거부된 요청은 패닉을 실행하지 않는다
    assert(f.router->handle("POST", "/panic", "192.168.1.20").status == 403);
    assert(f.orchestrator->state() == core::PanicState::IDLE);

    std::cout << "[TEST] allowlist PASSED\n";
}

void testRoutingErrors() {
    RouterFixture f("router_routing");
    assert(f.router->handle("GET", "/nope", "127.0.0.1").status == 404);
    assert(f.router->handle("GET", "/panic", "127.0.0.1").status == 405);
    assert(f.router->handle("POST", "/healthz", "127.0.0.1").status == 405);
    assert(f.router->handle("GET", "/panic/status?verbose=1", "127.0.0.1").status == 200);

    const auto index = f.router->handle("GET", "/", "127.0.0.1");
    assert(index.status == 200);
    assert(index.body["endpoints"].contains("POST /panic"));

    std::cout << "[TEST] routing errors PASSED\n";
}

void testPanicThenResetFlow() {
    RouterFixture f("router_flow");
    f.gateway->addPosition("BTCUSDT", PositionSide::LONG, 0.01);
    f.gateway->setSpec("BTCUSDT", 0.001, 0.001);
    f.gateway->addOrder("o1", "BTCUSDT");

    const auto health_before = f.router->handle("GET", "/healthz", "127.0.0.1");
    assert(health_before.status == 200);
    assert(health_before.body["trading_enabled"] == true);
    assert(health_before.body["gateway_reachable"] == true);

    const auto panic = f.router->handle("POST", "/panic", "127.0.0.1", R"({"reason": "drill"})");
    assert(panic.status == 200);
    assert(panic.body["state"] == "LOCKED");
    assert(panic.body["success"] == true);
    assert(panic.body["orders_canceled"] == 1);
    assert(panic.body["positions_closed"] == 1);
    assert(f.locks->loadLock().reason == "drill");

    const auto repeat = f.router->handle("POST", "/panic", "127.0.0.1");
    assert(repeat.status == 200);
    assert(repeat.body["already_locked"] == true);

    const auto status = f.router->handle("GET", "/panic/status", "127.0.0.1");
    assert(status.status == 200);
    assert(status.body["state"] == "LOCKED");
    assert(status.body["lock"]["armed"] == true);
    assert(status.body["trading_disabled"]["trading_disabled"] == true);
    assert(status.body["last_report"].is_object());
    assert(status.body["config"]["alert_channel"] == "log");

    const auto health_locked = f.router->handle("GET", "/healthz", "127.0.0.1");
    assert(health_locked.body["trading_enabled"] == false);
    assert(health_locked.body["panic_armed"] == true);

    const auto reset = f.router->handle("POST", "/panic/reset", "127.0.0.1");
    assert(reset.status == 200);
    assert(reset.body["success"] == true);
    assert(reset.body["code"] == "ok");
    assert(reset.body["state"] == "IDLE");

    const auto reset_again = f.router->handle("POST", "/panic/reset", "127.0.0.1");
    assert(reset_again.status == 409);
    assert(reset_again.body["code"] == "not_armed");

    std::cout << "[TEST] panic then reset PASSED\n";
}

void testFailedRunAndUnreachableGateway() {
    RouterFixture f("router_failed");
    f.gateway->setDown(true);

    const auto health = f.router->handle("GET", "/healthz", "127.0.0.1");
    assert(health.status == 200);
    assert(health.body["gateway_reachable"] == false);

    const auto panic = f.router->handle("POST", "/panic", "127.0.0.1", "not json");
    assert(panic.status == 500);
    assert(panic.body["state"] == "FAILED_PARTIAL");
    assert(panic.body["locked"] == true);

    const auto reset = f.router->handle("POST", "/panic/reset", "127.0.0.1");
    assert(reset.status == 503);
    assert(reset.body["code"] == "gateway_unavailable");

    f.gateway->setDown(false);
    f.gateway->addPosition("ETHUSDT", PositionSide::SHORT, 1.0);
    const auto not_flat = f.router->handle("POST", "/panic/reset", "127.0.0.1");
    assert(not_flat.status == 409);
    assert(not_flat.body["code"] == "not_flat");
    assert(not_flat.body["positions_remaining"] == 1);

    std::cout << "[TEST] failed run and unreachable gateway PASSED\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting ControlRouter Test..." << std::endl;

    testAllowlist();
    testRoutingErrors();
    testPanicThenResetFlow();
    testFailedRunAndUnreachableGateway();

    std::cout << "[TEST] ControlRouter Test PASSED!" << std::endl;
    return 0;
}
