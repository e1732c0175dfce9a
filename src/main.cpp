#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "common/TimeUtils.h"
#include "core/adapters/BybitExchangeGateway.h"
#include "core/adapters/TelegramAlertSink.h"
#include "core/model/Errors.h"
#include "core/model/RecordSchema.h"
#include "core/orchestration/PanicOrchestrator.h"
#include "core/risk/DailyLossBreaker.h"
#include "core/risk/RiskMonitor.h"
#include "core/state/CommandStoreJson.h"
#include "core/state/LockStoreJson.h"
#include "core/state/RunJournalJsonl.h"
#include "network/BybitHttpClient.h"
#include "server/ControlHttpServer.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace riskguard;

namespace {

std::atomic<bool> g_shutdown{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void printUsage() {
    std::cout << "Usage: RiskGuard <command> [--config <path>]\n"
              << "  monitor          margin utilization monitor (publishes risk commands)\n"
              << "  panic-server     emergency stop control server\n"
              << "  pnl <usdt>       record a realized PnL delta for the daily loss breaker\n"
              << "  pnl-stats        print today's realized PnL\n";
}

std::string statePath(const std::string& relative) {
    return utils::PathUtils::resolveRelativePath(relative).string();
}

std::shared_ptr<core::ILockStore> makeLockStore(const Config& cfg) {
    const auto panic = cfg.getPanicConfig();
    return std::make_shared<core::LockStoreJson>(statePath(panic.lock_file), statePath(panic.trading_disabled_file));
}

std::shared_ptr<core::IExchangeGateway> makeGateway(const Config& cfg) {
    cfg.requireCredentials();
    const auto exchange = cfg.getExchangeConfig();
    auto http = std::make_shared<network::BybitHttpClient>(
        cfg.getApiKey(), cfg.getApiSecret(), exchange.base_url, exchange.recv_window_ms, exchange.timeout_ms);
    return std::make_shared<core::BybitExchangeGateway>(http, exchange);
}

std::shared_ptr<core::IAlertSink> makeAlertSink(const Config& cfg) {
    const auto alert = cfg.getAlertConfig();
    if (alert.channel == "telegram" && !alert.telegram_bot_token.empty() && !alert.telegram_chat_id.empty()) {
        return std::make_shared<core::TelegramAlertSink>(alert.telegram_bot_token, alert.telegram_chat_id, alert.bot_name);
    }
    return std::make_shared<core::LogAlertSink>(alert.bot_name);
}

void waitForShutdown(const std::function<void()>& tick, std::chrono::seconds tick_every) {
    auto last_tick = std::chrono::steady_clock::now();
    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (tick && std::chrono::steady_clock::now() - last_tick >= tick_every) {
            try {
                tick();
            } catch (const std::exception& e) {
                LOG_ERROR("Periodic task failed: {}", e.what());
            }
            last_tick = std::chrono::steady_clock::now();
        }
    }
}

int runMonitor(const Config& cfg) {
    const auto monitor_cfg = cfg.getRiskMonitorConfig();
    auto gateway = makeGateway(cfg);
    auto store = std::make_shared<core::CommandStoreJson>(statePath(monitor_cfg.command_file));
    auto lock_store = makeLockStore(cfg);

    DailyLossConfig daily_cfg = cfg.getDailyLossConfig();
    daily_cfg.state_file = statePath(daily_cfg.state_file);
    core::DailyLossBreaker breaker(daily_cfg, lock_store);

    core::RiskMonitor monitor(gateway, store, monitor_cfg);
    if (!monitor.start()) {
        return 1;
    }

    waitForShutdown([&]() {
        if (daily_cfg.enabled) {
            breaker.rolloverIfNewDay(common::nowMs());
        }
    }, std::chrono::seconds(60));

    LOG_INFO("Shutdown requested");
    monitor.stop();
    return 0;
}

int runPanicServer(const Config& cfg) {
    auto gateway = makeGateway(cfg);
    auto lock_store = makeLockStore(cfg);
    auto journal = std::make_shared<core::RunJournalJsonl>(statePath(cfg.getPanicConfig().journal_file));

    auto orchestrator = std::make_shared<core::PanicOrchestrator>(
        gateway, lock_store, journal, makeAlertSink(cfg),
        cfg.getPanicConfig(), cfg.getBackoffConfig(), cfg.getExchangeConfig().symbols);

    auto router = std::make_shared<server::ControlRouter>(orchestrator, gateway, cfg.getHttpConfig(), cfg.summary());
    server::ControlHttpServer http_server(router, cfg.getHttpConfig());

    const auto flag = lock_store->loadTradingDisabled();
    LOG_INFO("Panic state: {}, trading {}", core::panicStateToString(orchestrator->state()),
             flag.disabled ? "DISABLED" : "enabled");

    if (!http_server.start()) {
        return 1;
    }
    waitForShutdown(nullptr, std::chrono::seconds(0));

    LOG_INFO("Shutdown requested");
    http_server.stop();
    return 0;
}

int runPnl(const Config& cfg, int argc, char* argv[], int arg_index) {
    DailyLossConfig daily_cfg = cfg.getDailyLossConfig();
    daily_cfg.state_file = statePath(daily_cfg.state_file);
    core::DailyLossBreaker breaker(daily_cfg, makeLockStore(cfg));

    if (arg_index >= argc) {
        std::cerr << "pnl requires a USDT amount\n";
        return 1;
    }
    double delta = 0.0;
    try {
        delta = std::stod(argv[arg_index]);
    } catch (const std::exception&) {
        std::cerr << "invalid amount: " << argv[arg_index] << "\n";
        return 1;
    }

    const auto stats = breaker.recordRealizedPnl(delta, common::nowMs());
    std::cout << stats.date << " realized=" << stats.realized_pnl << " USDT trades=" << stats.trades
              << " stopped=" << (stats.stopped ? "yes" : "no") << "\n";
    return 0;
}

int runPnlStats(const Config& cfg) {
    DailyLossConfig daily_cfg = cfg.getDailyLossConfig();
    daily_cfg.state_file = statePath(daily_cfg.state_file);
    core::DailyLossBreaker breaker(daily_cfg, makeLockStore(cfg));

    const auto s = breaker.stats(common::nowMs());
    std::cout << "date:        " << s.date << "\n"
              << "realized:    " << s.realized_pnl << " USDT\n"
              << "target:      " << s.target_pnl << " USDT (" << s.progress_pct << "%)\n"
              << "loss limit:  " << s.loss_limit << " USDT\n"
              << "trades:      " << s.trades << "\n"
              << "loss streak: " << s.loss_streak << "\n"
              << "stopped:     " << (s.stopped ? "yes (" + s.stop_reason + ")" : std::string("no")) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    std::string config_path = "config/riskguard.json";
    int arg_index = 2;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[i + 1];
            if (i == arg_index) {
                arg_index += 2;
            }
            ++i;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto& cfg = Config::getInstance();
        cfg.load(config_path);
        cfg.validate();

        Logger::getInstance().initialize(utils::PathUtils::resolveRelativePath(cfg.getLogDir()).string(),
                                         cfg.getLogLevel());
        LOG_INFO("RiskGuard {} starting", command);

        if (command == "monitor") {
            return runMonitor(cfg);
        }
        if (command == "panic-server") {
            return runPanicServer(cfg);
        }
        if (command == "pnl") {
            return runPnl(cfg, argc, argv, arg_index);
        }
        if (command == "pnl-stats") {
            return runPnlStats(cfg);
        }
        printUsage();
        return 1;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        LOG_ERROR("Fatal: {}", e.what());
        return 1;
    }
}
