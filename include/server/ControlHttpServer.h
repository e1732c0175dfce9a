#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "common/GuardConfig.h"
#include "server/ControlRouter.h"

namespace riskguard {
namespace server {

// Boost.Beast 동기 HTTP 서버. 연결마다 스레드 하나 (패닉 실행 중에도 status 응답).
class ControlHttpServer {
public:
    ControlHttpServer(std::shared_ptr<ControlRouter> router, HttpConfig config);
    ~ControlHttpServer();

    bool start();
    void stop();
    bool isRunning() const { return running_; }

private:
    struct Connection {
        std::thread worker;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void acceptLoop();
    void pruneFinished(bool join_all);

    std::shared_ptr<ControlRouter> router_;
    HttpConfig config_;
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> accept_thread_;

    std::mutex connections_mutex_;
    std::list<Connection> connections_;
};

} // namespace server
} // namespace riskguard
