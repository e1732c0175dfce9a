#include "server/ControlHttpServer.h"

#include "common/Logger.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <sys/socket.h>
#include <sys/time.h>

namespace riskguard {
namespace server {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace {
void serveConnection(tcp::socket socket, std::shared_ptr<ControlRouter> router) {
    beast::error_code ec;
    const std::string remote_ip = socket.remote_endpoint(ec).address().to_string();
    if (ec) {
        return;
    }

    // 요청을 보내지 않는 클라이언트가 종료를 막지 않도록 읽기 타임아웃
    struct timeval tv;
    tv.tv_sec = 10;
    tv.tv_usec = 0;
    if (::setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        LOG_WARN("Control connection from {}: could not set read timeout", remote_ip);
    }

    try {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(socket, buffer, req);

        const auto method_sv = req.method_string();
        const auto target_sv = req.target();
        const std::string method(method_sv.data(), method_sv.size());
        const std::string target(target_sv.data(), target_sv.size());
        const ControlResponse routed = router->handle(method, target, remote_ip, req.body());

        http::response<http::string_body> res;
        res.version(req.version());
        res.result(static_cast<http::status>(routed.status));
        res.set(http::field::server, "riskguard");
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = routed.body.dump(2);
        res.prepare_payload();
        http::write(socket, res);
    } catch (const std::exception& e) {
        LOG_WARN("Control connection from {} dropped: {}", remote_ip, e.what());
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}
} // namespace

ControlHttpServer::ControlHttpServer(std::shared_ptr<ControlRouter> router, HttpConfig config)
    : router_(std::move(router))
    , config_(std::move(config)) {}

ControlHttpServer::~ControlHttpServer() {
    stop();
}

bool ControlHttpServer::start() {
    if (running_) {
        return false;
    }
    running_ = true;
    accept_thread_ = std::make_unique<std::thread>(&ControlHttpServer::acceptLoop, this);
    return true;
}

void ControlHttpServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    if (accept_thread_ && accept_thread_->joinable()) {
        accept_thread_->join();
    }
    pruneFinished(true);
    LOG_INFO("Control server stopped");
}

void ControlHttpServer::acceptLoop() {
    // 연결 스레드가 모두 끝난 뒤에 io_context 가 해제되어야 한다
    asio::io_context ioc;
    try {
        const auto address = asio::ip::make_address(config_.host);
        tcp::acceptor acceptor(ioc);
        const tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.port));
        acceptor.open(endpoint.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen();
        acceptor.non_blocking(true);

        LOG_INFO("Control server listening on {}:{}", config_.host, config_.port);

        while (running_) {
            tcp::socket socket(ioc);
            beast::error_code ec;
            acceptor.accept(socket, ec);

            if (ec == asio::error::would_block || ec == asio::error::try_again) {
                pruneFinished(false);
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            if (ec) {
                LOG_WARN("Control server accept error: {}", ec.message());
                continue;
            }

            socket.non_blocking(false, ec);
            auto done = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lock(connections_mutex_);
            Connection conn;
            conn.done = done;
            conn.worker = std::thread([s = std::move(socket), router = router_, done]() mutable {
                serveConnection(std::move(s), router);
                *done = true;
            });
            connections_.push_back(std::move(conn));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Control server failed: {}", e.what());
        running_ = false;
    }
    pruneFinished(true);
}

void ControlHttpServer::pruneFinished(bool join_all) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (join_all || it->done->load()) {
            if (it->worker.joinable()) {
                it->worker.join();
            }
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace server
} // namespace riskguard
