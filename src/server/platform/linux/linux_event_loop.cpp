#include "platform/linux/linux_event_loop.hpp"

#include <boost/asio/post.hpp>
#include <chrono>
#include <csignal>
#include <format>
#include <print>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      signals_(io_, SIGINT, SIGTERM),
      scheduler_(io_),
      ws_server_(io_),
      core_(config_, verbose_, ws_server_, scheduler_) {}

LinuxEventLoop::~LinuxEventLoop() = default;

bool LinuxEventLoop::init() {
    ws_server_.set_handlers({
        .on_connect = [this](const std::string& remote) {
            log("Client connected from " + remote);
        },
        .on_message = [this](const nlohmann::json& msg) {
            core_.handle_message(msg);
        },
        .on_disconnect = [this] {
            log("Client disconnected");
            core_.on_disconnect();
        },
    });

    if (!ws_server_.start(config_.server.host, config_.server.port)) return false;
    log(std::format("Listening on ws://{}:{}", config_.server.host, ws_server_.port()));

    core_.init();

    signals_.async_wait([this](const boost::system::error_code& ec, int /*signo*/) {
        if (ec) return;
        log("Received signal, shutting down");
        request_stop();
    });

    return true;
}

void LinuxEventLoop::run() {
    io_.run();

    // Clean shutdown
    core_.on_disconnect();
}

void LinuxEventLoop::request_stop() {
    boost::asio::post(io_, [this] {
        ws_server_.stop();
        signals_.cancel();
        core_.on_disconnect();
        // Grace period for the close handshake
        scheduler_.schedule(std::chrono::milliseconds(250), [this] { io_.stop(); });
    });
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[codex-mock] {}", msg);
    }
}
