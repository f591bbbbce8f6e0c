#pragma once

#include "config.hpp"
#include "platform/linux/asio_scheduler.hpp"
#include "platform/linux/websocket_server.hpp"
#include "server_core.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cstdint>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();

    // Safe to call from any thread.
    void request_stop();

    uint16_t port() const { return ws_server_.port(); }

private:
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Single-threaded: the router, every running turn and the transport all
    // execute on this context, so shared state needs no locking.
    boost::asio::io_context io_;
    boost::asio::signal_set signals_;
    AsioScheduler scheduler_;
    WebSocketServer ws_server_;

    // Portable protocol logic
    ServerCore core_;
};
