#pragma once

#include "platform/message_channel.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

// WebSocket listener serving one client connection at a time. Each text frame
// carries one JSON object. The next connection is accepted only after the
// current one has closed.
class WebSocketServer : public MessageChannel {
public:
    struct Handlers {
        std::function<void(const std::string& remote)> on_connect;
        std::function<void(const nlohmann::json& msg)> on_message;
        std::function<void()> on_disconnect;
    };

    explicit WebSocketServer(boost::asio::io_context& io);
    ~WebSocketServer() override;

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_handlers(Handlers handlers) { handlers_ = std::move(handlers); }

    bool start(const std::string& host, uint16_t port);
    void stop();

    // Bound port, useful when started on port 0.
    uint16_t port() const;

    bool send(const nlohmann::json& msg) override;
    bool is_open() const override;

private:
    class Session;

    void do_accept();
    void on_session_closed();

    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<Session> session_;
    Handlers handlers_;
    bool stopping_ = false;
};
