#pragma once

#include "platform/ipc_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <memory>

class WebSocketClient : public IpcClient {
public:
    WebSocketClient();
    ~WebSocketClient() override;

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    bool connect(const std::string& host, uint16_t port) override;
    bool send(const nlohmann::json& msg) override;
    bool recv(nlohmann::json& msg, int timeout_ms = 30000) override;
    void close() override;
    RecvError last_error() const override { return last_error_; }

private:
    using Stream = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

    void drop();

    boost::asio::io_context io_;
    std::unique_ptr<Stream> ws_;
    boost::beast::flat_buffer buffer_;
    RecvError last_error_ = RecvError::None;
};
