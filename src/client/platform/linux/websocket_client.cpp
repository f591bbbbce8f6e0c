#include "platform/linux/websocket_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <print>
#include <string>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

WebSocketClient::WebSocketClient() = default;

WebSocketClient::~WebSocketClient() {
    close();
}

bool WebSocketClient::connect(const std::string& host, uint16_t port) {
    close();

    beast::error_code ec;
    tcp::resolver resolver(io_);
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) return false;

    ws_ = std::make_unique<Stream>(io_);
    asio::connect(ws_->next_layer(), results, ec);
    if (ec) {
        drop();
        return false;
    }

    websocket::permessage_deflate pmd;
    pmd.client_enable = false;
    ws_->set_option(pmd);

    ws_->handshake(host + ":" + std::to_string(port), "/", ec);
    if (ec) {
        drop();
        return false;
    }
    ws_->text(true);
    return true;
}

bool WebSocketClient::send(const nlohmann::json& msg) {
    if (!ws_) return false;
    beast::error_code ec;
    ws_->write(asio::buffer(msg.dump()), ec);
    return !ec;
}

bool WebSocketClient::recv(nlohmann::json& msg, int timeout_ms) {
    last_error_ = RecvError::Closed;
    if (!ws_) return false;

    beast::error_code result = asio::error::would_block;
    ws_->async_read(buffer_, [&result](beast::error_code ec, std::size_t) { result = ec; });

    io_.restart();
    io_.run_for(std::chrono::milliseconds(timeout_ms));

    if (result == asio::error::would_block) {
        // Cancelling a websocket read leaves the stream unusable.
        drop();
        last_error_ = RecvError::Timeout;
        return false;
    }
    if (result) {
        drop();
        return false;
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    try {
        msg = nlohmann::json::parse(text);
        last_error_ = RecvError::None;
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "Undecodable message from server: {}", e.what());
        last_error_ = RecvError::Undecodable;
        return false;
    }
}

void WebSocketClient::close() {
    if (!ws_) return;
    if (ws_->is_open()) {
        beast::error_code ec;
        ws_->close(websocket::close_code::normal, ec);
    }
    drop();
}

void WebSocketClient::drop() {
    if (!ws_) return;
    beast::error_code ignored;
    ws_->next_layer().close(ignored);

    // Flush the handler of any read cut short by the close.
    io_.restart();
    io_.run();

    ws_.reset();
    buffer_.clear();
}
