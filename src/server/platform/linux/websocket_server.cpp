#include "platform/linux/websocket_server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <print>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

class WebSocketServer::Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, Handlers& handlers, std::function<void()> on_closed)
        : ws_(std::move(socket)), handlers_(handlers), on_closed_(std::move(on_closed)) {}

    void start() {
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

        websocket::permessage_deflate pmd;
        pmd.server_enable = false;
        pmd.client_enable = false;
        ws_.set_option(pmd);

        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(beast::http::field::server, "codex-mock-server");
        }));

        ws_.async_accept(beast::bind_front_handler(&Session::on_accept, shared_from_this()));
    }

    bool send(std::string text) {
        if (!open_ || closing_) return false;
        queue_.push_back(std::move(text));
        if (queue_.size() == 1) do_write();
        return true;
    }

    bool is_open() const { return open_ && !closing_; }

    void close(websocket::close_code code) {
        if (finished_ || closing_) return;
        closing_ = true;
        if (!open_) {
            finish();
            return;
        }
        close_reason_ = code;
        if (queue_.empty()) do_close();
    }

    std::string remote() {
        beast::error_code ec;
        auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
        if (ec) return "unknown";
        return ep.address().to_string() + ":" + std::to_string(ep.port());
    }

private:
    void on_accept(beast::error_code ec) {
        if (ec) return fail(ec, "handshake");
        open_ = true;
        if (handlers_.on_connect) handlers_.on_connect(remote());
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) return fail(ec, "read");

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        json msg;
        try {
            msg = json::parse(text);
        } catch (const json::exception& e) {
            std::println(stderr, "ws: undecodable frame, closing connection: {}", e.what());
            close(websocket::close_code::bad_payload);
            return;
        }
        if (!msg.is_object()) {
            std::println(stderr, "ws: frame is not a JSON object, closing connection");
            close(websocket::close_code::bad_payload);
            return;
        }

        if (handlers_.on_message) handlers_.on_message(msg);
        if (!closing_) do_read();
    }

    void do_write() {
        ws_.text(true);
        ws_.async_write(asio::buffer(queue_.front()),
                        beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) return fail(ec, "write");
        if (finished_) return;

        queue_.pop_front();
        if (!queue_.empty()) {
            do_write();
        } else if (closing_) {
            do_close();
        }
    }

    void do_close() {
        ws_.async_close(close_reason_, [self = shared_from_this()](beast::error_code) {
            self->finish();
        });
    }

    void fail(beast::error_code ec, const char* what) {
        if (ec != websocket::error::closed && ec != asio::error::operation_aborted &&
            ec != asio::error::eof) {
            std::println(stderr, "ws: {} failed: {}", what, ec.message());
        }
        finish();
    }

    void finish() {
        if (finished_) return;
        finished_ = true;
        open_ = false;
        queue_.clear();

        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        if (on_closed_) on_closed_();
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> queue_;
    Handlers& handlers_;
    std::function<void()> on_closed_;
    websocket::close_reason close_reason_ = websocket::close_code::normal;
    bool open_ = false;
    bool closing_ = false;
    bool finished_ = false;
};

WebSocketServer::WebSocketServer(asio::io_context& io) : acceptor_(io) {}

WebSocketServer::~WebSocketServer() {
    // The handler targets may already be gone.
    handlers_ = {};
    stop();
}

bool WebSocketServer::start(const std::string& host, uint16_t port) {
    beast::error_code ec;
    auto address = asio::ip::make_address(host, ec);
    if (ec) {
        std::println(stderr, "ws: invalid listen address {}: {}", host, ec.message());
        return false;
    }

    tcp::endpoint endpoint(address, port);
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        std::println(stderr, "ws: open failed: {}", ec.message());
        return false;
    }

    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec) {
        std::println(stderr, "ws: bind to {}:{} failed: {}", host, port, ec.message());
        acceptor_.close(ec);
        return false;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        std::println(stderr, "ws: listen failed: {}", ec.message());
        acceptor_.close(ec);
        return false;
    }

    stopping_ = false;
    do_accept();
    return true;
}

void WebSocketServer::stop() {
    stopping_ = true;

    beast::error_code ignored;
    if (acceptor_.is_open()) acceptor_.close(ignored);

    if (auto session = session_) {
        session->close(websocket::close_code::going_away);
    }
}

uint16_t WebSocketServer::port() const {
    beast::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

bool WebSocketServer::send(const json& msg) {
    if (!session_) return false;
    return session_->send(msg.dump(-1, ' ', false, json::error_handler_t::replace));
}

bool WebSocketServer::is_open() const {
    return session_ && session_->is_open();
}

void WebSocketServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                std::println(stderr, "ws: accept failed: {}", ec.message());
                if (!stopping_) do_accept();
            }
            return;
        }

        session_ = std::make_shared<Session>(std::move(socket), handlers_,
                                             [this] { on_session_closed(); });
        session_->start();
    });
}

void WebSocketServer::on_session_closed() {
    session_.reset();
    if (handlers_.on_disconnect) handlers_.on_disconnect();
    if (!stopping_ && acceptor_.is_open()) do_accept();
}
