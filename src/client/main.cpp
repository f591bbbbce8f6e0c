#include "platform/linux/websocket_client.hpp"
#include "protocol.hpp"

#include <charconv>
#include <chrono>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <method> [--params JSON]", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  --host ADDR        Server address (default 127.0.0.1)");
    std::println(stderr, "  --port N           Server port (default 8080)");
    std::println(stderr, "  --listen SECONDS   Print notifications for this long after the response");
    std::println(stderr, "Examples:");
    std::println(stderr, "  {} thread/list --params '{{\"showArchived\":true}}'", prog);
    std::println(stderr, "  {} --listen 6 turn/start --params '{{\"threadId\":\"thread-001-abc\"}}'", prog);
}

template <typename T>
static bool parse_number(const std::string& s, T& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// Answer server-issued requests the way an auto-approving client would.
static json answer_server_request(const json& msg) {
    auto method = msg.value("method", "");
    if (method == "commandExecution/requestApproval" || method == "fileChange/requestApproval") {
        return rpc::response(msg["id"], {{"decision", "accept"}});
    }
    return rpc::response(msg["id"], json::object());
}

int main(int argc, char* argv[]) {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    int listen_s = 0;
    std::string method;
    json params = json::object();

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            if (!parse_number(argv[++i], port)) {
                std::println(stderr, "Invalid port: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--listen" && i + 1 < argc) {
            if (!parse_number(argv[++i], listen_s)) {
                std::println(stderr, "Invalid listen duration: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--params" && i + 1 < argc) {
            try {
                params = json::parse(argv[++i]);
            } catch (const json::exception& e) {
                std::println(stderr, "Invalid --params: {}", e.what());
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (method.empty()) {
            method = arg;
        }
    }

    if (method.empty()) {
        usage(argv[0]);
        return 1;
    }

    WebSocketClient client;
    if (!client.connect(host, port)) {
        std::println(stderr, "Failed to connect to ws://{}:{}", host, port);
        std::println(stderr, "Is codex-mock-server running?");
        return 1;
    }

    constexpr int request_id = 1;
    if (!client.send({{"id", request_id}, {"method", method}, {"params", params}})) {
        std::println(stderr, "Failed to send request");
        return 1;
    }

    // Notifications may arrive before the response only from a turn already running.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(listen_s);
    bool answered = false;

    while (true) {
        int timeout_ms = 30000;
        if (answered) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) break;
            timeout_ms = static_cast<int>(left.count());
        }

        json msg;
        if (!client.recv(msg, timeout_ms)) {
            auto error = client.last_error();
            if (error == IpcClient::RecvError::Undecodable) {
                // Skip the bad frame; the connection is still usable.
                continue;
            }
            if (!answered) {
                if (error == IpcClient::RecvError::Timeout) {
                    std::println(stderr, "No response from server (timeout)");
                } else {
                    std::println(stderr, "Connection closed before the response arrived");
                }
                return 1;
            }
            break;
        }

        switch (rpc::classify(msg)) {
            case rpc::MessageKind::Reply:
                if (msg["id"] == request_id) {
                    answered = true;
                    std::println("{}", msg.value("result", json::object()).dump(2));
                }
                break;
            case rpc::MessageKind::Request:
                std::println("<- request {} (id={})", msg.value("method", ""), msg["id"].dump());
                if (!client.send(answer_server_request(msg))) {
                    std::println(stderr, "Failed to answer server request");
                }
                break;
            case rpc::MessageKind::Notification:
                std::println("<- {} {}", msg.value("method", ""), msg.value("params", json::object()).dump());
                break;
            case rpc::MessageKind::Invalid:
                std::println("<- {}", msg.dump());
                break;
        }
    }

    client.close();
    return 0;
}
