#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

class IpcClient {
public:
    // Why the last recv() returned false.
    enum class RecvError { None, Timeout, Closed, Undecodable };

    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& host, uint16_t port) = 0;
    virtual bool send(const nlohmann::json& msg) = 0;
    // Waits up to timeout_ms for the next message. A timeout closes the connection.
    virtual bool recv(nlohmann::json& msg, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
    virtual RecvError last_error() const = 0;
};
