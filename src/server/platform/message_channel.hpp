#pragma once

#include <nlohmann/json.hpp>

// Outbound half of the client connection, shared by the router and running turns.
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    // Queue one message for the connected client. Returns false if there is no
    // open connection to deliver to.
    virtual bool send(const nlohmann::json& msg) = 0;
    virtual bool is_open() const = 0;
};
