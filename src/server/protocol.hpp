#pragma once

#include "rate_limits.hpp"
#include "thread_store.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

// JSON-RPC style envelopes as spoken over the message stream. There is no
// "jsonrpc" member; a message is classified by which of id/method it carries.
namespace rpc {

enum class MessageKind {
    Request,      // {id, method, params?}
    Notification, // {method, params?}
    Reply,        // {id, result} or {id, error}, answering a server-issued request
    Invalid,
};

MessageKind classify(const nlohmann::json& msg);

nlohmann::json response(const nlohmann::json& id, nlohmann::json result);
nlohmann::json notification(std::string_view method, nlohmann::json params);
nlohmann::json request(int64_t id, std::string_view method, nlohmann::json params);

// Params of an inbound message, or an empty object if absent or not an object.
nlohmann::json params_of(const nlohmann::json& msg);

// params[key] if it is a string, otherwise fallback.
std::string string_param(const nlohmann::json& params, const char* key,
                         const std::string& fallback = "");

} // namespace rpc

// Domain model to wire objects.
namespace wire {

std::string_view to_string(ThreadStatusType type);
std::string_view to_string(ThreadSource source);
std::string_view to_string(ItemStatus status);

nlohmann::json to_json(const ThreadStatus& status);
nlohmann::json to_json(const Thread& thread);
nlohmann::json to_json(const Item& item);
nlohmann::json to_json(const Turn& turn);
nlohmann::json to_json(const std::vector<Turn>& turns);

// Primary window only, as carried by account/rateLimits/updated.
nlohmann::json rate_limits(const RateLimitSnapshot& snap, const std::string& plan_type);

// Input content blocks of turn/start; non-object entries are skipped.
std::vector<ContentBlock> content_blocks(const nlohmann::json& input);

} // namespace wire
