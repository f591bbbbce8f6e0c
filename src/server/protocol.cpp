#include "protocol.hpp"

using json = nlohmann::json;

namespace rpc {

MessageKind classify(const json& msg) {
    if (!msg.is_object()) return MessageKind::Invalid;

    bool has_id = msg.contains("id") && !msg["id"].is_null();
    if (msg.contains("method") && msg["method"].is_string()) {
        return has_id ? MessageKind::Request : MessageKind::Notification;
    }
    if (has_id && (msg.contains("result") || msg.contains("error"))) {
        return MessageKind::Reply;
    }
    return MessageKind::Invalid;
}

json response(const json& id, json result) {
    return {{"id", id}, {"result", std::move(result)}};
}

json notification(std::string_view method, json params) {
    return {{"method", std::string(method)}, {"params", std::move(params)}};
}

json request(int64_t id, std::string_view method, json params) {
    return {{"id", id}, {"method", std::string(method)}, {"params", std::move(params)}};
}

json params_of(const json& msg) {
    if (msg.contains("params") && msg["params"].is_object()) return msg["params"];
    return json::object();
}

std::string string_param(const json& params, const char* key, const std::string& fallback) {
    if (params.contains(key) && params[key].is_string()) return params[key].get<std::string>();
    return fallback;
}

} // namespace rpc

namespace wire {

std::string_view to_string(ThreadStatusType type) {
    switch (type) {
        case ThreadStatusType::Idle: return "idle";
        case ThreadStatusType::Active: return "active";
        case ThreadStatusType::NotLoaded: return "notLoaded";
    }
    return "idle";
}

std::string_view to_string(ThreadSource source) {
    switch (source) {
        case ThreadSource::Cli: return "cli";
        case ThreadSource::AppServer: return "appServer";
    }
    return "cli";
}

std::string_view to_string(ItemStatus status) {
    switch (status) {
        case ItemStatus::InProgress: return "inProgress";
        case ItemStatus::Completed: return "completed";
    }
    return "completed";
}

json to_json(const ThreadStatus& status) {
    json j = {{"type", std::string(to_string(status.type))}};
    if (status.type == ThreadStatusType::Active) {
        j["activeFlags"] = status.active_flags;
    }
    return j;
}

json to_json(const Thread& thread) {
    return {
        {"id", thread.id},
        {"name", thread.name ? json(*thread.name) : json(nullptr)},
        {"cwd", thread.cwd},
        {"archived", thread.archived},
        {"modelProvider", thread.model_provider},
        {"createdAt", thread.created_at},
        {"updatedAt", thread.updated_at},
        {"status", to_json(thread.status)},
        {"preview", thread.preview},
        {"cliVersion", thread.cli_version},
        {"source", std::string(to_string(thread.source))},
    };
}

namespace {

struct ItemToJson {
    json operator()(const UserMessageItem& i) const {
        json content = json::array();
        for (auto& block : i.content) {
            content.push_back({{"type", block.type}, {"text", block.text}});
        }
        return {{"id", i.id}, {"type", "userMessage"}, {"content", std::move(content)}};
    }

    json operator()(const AgentMessageItem& i) const {
        return {{"id", i.id}, {"type", "agentMessage"}, {"text", i.text}};
    }

    json operator()(const CommandExecutionItem& i) const {
        json j = {
            {"id", i.id},
            {"type", "commandExecution"},
            {"command", i.command},
            {"status", std::string(to_string(i.status))},
        };
        if (i.status == ItemStatus::Completed) {
            j["exitCode"] = i.exit_code ? json(*i.exit_code) : json(nullptr);
            j["aggregatedOutput"] = i.aggregated_output;
        }
        return j;
    }

    json operator()(const FileChangeItem& i) const {
        json changes = json::array();
        for (auto& path : i.paths) {
            changes.push_back({{"path", path}});
        }
        return {
            {"id", i.id},
            {"type", "fileChange"},
            {"status", std::string(to_string(i.status))},
            {"changes", std::move(changes)},
        };
    }

    json operator()(const ReasoningItem& i) const {
        return {{"id", i.id}, {"type", "reasoning"}, {"summary", i.summary}};
    }
};

} // namespace

json to_json(const Item& item) {
    return std::visit(ItemToJson{}, item);
}

json to_json(const Turn& turn) {
    json items = json::array();
    for (auto& item : turn.items) {
        items.push_back(to_json(item));
    }
    return {{"id", turn.id}, {"items", std::move(items)}};
}

json to_json(const std::vector<Turn>& turns) {
    json arr = json::array();
    for (auto& t : turns) {
        arr.push_back(to_json(t));
    }
    return arr;
}

json rate_limits(const RateLimitSnapshot& snap, const std::string& plan_type) {
    return {
        {"limitId", "limit-001"},
        {"limitName", "codex-" + plan_type},
        {"primary", {
            {"usedPercent", snap.used_percent},
            {"windowDurationMins", snap.window_duration_mins},
            {"resetsAt", snap.resets_at},
        }},
        {"planType", plan_type},
    };
}

std::vector<ContentBlock> content_blocks(const json& input) {
    std::vector<ContentBlock> blocks;
    if (!input.is_array()) return blocks;

    for (auto& entry : input) {
        if (!entry.is_object()) continue;
        ContentBlock block;
        block.type = rpc::string_param(entry, "type", "text");
        block.text = rpc::string_param(entry, "text");
        blocks.push_back(std::move(block));
    }
    return blocks;
}

} // namespace wire
