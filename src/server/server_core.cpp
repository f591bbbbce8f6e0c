#include "server_core.hpp"

#include "protocol.hpp"
#include "seed_data.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <print>

using json = nlohmann::json;

ServerCore::ServerCore(Config config, bool verbose, MessageChannel& channel,
                       Scheduler& scheduler, Clock clock)
    : config_(std::move(config)), verbose_(verbose),
      channel_(channel), scheduler_(scheduler),
      clock_(std::move(clock)),
      store_(random_),
      rate_limits_(static_cast<int>(config_.rate_limits.used_percent),
                   static_cast<int>(config_.rate_limits.window_mins),
                   clock_() + config_.rate_limits.resets_in_s,
                   config_.rate_limits.credit_balance) {}

ServerCore::~ServerCore() {
    auto running = std::move(turns_);
    for (auto& t : running) {
        t->set_on_finished(nullptr);
        t->cancel();
    }
}

void ServerCore::init() {
    if (config_.seed_demo_data) {
        seed_demo_data(store_, clock_());
        log(std::format("Seeded {} active, {} archived threads",
                        store_.active_count(), store_.archived_count()));
    }
}

int64_t ServerCore::system_clock_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

void ServerCore::handle_message(const json& msg) {
    auto kind = rpc::classify(msg);
    if (kind == rpc::MessageKind::Reply) {
        handle_reply(msg);
        return;
    }

    // Requests without an id and unrecognizable objects are still answered.
    std::string method = kind == rpc::MessageKind::Invalid ? "" : msg["method"].get<std::string>();
    json id = msg.contains("id") ? msg["id"] : json(nullptr);
    log(std::format("<- {} (id={})", method, id.dump()));

    auto reply = handle_request(method, rpc::params_of(msg));

    if (!channel_.send(rpc::response(id, std::move(reply.result)))) {
        log("-> response dropped, connection closed");
        return;
    }
    for (auto& n : reply.notifications) {
        if (!channel_.send(n)) return;
    }
}

ServerCore::Reply ServerCore::handle_request(const std::string& method, const json& params) {
    if (method == "initialize") return handle_initialize(params);
    if (method == "thread/list") return handle_thread_list(params);
    if (method == "thread/loaded/list") return handle_loaded_list(params);
    if (method == "thread/start") return handle_thread_start(params);
    if (method == "thread/resume") return handle_thread_resume(params);
    if (method == "thread/archive") return handle_thread_archive(params);
    if (method == "thread/unarchive") return handle_thread_unarchive(params);
    if (method == "thread/name/set") return handle_thread_rename(params);
    if (method == "account/read") return handle_account_read(params);
    if (method == "account/rateLimits/read") return handle_rate_limits_read(params);
    if (method == "turn/start") return handle_turn_start(params);
    if (method == "turn/interrupt") return handle_turn_interrupt(params);

    log(std::format("-> empty result for {}", method));
    return {};
}

ServerCore::Reply ServerCore::handle_initialize(const json& /*params*/) {
    return {.result = {{"userAgent", "codex-mock-server/0.1.0"}}, .notifications = {}};
}

ServerCore::Reply ServerCore::handle_thread_list(const json& params) {
    bool show_archived = params.contains("showArchived") && params["showArchived"].is_boolean()
                         && params["showArchived"].get<bool>();

    json data = json::array();
    for (auto& t : store_.list(show_archived)) {
        data.push_back(wire::to_json(t));
    }
    log(std::format("-> {} threads (showArchived={})", data.size(), show_archived));
    return {.result = {{"data", std::move(data)}, {"nextCursor", nullptr}}, .notifications = {}};
}

ServerCore::Reply ServerCore::handle_loaded_list(const json& /*params*/) {
    json data = json::array();
    for (auto& id : store_.loaded()) {
        data.push_back({{"id", id}});
    }
    return {.result = {{"data", std::move(data)}, {"nextCursor", nullptr}}, .notifications = {}};
}

ServerCore::Reply ServerCore::handle_thread_start(const json& params) {
    const auto& defaults = config_.thread_defaults;
    auto model = rpc::string_param(params, "model", defaults.model);
    auto cwd = rpc::string_param(params, "cwd", defaults.cwd);

    const auto& thread = store_.create(NewThread{
        .name = std::nullopt,
        .cwd = cwd,
        .model_provider = defaults.model_provider,
        .now = clock_(),
        .cli_version = defaults.cli_version,
        .source = ThreadSource::AppServer,
    });
    store_.mark_loaded(thread.id);
    log("-> created new thread " + thread.id);

    auto thread_json = wire::to_json(thread);
    thread_json["turns"] = json::array();

    Reply reply;
    reply.result = {
        {"thread", thread_json},
        {"model", model},
        {"modelProvider", defaults.model_provider},
        {"cwd", cwd},
        {"approvalPolicy", defaults.approval_policy},
        {"sandbox", {{"type", defaults.sandbox}}},
    };
    reply.notifications.push_back(rpc::notification("thread/started", {{"thread", thread_json}}));
    return reply;
}

ServerCore::Reply ServerCore::handle_thread_resume(const json& params) {
    auto thread_id = rpc::string_param(params, "threadId");
    auto* thread = store_.find(thread_id);
    const auto& turns = store_.turns(thread_id);

    json name = "Unknown";
    std::string provider = "openai";
    if (thread) {
        name = thread->name ? json(*thread->name) : json(nullptr);
        provider = thread->model_provider;
        // Archived threads keep their stored status.
        if (!thread->archived && thread->status.type == ThreadStatusType::NotLoaded) {
            store_.set_status(thread_id, {ThreadStatusType::Idle, {}}, thread->updated_at);
        }
    }
    store_.mark_loaded(thread_id);
    log(std::format("-> resumed {} ({} turns)", thread_id, turns.size()));

    return {
        .result = {
            {"thread", {{"id", thread_id}, {"name", name}, {"turns", wire::to_json(turns)}}},
            {"modelProvider", provider},
        },
        .notifications = {},
    };
}

ServerCore::Reply ServerCore::handle_thread_archive(const json& params) {
    auto thread_id = rpc::string_param(params, "threadId", "?");
    if (!store_.archive(thread_id)) {
        log("-> archive: no active thread " + thread_id);
    }

    Reply reply;
    reply.notifications.push_back(rpc::notification("thread/archived", {{"threadId", thread_id}}));
    return reply;
}

ServerCore::Reply ServerCore::handle_thread_unarchive(const json& params) {
    auto thread_id = rpc::string_param(params, "threadId", "?");

    Reply reply;
    if (store_.unarchive(thread_id)) {
        reply.result = {{"thread", wire::to_json(*store_.find(thread_id))}};
    } else {
        log("-> unarchive: no archived thread " + thread_id);
    }
    reply.notifications.push_back(rpc::notification("thread/unarchived", {{"threadId", thread_id}}));
    return reply;
}

ServerCore::Reply ServerCore::handle_thread_rename(const json& params) {
    auto thread_id = rpc::string_param(params, "threadId", "?");
    auto name = rpc::string_param(params, "name", "Unnamed");
    store_.rename(thread_id, name);
    log(std::format("-> renamed {} to '{}'", thread_id, name));

    Reply reply;
    reply.notifications.push_back(rpc::notification("thread/name/updated", {
        {"threadId", thread_id},
        {"threadName", name},
    }));
    return reply;
}

ServerCore::Reply ServerCore::handle_account_read(const json& /*params*/) {
    return {
        .result = {
            {"account", {
                {"type", "chatgpt"},
                {"email", "dev@example.com"},
                {"planType", config_.rate_limits.plan_type},
            }},
            {"requiresOpenaiAuth", false},
        },
        .notifications = {},
    };
}

ServerCore::Reply ServerCore::handle_rate_limits_read(const json& /*params*/) {
    rate_limits_.roll_window(clock_());

    auto limits = wire::rate_limits(rate_limits_.read(), config_.rate_limits.plan_type);
    limits["secondary"] = nullptr;
    limits["credits"] = {
        {"hasCredits", true},
        {"unlimited", false},
        {"balance", rate_limits_.credit_balance()},
    };
    log(std::format("-> rate limits ({}% used)", rate_limits_.read().used_percent));
    return {
        .result = {{"rateLimits", std::move(limits)}, {"rateLimitsByLimitId", nullptr}},
        .notifications = {},
    };
}

ServerCore::Reply ServerCore::handle_turn_start(const json& params) {
    auto thread_id = rpc::string_param(params, "threadId");
    auto input = params.contains("input") ? wire::content_blocks(params["input"])
                                          : std::vector<ContentBlock>{};
    start_turn(thread_id, std::move(input));
    return {};
}

ServerCore::Reply ServerCore::handle_turn_interrupt(const json& params) {
    auto thread_id = rpc::string_param(params, "threadId");

    Reply reply;
    bool was_active = false;
    if (config_.turn.interrupt_cancels) {
        was_active = interrupt_turns(thread_id, reply.notifications);
    }
    log("-> interrupted " + thread_id);

    reply.notifications.push_back(rpc::notification("turn/completed", {{"threadId", thread_id}}));
    if (was_active) {
        reply.notifications.push_back(rpc::notification("thread/status/changed", {
            {"threadId", thread_id},
            {"status", wire::to_json(ThreadStatus{ThreadStatusType::Idle, {}})},
        }));
    }
    return reply;
}

void ServerCore::handle_reply(const json& msg) {
    const auto& id = msg["id"];
    if (!id.is_number_integer()) {
        log("reply with non-integer id " + id.dump() + " ignored");
        return;
    }

    auto it = pending_requests_.find(id.get<int64_t>());
    if (it == pending_requests_.end()) {
        log("reply to unknown request " + id.dump() + " ignored");
        return;
    }

    if (msg.contains("error")) {
        log(std::format("<- {} (id={}) failed: {}", it->second, it->first, msg["error"].dump()));
    } else {
        log(std::format("<- {} (id={}) answered: {}", it->second, it->first, msg["result"].dump()));
    }
    pending_requests_.erase(it);
}

void ServerCore::start_turn(const std::string& thread_id, std::vector<ContentBlock> input) {
    TurnContext ctx{
        .channel = channel_,
        .scheduler = scheduler_,
        .store = store_,
        .rate_limits = rate_limits_,
        .random = random_,
        .open_request = [this](std::string_view method) { return open_request(method); },
        .clock = clock_,
    };

    auto turn = std::make_shared<TurnSequencer>(std::move(ctx), config_, thread_id, std::move(input));
    turn->set_on_finished([this](const TurnSequencer& t) {
        log(std::format("~> turn {} on {} {}", t.turn_id(), t.thread_id(), to_string(t.phase())));
        std::erase_if(turns_, [&t](const auto& p) { return p.get() == &t; });
    });
    turns_.push_back(turn);
    turn->start();
    log(std::format("-> turn/start ack, turn {} on {}", turn->turn_id(), thread_id));
}

bool ServerCore::interrupt_turns(const std::string& thread_id, std::vector<json>& out) {
    bool any_started = false;
    auto running = turns_;
    for (auto& t : running) {
        if (t->thread_id() != thread_id) continue;
        if (t->started()) any_started = true;
        for (auto& n : t->interrupt()) {
            out.push_back(std::move(n));
        }
    }
    return any_started;
}

void ServerCore::on_disconnect() {
    auto running = turns_;
    for (auto& t : running) {
        t->cancel();
    }
    pending_requests_.clear();
}

int64_t ServerCore::open_request(std::string_view method) {
    auto id = next_request_id_++;
    pending_requests_.emplace(id, std::string(method));

    if (pending_requests_.size() > kMaxPendingRequests) {
        auto oldest = pending_requests_.begin();
        log(std::format("no reply to {} (id={}), dropping it", oldest->second, oldest->first));
        pending_requests_.erase(oldest);
    }
    return id;
}

void ServerCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[codex-mock] {}", msg);
    }
}
