#pragma once

#include "config.hpp"
#include "platform/message_channel.hpp"
#include "platform/scheduler.hpp"
#include "random_source.hpp"
#include "rate_limits.hpp"
#include "thread_store.hpp"
#include "turn_sequencer.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Protocol handling for one simulated backend: dispatches inbound messages,
// owns the process-wide thread and quota state, and launches turns.
class ServerCore {
public:
    using Clock = TurnContext::Clock;

    // Outcome of a handled request: the result object, then the notifications
    // that must follow the response, in order.
    struct Reply {
        nlohmann::json result = nlohmann::json::object();
        std::vector<nlohmann::json> notifications;
    };

    ServerCore(Config config, bool verbose, MessageChannel& channel, Scheduler& scheduler,
               Clock clock = system_clock_seconds);
    ~ServerCore();

    ServerCore(const ServerCore&) = delete;
    ServerCore& operator=(const ServerCore&) = delete;

    void init();

    // Entry point for every decoded inbound message.
    void handle_message(const nlohmann::json& msg);

    Reply handle_request(const std::string& method, const nlohmann::json& params);

    // Connection went away; running turns have nowhere to send.
    void on_disconnect();

    ThreadStore& store() { return store_; }
    const RateLimitModel& rate_limits() const { return rate_limits_; }
    size_t active_turns() const { return turns_.size(); }
    size_t pending_server_requests() const { return pending_requests_.size(); }

    static int64_t system_clock_seconds();

private:
    Reply handle_initialize(const nlohmann::json& params);
    Reply handle_thread_list(const nlohmann::json& params);
    Reply handle_loaded_list(const nlohmann::json& params);
    Reply handle_thread_start(const nlohmann::json& params);
    Reply handle_thread_resume(const nlohmann::json& params);
    Reply handle_thread_archive(const nlohmann::json& params);
    Reply handle_thread_unarchive(const nlohmann::json& params);
    Reply handle_thread_rename(const nlohmann::json& params);
    Reply handle_account_read(const nlohmann::json& params);
    Reply handle_rate_limits_read(const nlohmann::json& params);
    Reply handle_turn_start(const nlohmann::json& params);
    Reply handle_turn_interrupt(const nlohmann::json& params);

    void handle_reply(const nlohmann::json& msg);

    void start_turn(const std::string& thread_id, std::vector<ContentBlock> input);
    // Stops the thread's running turns and appends the notifications that close
    // their open items. Returns true if any of them had already started.
    bool interrupt_turns(const std::string& thread_id, std::vector<nlohmann::json>& out);
    int64_t open_request(std::string_view method);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    MessageChannel& channel_;
    Scheduler& scheduler_;
    Clock clock_;

    RandomSource random_;
    ThreadStore store_;
    RateLimitModel rate_limits_;

    std::vector<std::shared_ptr<TurnSequencer>> turns_;

    // Server-to-client requests awaiting a reply, by id. Ids grow monotonically,
    // so the oldest entry is first. Capped at kMaxPendingRequests.
    static constexpr size_t kMaxPendingRequests = 64;
    std::map<int64_t, std::string> pending_requests_;
    int64_t next_request_id_ = 1000;
};
