#pragma once

#include "config.hpp"
#include "platform/message_channel.hpp"
#include "platform/scheduler.hpp"
#include "random_source.hpp"
#include "rate_limits.hpp"
#include "thread_store.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

enum class TurnPhase {
    Pending,
    Started,
    Streaming,
    Approval,
    ToolExecution,
    UsageUpdate,
    Completed,
    Aborted,
};

std::string_view to_string(TurnPhase phase);

// Shared collaborators a turn runs against. All of them outlive every turn.
struct TurnContext {
    using Clock = std::function<int64_t()>;
    using RequestOpener = std::function<int64_t(std::string_view method)>;

    MessageChannel& channel;
    Scheduler& scheduler;
    ThreadStore& store;
    RateLimitModel& rate_limits;
    RandomSource& random;
    RequestOpener open_request; // allocates the id of a server-to-client request
    Clock clock;                // unix seconds
};

// Scripted, time-paced simulation of one turn. Steps run strictly in phase order,
// separated by the configured delays. Each pending step holds a reference to the
// sequencer, so a started turn keeps itself alive until it completes or aborts.
class TurnSequencer : public std::enable_shared_from_this<TurnSequencer> {
public:
    using FinishedCallback = std::function<void(const TurnSequencer&)>;

    TurnSequencer(TurnContext ctx, const Config& config, std::string thread_id,
                  std::vector<ContentBlock> input);

    TurnSequencer(const TurnSequencer&) = delete;
    TurnSequencer& operator=(const TurnSequencer&) = delete;

    // Schedule the first step. Must be owned by a shared_ptr.
    void start();

    // Drop all remaining steps. Nothing further is sent.
    void cancel();

    // Stop the turn and return the item/completed notifications that close the
    // items it left open. The caller sends them.
    std::vector<nlohmann::json> interrupt();

    void set_on_finished(FinishedCallback cb) { on_finished_ = std::move(cb); }

    TurnPhase phase() const { return phase_; }
    bool finished() const { return phase_ == TurnPhase::Completed || phase_ == TurnPhase::Aborted; }
    // turn/started has gone out and the turn has not ended yet.
    bool started() const { return phase_ != TurnPhase::Pending && !finished(); }
    const std::string& thread_id() const { return thread_id_; }
    const std::string& turn_id() const { return turn_id_; }

    // Response text split into delta fragments; the fragments concatenate to the text.
    static std::vector<std::string> split_deltas(const std::string& text);

private:
    using Step = void (TurnSequencer::*)();

    void after(uint32_t delay_ms, Step step);

    void begin();
    void start_message();
    void stream_delta();
    void complete_message();
    void request_approval();
    void start_command();
    void complete_command();
    void update_usage();
    void complete();

    bool emit(std::string_view method, nlohmann::json params);
    bool send(const nlohmann::json& msg);
    void finish(TurnPhase terminal);

    void record_item(Item item);
    template <typename T>
    T* stored_item(const std::string& id);

    TurnContext ctx_;
    Config::Turn turn_cfg_;
    Config::RateLimits limits_cfg_;

    std::string thread_id_;
    std::string turn_id_;
    std::string message_item_id_;
    std::string command_item_id_;
    std::vector<ContentBlock> input_;

    std::vector<std::string> deltas_;
    size_t next_delta_ = 0;
    std::string streamed_text_;

    // Items announced with item/started and not yet completed.
    bool message_open_ = false;
    bool command_open_ = false;

    TurnPhase phase_ = TurnPhase::Pending;
    bool recorded_ = false;
    FinishedCallback on_finished_;
};
