#include "turn_sequencer.hpp"

#include "protocol.hpp"

#include <chrono>

using json = nlohmann::json;

std::string_view to_string(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::Pending: return "pending";
        case TurnPhase::Started: return "started";
        case TurnPhase::Streaming: return "streaming";
        case TurnPhase::Approval: return "approval";
        case TurnPhase::ToolExecution: return "toolExecution";
        case TurnPhase::UsageUpdate: return "usageUpdate";
        case TurnPhase::Completed: return "completed";
        case TurnPhase::Aborted: return "aborted";
    }
    return "pending";
}

TurnSequencer::TurnSequencer(TurnContext ctx, const Config& config, std::string thread_id,
                             std::vector<ContentBlock> input)
    : ctx_(std::move(ctx)), turn_cfg_(config.turn), limits_cfg_(config.rate_limits),
      thread_id_(std::move(thread_id)),
      turn_id_(ctx_.random.hex_id("turn")),
      message_item_id_(ctx_.random.hex_id("agent")),
      command_item_id_(ctx_.random.hex_id("cmd")),
      input_(std::move(input)),
      deltas_(split_deltas(turn_cfg_.response_text)) {}

std::vector<std::string> TurnSequencer::split_deltas(const std::string& text) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (true) {
        auto space = text.find(' ', pos);
        if (space == std::string::npos) {
            out.push_back(text.substr(pos));
            break;
        }
        out.push_back(text.substr(pos, space - pos + 1));
        pos = space + 1;
    }
    return out;
}

template <typename T>
T* TurnSequencer::stored_item(const std::string& id) {
    if (!recorded_) return nullptr;
    auto* turn = ctx_.store.find_turn(thread_id_, turn_id_);
    if (!turn) return nullptr;
    for (auto& item : turn->items) {
        if (auto* typed = std::get_if<T>(&item); typed && typed->id == id) return typed;
    }
    return nullptr;
}

void TurnSequencer::start() {
    if (phase_ != TurnPhase::Pending) return;
    after(turn_cfg_.start_delay_ms, &TurnSequencer::begin);
}

void TurnSequencer::cancel() {
    if (finished()) return;
    finish(TurnPhase::Aborted);
}

std::vector<json> TurnSequencer::interrupt() {
    std::vector<json> closing;
    if (finished()) return closing;

    if (message_open_) {
        // Completed with what was streamed so far, so the deltas still add up.
        AgentMessageItem item{message_item_id_, streamed_text_};
        closing.push_back(rpc::notification("item/completed", {
            {"threadId", thread_id_}, {"turnId", turn_id_}, {"item", wire::to_json(Item{item})},
        }));
        message_open_ = false;
    }

    if (command_open_) {
        CommandExecutionItem item{
            .id = command_item_id_,
            .command = turn_cfg_.command,
            .status = ItemStatus::Completed,
            .exit_code = std::nullopt,
            .aggregated_output = "",
        };
        if (auto* stored = stored_item<CommandExecutionItem>(command_item_id_)) {
            *stored = item;
        }
        closing.push_back(rpc::notification("item/completed", {
            {"threadId", thread_id_}, {"turnId", turn_id_}, {"item", wire::to_json(Item{item})},
        }));
        command_open_ = false;
    }

    finish(TurnPhase::Aborted);
    return closing;
}

void TurnSequencer::after(uint32_t delay_ms, Step step) {
    ctx_.scheduler.schedule(std::chrono::milliseconds(delay_ms),
                            [self = shared_from_this(), step] {
                                if (self->finished()) return;
                                ((*self).*step)();
                            });
}

void TurnSequencer::begin() {
    phase_ = TurnPhase::Started;

    if (auto* thread = ctx_.store.find(thread_id_)) {
        Turn turn{.id = turn_id_, .items = {}};
        if (!input_.empty()) {
            turn.items.push_back(UserMessageItem{ctx_.random.hex_id("user"), input_});
            if (thread->preview.empty()) thread->preview = input_.front().text;
        }
        ctx_.store.append_turn(thread_id_, std::move(turn));
        ctx_.store.set_status(thread_id_, {ThreadStatusType::Active, {}}, ctx_.clock());
        recorded_ = true;
    }

    if (!emit("turn/started", {{"threadId", thread_id_}, {"turnId", turn_id_}})) return;
    if (!emit("thread/status/changed", {
            {"threadId", thread_id_},
            {"status", wire::to_json(ThreadStatus{ThreadStatusType::Active, {}})},
        })) return;

    after(turn_cfg_.stream_delay_ms, &TurnSequencer::start_message);
}

void TurnSequencer::start_message() {
    phase_ = TurnPhase::Streaming;

    AgentMessageItem item{message_item_id_, ""};
    record_item(item);
    if (!emit("item/started", {{"threadId", thread_id_}, {"turnId", turn_id_},
                               {"item", wire::to_json(Item{item})}})) return;
    message_open_ = true;
    stream_delta();
}

void TurnSequencer::stream_delta() {
    const auto& delta = deltas_[next_delta_++];
    if (auto* item = stored_item<AgentMessageItem>(message_item_id_)) {
        item->text += delta;
    }

    if (!emit("item/agentMessage/delta", {
            {"threadId", thread_id_},
            {"turnId", turn_id_},
            {"itemId", message_item_id_},
            {"delta", delta},
        })) return;
    streamed_text_ += delta;

    if (next_delta_ < deltas_.size()) {
        after(turn_cfg_.delta_interval_ms, &TurnSequencer::stream_delta);
    } else {
        after(turn_cfg_.delta_interval_ms, &TurnSequencer::complete_message);
    }
}

void TurnSequencer::complete_message() {
    AgentMessageItem item{message_item_id_, turn_cfg_.response_text};
    if (auto* stored = stored_item<AgentMessageItem>(message_item_id_)) {
        stored->text = item.text;
    }
    message_open_ = false;
    if (!emit("item/completed", {{"threadId", thread_id_}, {"turnId", turn_id_},
                                 {"item", wire::to_json(Item{item})}})) return;

    after(turn_cfg_.approval_delay_ms, &TurnSequencer::request_approval);
}

void TurnSequencer::request_approval() {
    phase_ = TurnPhase::Approval;

    // The reply is not awaited; the command runs regardless of the decision.
    const std::string method = "commandExecution/requestApproval";
    auto id = ctx_.open_request(method);
    if (!send(rpc::request(id, method, {
            {"threadId", thread_id_},
            {"turnId", turn_id_},
            {"itemId", command_item_id_},
            {"command", {{"command", turn_cfg_.command}}},
        }))) return;

    after(turn_cfg_.tool_start_delay_ms, &TurnSequencer::start_command);
}

void TurnSequencer::start_command() {
    phase_ = TurnPhase::ToolExecution;

    CommandExecutionItem item{
        .id = command_item_id_,
        .command = turn_cfg_.command,
        .status = ItemStatus::InProgress,
        .exit_code = std::nullopt,
        .aggregated_output = "",
    };
    record_item(item);
    if (!emit("item/started", {{"threadId", thread_id_}, {"turnId", turn_id_},
                               {"item", wire::to_json(Item{item})}})) return;
    command_open_ = true;

    after(turn_cfg_.tool_duration_ms, &TurnSequencer::complete_command);
}

void TurnSequencer::complete_command() {
    CommandExecutionItem item{
        .id = command_item_id_,
        .command = turn_cfg_.command,
        .status = ItemStatus::Completed,
        .exit_code = 0,
        .aggregated_output = turn_cfg_.command_output,
    };
    if (auto* stored = stored_item<CommandExecutionItem>(command_item_id_)) {
        *stored = item;
    }
    command_open_ = false;
    if (!emit("item/completed", {{"threadId", thread_id_}, {"turnId", turn_id_},
                                 {"item", wire::to_json(Item{item})}})) return;

    after(turn_cfg_.usage_delay_ms, &TurnSequencer::update_usage);
}

void TurnSequencer::update_usage() {
    phase_ = TurnPhase::UsageUpdate;

    // Usage only grows here; window resets happen on account/rateLimits/read.
    ctx_.rate_limits.bump(ctx_.random.uniform(static_cast<int>(limits_cfg_.min_bump),
                                              static_cast<int>(limits_cfg_.max_bump)));

    if (!emit("account/rateLimits/updated", {
            {"rateLimits", wire::rate_limits(ctx_.rate_limits.read(), limits_cfg_.plan_type)},
        })) return;

    if (!emit("thread/tokenUsage/updated", {
            {"threadId", thread_id_},
            {"turnId", turn_id_},
            {"tokenUsage", {{"total", {{"totalTokens", ctx_.random.uniform(1000, 5000)}}}}},
        })) return;

    complete();
}

void TurnSequencer::complete() {
    if (recorded_) {
        ctx_.store.set_status(thread_id_, {ThreadStatusType::Idle, {}}, ctx_.clock());
    }

    if (!emit("turn/completed", {{"threadId", thread_id_}, {"turnId", turn_id_}})) return;
    if (!emit("thread/status/changed", {
            {"threadId", thread_id_},
            {"status", wire::to_json(ThreadStatus{ThreadStatusType::Idle, {}})},
        })) return;

    finish(TurnPhase::Completed);
}

bool TurnSequencer::emit(std::string_view method, json params) {
    return send(rpc::notification(method, std::move(params)));
}

bool TurnSequencer::send(const json& msg) {
    if (ctx_.channel.send(msg)) return true;
    finish(TurnPhase::Aborted);
    return false;
}

void TurnSequencer::finish(TurnPhase terminal) {
    if (terminal == TurnPhase::Aborted && recorded_) {
        if (auto* thread = ctx_.store.find(thread_id_);
            thread && thread->status.type == ThreadStatusType::Active) {
            ctx_.store.set_status(thread_id_, {ThreadStatusType::Idle, {}}, ctx_.clock());
        }
    }
    phase_ = terminal;
    if (on_finished_) on_finished_(*this);
}

void TurnSequencer::record_item(Item item) {
    if (!recorded_) return;
    if (auto* turn = ctx_.store.find_turn(thread_id_, turn_id_)) {
        turn->items.push_back(std::move(item));
    }
}
