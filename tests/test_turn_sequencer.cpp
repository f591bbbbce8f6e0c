#include <catch2/catch_test_macros.hpp>

#include "mock_platform.hpp"
#include "protocol.hpp"
#include "turn_sequencer.hpp"

#include <map>
#include <memory>
#include <string>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

struct Fixture {
    Config config;
    MockChannel channel;
    ManualScheduler scheduler;
    RandomSource random{7};
    ThreadStore store{random};
    RateLimitModel rate_limits{35, 300, fixed_clock() + 10800, "$42.50"};
    int64_t next_request = 1000;

    Fixture() {
        store.insert(Thread{
            .id = "thread-a",
            .name = "Alpha",
            .cwd = "/work",
            .model_provider = "openai",
            .created_at = 10,
            .updated_at = 10,
            .cli_version = "0.1.0",
            .source = ThreadSource::Cli,
        });
    }

    std::shared_ptr<TurnSequencer> make_turn(const std::string& thread_id,
                                             std::vector<ContentBlock> input = {}) {
        TurnContext ctx{
            .channel = channel,
            .scheduler = scheduler,
            .store = store,
            .rate_limits = rate_limits,
            .random = random,
            .open_request = [this](std::string_view) { return next_request++; },
            .clock = fixed_clock,
        };
        return std::make_shared<TurnSequencer>(std::move(ctx), config, thread_id, std::move(input));
    }
};

const std::vector<std::string> kFullSequence = [] {
    std::vector<std::string> seq = {"turn/started", "thread/status/changed", "item/started"};
    seq.insert(seq.end(), 15, "item/agentMessage/delta");
    seq.insert(seq.end(), {
        "item/completed",
        "commandExecution/requestApproval",
        "item/started",
        "item/completed",
        "account/rateLimits/updated",
        "thread/tokenUsage/updated",
        "turn/completed",
        "thread/status/changed",
    });
    return seq;
}();

} // namespace

TEST_CASE("Turn sequence", "[turn]") {
    Fixture f;

    SECTION("FullSequenceInOrder") {
        auto turn = f.make_turn("thread-a");
        turn->start();
        REQUIRE(f.channel.sent.empty());

        f.scheduler.run_all();
        REQUIRE(f.channel.methods() == kFullSequence);
        REQUIRE(turn->phase() == TurnPhase::Completed);
        REQUIRE(f.scheduler.pending() == 0);
    }

    SECTION("SharedIdsAcrossTheTurn") {
        auto turn = f.make_turn("thread-a");
        turn->start();
        f.scheduler.run_all();

        for (auto& msg : f.channel.sent) {
            auto method = msg["method"].get<std::string>();
            if (method == "account/rateLimits/updated") {
                REQUIRE_FALSE(msg["params"].contains("threadId"));
                continue;
            }
            REQUIRE(msg["params"]["threadId"] == "thread-a");
            if (method != "thread/status/changed") {
                REQUIRE(msg["params"]["turnId"] == turn->turn_id());
            }
        }
    }

    SECTION("DeltasConcatenateToText") {
        f.make_turn("thread-a")->start();
        f.scheduler.run_all();

        auto deltas = f.channel.with_method("item/agentMessage/delta");
        REQUIRE(deltas.size() == 15);

        std::string text;
        for (auto& d : deltas) text += d["params"]["delta"].get<std::string>();
        REQUIRE(text == f.config.turn.response_text);
        REQUIRE(deltas.back()["params"]["delta"] == "changes.");

        auto completed = f.channel.with_method("item/completed");
        REQUIRE(completed[0]["params"]["item"]["text"] == text);
        REQUIRE(deltas[0]["params"]["itemId"] == completed[0]["params"]["item"]["id"]);
    }

    SECTION("EveryStartedItemCompletesOnce") {
        f.make_turn("thread-a")->start();
        f.scheduler.run_all();

        std::map<std::string, int> started;
        std::map<std::string, int> completed;
        for (auto& msg : f.channel.with_method("item/started")) {
            REQUIRE(msg["params"]["item"].value("status", "") != "completed");
            ++started[msg["params"]["item"]["id"].get<std::string>()];
        }
        for (auto& msg : f.channel.with_method("item/completed")) {
            ++completed[msg["params"]["item"]["id"].get<std::string>()];
        }
        REQUIRE(started.size() == 2);
        REQUIRE(started == completed);
        for (auto& [id, n] : started) REQUIRE(n == 1);
    }

    SECTION("CommandItems") {
        f.make_turn("thread-a")->start();
        f.scheduler.run_all();

        auto approval = f.channel.with_method("commandExecution/requestApproval");
        REQUIRE(approval.size() == 1);
        REQUIRE(approval[0]["id"] == 1000);
        REQUIRE(rpc::classify(approval[0]) == rpc::MessageKind::Request);
        REQUIRE(approval[0]["params"]["command"]["command"] == f.config.turn.command);

        auto started = f.channel.with_method("item/started")[1]["params"]["item"];
        REQUIRE(started["type"] == "commandExecution");
        REQUIRE(started["status"] == "inProgress");
        REQUIRE_FALSE(started.contains("exitCode"));
        REQUIRE(started["id"] == approval[0]["params"]["itemId"]);

        auto done = f.channel.with_method("item/completed")[1]["params"]["item"];
        REQUIRE(done["status"] == "completed");
        REQUIRE(done["exitCode"] == 0);
        REQUIRE(done["aggregatedOutput"] == f.config.turn.command_output);
    }

    SECTION("StatusNotifications") {
        f.make_turn("thread-a")->start();
        f.scheduler.run_all();

        auto status = f.channel.with_method("thread/status/changed");
        REQUIRE(status.size() == 2);
        REQUIRE(status[0]["params"]["status"] == json::parse(R"({"type":"active","activeFlags":[]})"));
        REQUIRE(status[1]["params"]["status"] == json::parse(R"({"type":"idle"})"));
    }

    SECTION("UsageUpdate") {
        f.make_turn("thread-a")->start();
        f.scheduler.run_all();

        auto limits = f.channel.with_method("account/rateLimits/updated")[0]["params"]["rateLimits"];
        int used = limits["primary"]["usedPercent"].get<int>();
        REQUIRE(used >= 37);
        REQUIRE(used <= 42);
        REQUIRE(used == f.rate_limits.read().used_percent);
        REQUIRE(limits["planType"] == "pro");

        auto usage = f.channel.with_method("thread/tokenUsage/updated")[0]["params"];
        int tokens = usage["tokenUsage"]["total"]["totalTokens"].get<int>();
        REQUIRE(tokens >= 1000);
        REQUIRE(tokens <= 5000);
    }

    SECTION("UsageClampsAtHundred") {
        f.rate_limits = RateLimitModel(99, 300, fixed_clock() + 10800, "$0");
        f.make_turn("thread-a")->start();
        f.scheduler.run_all();

        auto limits = f.channel.with_method("account/rateLimits/updated")[0]["params"]["rateLimits"];
        REQUIRE(limits["primary"]["usedPercent"] == 100);

        f.channel.sent.clear();
        f.make_turn("thread-a")->start();
        f.scheduler.run_all();
        limits = f.channel.with_method("account/rateLimits/updated")[0]["params"]["rateLimits"];
        REQUIRE(limits["primary"]["usedPercent"] == 100);
    }

    SECTION("ElapsedWindowDoesNotResetUsage") {
        // The reset time has already passed when the turn runs
        f.rate_limits = RateLimitModel(60, 300, fixed_clock() - 60, "$0");
        auto before = f.rate_limits.read();

        f.make_turn("thread-a")->start();
        f.scheduler.run_all();

        auto limits = f.channel.with_method("account/rateLimits/updated")[0]["params"]["rateLimits"];
        int used = limits["primary"]["usedPercent"].get<int>();
        REQUIRE(used >= 62);
        REQUIRE(used <= 67);
        REQUIRE(f.rate_limits.read().used_percent >= before.used_percent);
        REQUIRE(f.rate_limits.read().resets_at == before.resets_at);
    }

    SECTION("Pacing") {
        f.make_turn("thread-a")->start();

        f.scheduler.advance(299ms);
        REQUIRE(f.channel.sent.empty());

        f.scheduler.advance(1ms);
        REQUIRE(f.channel.sent.size() == 2);

        // Message starts after the stream delay with its first fragment
        f.scheduler.advance(500ms);
        REQUIRE(f.channel.sent.size() == 4);

        f.scheduler.advance(80ms);
        REQUIRE(f.channel.sent.size() == 5);

        f.scheduler.run_all();
        REQUIRE(f.scheduler.now() == 4100ms);
    }

    SECTION("RecordsTurnInStore") {
        auto turn = f.make_turn("thread-a", {{"text", "Please fix it"}});
        turn->start();
        f.scheduler.advance(1000ms);

        REQUIRE(f.store.find("thread-a")->status.type == ThreadStatusType::Active);
        REQUIRE(f.store.find("thread-a")->preview == "Please fix it");

        f.scheduler.run_all();
        const auto& turns = f.store.turns("thread-a");
        REQUIRE(turns.size() == 1);
        REQUIRE(turns[0].id == turn->turn_id());
        REQUIRE(turns[0].items.size() == 3);

        auto* user = std::get_if<UserMessageItem>(&turns[0].items[0]);
        REQUIRE(user != nullptr);
        REQUIRE(user->content[0].text == "Please fix it");

        auto* agent = std::get_if<AgentMessageItem>(&turns[0].items[1]);
        REQUIRE(agent != nullptr);
        REQUIRE(agent->text == f.config.turn.response_text);

        auto* cmd = std::get_if<CommandExecutionItem>(&turns[0].items[2]);
        REQUIRE(cmd != nullptr);
        REQUIRE(cmd->status == ItemStatus::Completed);
        REQUIRE(cmd->exit_code == 0);

        REQUIRE(f.store.find("thread-a")->status.type == ThreadStatusType::Idle);
    }

    SECTION("UnknownThreadStillStreams") {
        f.make_turn("ghost")->start();
        f.scheduler.run_all();

        REQUIRE(f.channel.methods() == kFullSequence);
        REQUIRE(f.store.find("ghost") == nullptr);
        REQUIRE(f.store.turns("ghost").empty());
    }

    SECTION("ChannelFailureAbortsTurn") {
        f.channel.fail_after = 5;
        bool finished = false;

        auto turn = f.make_turn("thread-a");
        turn->set_on_finished([&](const TurnSequencer& t) {
            finished = true;
            REQUIRE(t.phase() == TurnPhase::Aborted);
        });
        turn->start();
        f.scheduler.run_all();

        REQUIRE(finished);
        REQUIRE(f.channel.sent.size() == 5);
        REQUIRE(f.scheduler.pending() == 0);
        REQUIRE(f.store.find("thread-a")->status.type == ThreadStatusType::Idle);
    }

    SECTION("CancelStopsRemainingSteps") {
        auto turn = f.make_turn("thread-a");
        turn->start();
        f.scheduler.advance(1000ms);
        auto sent = f.channel.sent.size();

        turn->cancel();
        REQUIRE(turn->phase() == TurnPhase::Aborted);
        REQUIRE(f.store.find("thread-a")->status.type == ThreadStatusType::Idle);

        f.scheduler.run_all();
        REQUIRE(f.channel.sent.size() == sent);

        // Cancelling twice is harmless
        turn->cancel();
        REQUIRE(turn->phase() == TurnPhase::Aborted);
    }

    SECTION("InterruptClosesOpenMessage") {
        auto turn = f.make_turn("thread-a");
        turn->start();
        f.scheduler.advance(880ms);
        REQUIRE(turn->started());
        REQUIRE(f.channel.with_method("item/agentMessage/delta").size() == 2);

        auto closing = turn->interrupt();
        REQUIRE(closing.size() == 1);
        REQUIRE(closing[0]["method"] == "item/completed");
        REQUIRE(closing[0]["params"]["item"]["text"] == "I'll help ");
        REQUIRE(turn->phase() == TurnPhase::Aborted);
        REQUIRE_FALSE(turn->started());

        f.scheduler.run_all();
        REQUIRE(f.channel.with_method("item/agentMessage/delta").size() == 2);
        REQUIRE(turn->interrupt().empty());
    }

    SECTION("InterruptBetweenItemsClosesNothing") {
        auto turn = f.make_turn("thread-a");
        turn->start();
        f.scheduler.advance(2500ms);
        REQUIRE(f.channel.with_method("item/completed").size() == 1);

        REQUIRE(turn->interrupt().empty());
        REQUIRE(f.store.find("thread-a")->status.type == ThreadStatusType::Idle);
    }

    SECTION("ConcurrentTurnsInterleave") {
        f.make_turn("thread-a")->start();
        f.scheduler.advance(100ms);
        f.make_turn("thread-b")->start();
        f.scheduler.run_all();

        std::vector<std::string> a;
        std::vector<std::string> b;
        for (auto& msg : f.channel.sent) {
            if (!msg["params"].contains("threadId")) continue;
            (msg["params"]["threadId"] == "thread-a" ? a : b).push_back(msg["method"].get<std::string>());
        }
        REQUIRE(a.size() == kFullSequence.size() - 1);
        REQUIRE(b.size() == kFullSequence.size() - 1);
        REQUIRE(f.channel.with_method("commandExecution/requestApproval")[1]["id"] == 1001);
    }
}

TEST_CASE("Delta splitting", "[turn]") {
    SECTION("KeepsSeparators") {
        auto parts = TurnSequencer::split_deltas("one two three");
        REQUIRE(parts == std::vector<std::string>{"one ", "two ", "three"});
    }

    SECTION("SingleWord") {
        REQUIRE(TurnSequencer::split_deltas("word") == std::vector<std::string>{"word"});
    }

    SECTION("EmptyText") {
        REQUIRE(TurnSequencer::split_deltas("") == std::vector<std::string>{""});
    }

    SECTION("RepeatedSpaces") {
        auto parts = TurnSequencer::split_deltas("a  b ");
        REQUIRE(parts == std::vector<std::string>{"a ", " ", "b ", ""});
        std::string joined;
        for (auto& p : parts) joined += p;
        REQUIRE(joined == "a  b ");
    }
}
