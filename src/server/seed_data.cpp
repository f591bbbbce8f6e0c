#include "seed_data.hpp"

namespace {

Thread seed_thread(std::string id, std::string name, std::string cwd, std::string provider,
                   int64_t created_at, int64_t updated_at, std::string preview) {
    return Thread{
        .id = std::move(id),
        .name = std::move(name),
        .cwd = std::move(cwd),
        .archived = false,
        .model_provider = std::move(provider),
        .created_at = created_at,
        .updated_at = updated_at,
        .status = {},
        .preview = std::move(preview),
        .cli_version = "0.1.0",
        .source = ThreadSource::Cli,
    };
}

} // namespace

void seed_demo_data(ThreadStore& store, int64_t now) {
    store.insert(seed_thread("thread-001-abc", "Fix authentication bug", "/Users/dev/myproject",
                             "openai", now - 3600, now - 1800, "Fix the login bug"));
    store.insert(seed_thread("thread-002-def", "Add unit tests for parser", "/Users/dev/parser",
                             "openai", now - 7200, now - 3600, "Write tests"));
    store.insert(seed_thread("thread-003-ghi", "Refactor database layer", "/Users/dev/database",
                             "anthropic", now - 86400, now - 43200, "Refactor DB"));

    auto old = seed_thread("thread-004-old", "Old migration script", "/Users/dev/migrations",
                           "openai", now - 172800, now - 172800, "DB migration");
    old.archived = true;
    old.status.type = ThreadStatusType::NotLoaded;
    store.insert(std::move(old));

    store.append_turn("thread-001-abc", Turn{
        .id = "turn-1",
        .items = {
            UserMessageItem{"item-1a", {{"text", "Fix the login bug where users get 401 after token refresh"}}},
            AgentMessageItem{"item-1b", "I'll investigate the authentication flow. Let me start by "
                                        "looking at the token refresh logic."},
            CommandExecutionItem{"item-1c", "grep -r 'refreshToken' src/auth/", ItemStatus::Completed,
                                 0, "src/auth/token.ts:42: async refreshToken()"},
            FileChangeItem{"item-1d", ItemStatus::Completed,
                           {"src/auth/token.ts", "src/auth/middleware.ts"}},
            AgentMessageItem{"item-1e", "I found the issue. The token refresh was not properly "
                                        "updating the Authorization header. I've fixed it in both files."},
        },
    });

    store.append_turn("thread-002-def", Turn{
        .id = "turn-2",
        .items = {
            UserMessageItem{"item-2a", {{"text", "Write tests for the JSON parser module"}}},
            ReasoningItem{"item-2b", {"Need to test edge cases: empty input, nested objects, unicode strings"}},
            AgentMessageItem{"item-2c", "I'll create comprehensive tests for the JSON parser covering edge cases."},
        },
    });

    store.mark_loaded("thread-001-abc");
    store.mark_loaded("thread-002-def");
}
