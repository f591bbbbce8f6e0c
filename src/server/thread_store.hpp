#pragma once

#include "random_source.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

enum class ThreadStatusType { Idle, Active, NotLoaded };

struct ThreadStatus {
    ThreadStatusType type = ThreadStatusType::Idle;
    std::vector<std::string> active_flags; // only meaningful when Active
};

enum class ThreadSource { Cli, AppServer };

struct Thread {
    std::string id;
    std::optional<std::string> name;
    std::string cwd;
    bool archived = false;
    std::string model_provider;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    ThreadStatus status;
    std::string preview;
    std::string cli_version;
    ThreadSource source = ThreadSource::Cli;
};

enum class ItemStatus { InProgress, Completed };

struct ContentBlock {
    std::string type = "text";
    std::string text;
};

struct UserMessageItem {
    std::string id;
    std::vector<ContentBlock> content;
};

struct AgentMessageItem {
    std::string id;
    std::string text;
};

struct CommandExecutionItem {
    std::string id;
    std::string command;
    ItemStatus status = ItemStatus::InProgress;
    std::optional<int> exit_code;
    std::string aggregated_output;
};

struct FileChangeItem {
    std::string id;
    ItemStatus status = ItemStatus::Completed;
    std::vector<std::string> paths;
};

struct ReasoningItem {
    std::string id;
    std::vector<std::string> summary;
};

using Item = std::variant<UserMessageItem, AgentMessageItem, CommandExecutionItem,
                          FileChangeItem, ReasoningItem>;

const std::string& item_id(const Item& item);

struct Turn {
    std::string id;
    std::vector<Item> items;
};

// Fields a caller supplies when creating a thread; the store assigns the id.
struct NewThread {
    std::optional<std::string> name;
    std::string cwd;
    std::string model_provider;
    int64_t now = 0;
    std::string cli_version;
    ThreadSource source = ThreadSource::AppServer;
};

// In-memory registry of threads, split into an active and an archived collection,
// plus per-thread turn histories and the loaded-thread set.
class ThreadStore {
public:
    explicit ThreadStore(RandomSource& random);

    ThreadStore(const ThreadStore&) = delete;
    ThreadStore& operator=(const ThreadStore&) = delete;

    // Active threads in order, followed by archived ones if requested.
    std::vector<Thread> list(bool include_archived) const;

    // Generates a fresh id and inserts the thread at the front of the active collection.
    const Thread& create(const NewThread& seed);

    // Inserts a fully formed thread (seed data). Returns false if the id is taken.
    bool insert(Thread thread);

    Thread* find(const std::string& id);
    const Thread* find(const std::string& id) const;

    // Move between collections. No-op returning false if the thread is not
    // in the source collection.
    bool archive(const std::string& id);
    bool unarchive(const std::string& id);

    // No-op returning false if the thread is unknown.
    bool rename(const std::string& id, const std::string& name);
    bool set_status(const std::string& id, ThreadStatus status, int64_t now);

    // Turn history. Unknown threads have an empty history.
    const std::vector<Turn>& turns(const std::string& thread_id) const;
    void append_turn(const std::string& thread_id, Turn turn);
    Turn* find_turn(const std::string& thread_id, const std::string& turn_id);

    // Loaded-thread set, in insertion order. mark_loaded returns false if already present.
    bool mark_loaded(const std::string& id);
    bool is_loaded(const std::string& id) const;
    const std::vector<std::string>& loaded() const { return loaded_; }

    size_t active_count() const { return active_.size(); }
    size_t archived_count() const { return archived_.size(); }

private:
    std::string unique_id();

    RandomSource& random_;
    std::deque<Thread> active_;
    std::vector<Thread> archived_;
    std::unordered_map<std::string, std::vector<Turn>> turns_;
    std::vector<std::string> loaded_;
};
