#include "thread_store.hpp"

#include <algorithm>

const std::string& item_id(const Item& item) {
    return std::visit([](const auto& i) -> const std::string& { return i.id; }, item);
}

ThreadStore::ThreadStore(RandomSource& random) : random_(random) {}

std::vector<Thread> ThreadStore::list(bool include_archived) const {
    std::vector<Thread> out(active_.begin(), active_.end());
    if (include_archived) {
        out.insert(out.end(), archived_.begin(), archived_.end());
    }
    return out;
}

const Thread& ThreadStore::create(const NewThread& seed) {
    Thread t{
        .id = unique_id(),
        .name = seed.name,
        .cwd = seed.cwd,
        .archived = false,
        .model_provider = seed.model_provider,
        .created_at = seed.now,
        .updated_at = seed.now,
        .status = {},
        .preview = "",
        .cli_version = seed.cli_version,
        .source = seed.source,
    };
    turns_[t.id];
    active_.push_front(std::move(t));
    return active_.front();
}

bool ThreadStore::insert(Thread thread) {
    if (find(thread.id)) return false;
    turns_[thread.id];
    if (thread.archived) {
        archived_.push_back(std::move(thread));
    } else {
        active_.push_back(std::move(thread));
    }
    return true;
}

Thread* ThreadStore::find(const std::string& id) {
    auto by_id = [&id](const Thread& t) { return t.id == id; };
    if (auto it = std::ranges::find_if(active_, by_id); it != active_.end()) return &*it;
    if (auto it = std::ranges::find_if(archived_, by_id); it != archived_.end()) return &*it;
    return nullptr;
}

const Thread* ThreadStore::find(const std::string& id) const {
    return const_cast<ThreadStore*>(this)->find(id);
}

bool ThreadStore::archive(const std::string& id) {
    auto it = std::ranges::find_if(active_, [&id](const Thread& t) { return t.id == id; });
    if (it == active_.end()) return false;

    Thread t = std::move(*it);
    active_.erase(it);
    t.archived = true;
    archived_.push_back(std::move(t));
    return true;
}

bool ThreadStore::unarchive(const std::string& id) {
    auto it = std::ranges::find_if(archived_, [&id](const Thread& t) { return t.id == id; });
    if (it == archived_.end()) return false;

    Thread t = std::move(*it);
    archived_.erase(it);
    t.archived = false;
    active_.push_back(std::move(t));
    return true;
}

bool ThreadStore::rename(const std::string& id, const std::string& name) {
    auto* t = find(id);
    if (!t) return false;
    t->name = name;
    return true;
}

bool ThreadStore::set_status(const std::string& id, ThreadStatus status, int64_t now) {
    auto* t = find(id);
    if (!t) return false;
    t->status = std::move(status);
    t->updated_at = now;
    return true;
}

const std::vector<Turn>& ThreadStore::turns(const std::string& thread_id) const {
    static const std::vector<Turn> empty;
    auto it = turns_.find(thread_id);
    return it != turns_.end() ? it->second : empty;
}

void ThreadStore::append_turn(const std::string& thread_id, Turn turn) {
    turns_[thread_id].push_back(std::move(turn));
}

Turn* ThreadStore::find_turn(const std::string& thread_id, const std::string& turn_id) {
    auto it = turns_.find(thread_id);
    if (it == turns_.end()) return nullptr;
    auto t = std::ranges::find_if(it->second, [&turn_id](const Turn& t) { return t.id == turn_id; });
    return t != it->second.end() ? &*t : nullptr;
}

bool ThreadStore::mark_loaded(const std::string& id) {
    if (is_loaded(id)) return false;
    loaded_.push_back(id);
    return true;
}

bool ThreadStore::is_loaded(const std::string& id) const {
    return std::ranges::find(loaded_, id) != loaded_.end();
}

std::string ThreadStore::unique_id() {
    std::string id;
    do {
        id = random_.hex_id("thread");
    } while (find(id) || turns_.contains(id));
    return id;
}
