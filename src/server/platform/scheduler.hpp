#pragma once

#include <chrono>
#include <functional>

// Runs tasks on the event loop after a delay. Tasks never run inline from
// schedule(), even with a zero delay.
class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;
    virtual void schedule(std::chrono::milliseconds delay, Task task) = 0;
};
