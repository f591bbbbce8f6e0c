#pragma once

#include "platform/scheduler.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>

// Scheduler backed by one steady_timer per task on the event loop's io_context.
class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::io_context& io) : io_(io) {}

    void schedule(std::chrono::milliseconds delay, Task task) override {
        auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
        timer->async_wait([timer, task = std::move(task)](const boost::system::error_code& ec) {
            if (!ec) task();
        });
    }

private:
    boost::asio::io_context& io_;
};
