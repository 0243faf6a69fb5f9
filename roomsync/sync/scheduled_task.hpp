#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "common.hpp"

// Runs `job` every `period` on a strand of the given executor until cancelled.
// Jobs that touch a room take that room's serialization lock themselves.
class ScheduledTask : public std::enable_shared_from_this<ScheduledTask> {
public:
    ScheduledTask(net::any_io_executor executor, std::string name,
                  std::chrono::steady_clock::duration period, std::function<void()> job);

    ScheduledTask(const ScheduledTask&) = delete;
    ScheduledTask& operator=(const ScheduledTask&) = delete;

    void start();
    void cancel();
    const std::string &name() const;

private:
    net::awaitable<void> run(std::shared_ptr<ScheduledTask> self);

    net::strand<net::any_io_executor> m_strand;
    net::steady_timer m_timer;
    std::string m_name;
    std::chrono::steady_clock::duration m_period;
    std::function<void()> m_job;
    std::atomic<bool> m_cancelled{false};
};
