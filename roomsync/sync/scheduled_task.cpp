#include "sync/scheduled_task.hpp"
#include <spdlog/spdlog.h>

ScheduledTask::ScheduledTask(net::any_io_executor executor, std::string name,
                             std::chrono::steady_clock::duration period, std::function<void()> job)
    : m_strand(net::make_strand(executor)), m_timer(m_strand), m_name(std::move(name)),
      m_period(period), m_job(std::move(job)) {
}

void ScheduledTask::start() {
    net::co_spawn(m_strand, run(shared_from_this()), LogOnCatch("scheduled task " + m_name));
}

void ScheduledTask::cancel() {
    m_cancelled = true;
    net::post(m_strand, [self = shared_from_this()]{
        self->m_timer.cancel();
    });
}

const std::string &ScheduledTask::name() const {
    return m_name;
}

net::awaitable<void> ScheduledTask::run(std::shared_ptr<ScheduledTask> self) {
    while(!m_cancelled){
        m_timer.expires_after(m_period);
        try{
            co_await m_timer.async_wait(net::use_awaitable);
        }catch(const boost::system::system_error &e){
            if(e.code() == net::error::operation_aborted) break;
            throw;
        }
        if(m_cancelled) break;
        try{
            m_job();
        }catch(const std::exception &e){
            spdlog::error("[Scheduler] {} failed: {}", m_name, e.what());
        }
    }
    spdlog::debug("[Scheduler] {} stopped", m_name);
}
