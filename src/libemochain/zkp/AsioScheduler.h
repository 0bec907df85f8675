#pragma once

#include <libemochain/zkp/Scheduler.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace emochain {
namespace zkp {

/**
 * Scheduler backed by one io_context and a single worker thread. Tasks run
 * serially on that thread. Destruction cancels everything still pending
 * and joins the worker.
 */
class AsioScheduler : public Scheduler {
public:
    AsioScheduler();
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    TaskId schedule(duration delay, std::function<void()> task) override;
    bool cancel(TaskId id) override;
    std::size_t pending() const override;

private:
    using Timer = boost::asio::steady_timer;

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;

    mutable std::mutex mutex_;
    std::unordered_map<TaskId, std::shared_ptr<Timer>> timers_;
    TaskId next_id_ = 1;

    std::thread thread_;
};

} // namespace zkp
} // namespace emochain
