#include "AsioScheduler.h"
#include <boost/asio/post.hpp>

namespace emochain {
namespace zkp {

AsioScheduler::AsioScheduler()
    : work_(boost::asio::make_work_guard(io_))
    , thread_([this] { io_.run(); })
{
}

AsioScheduler::~AsioScheduler() {
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, timer] : timers_)
            boost::asio::post(io_, [timer] { timer->cancel(); });
        timers_.clear();
    }
    work_.reset();
    io_.stop();
    if (thread_.joinable())
        thread_.join();
}

TaskId AsioScheduler::schedule(duration delay, std::function<void()> task) {
    auto timer = std::make_shared<Timer>(io_, delay);

    TaskId id;
    {
        std::lock_guard lock(mutex_);
        id = next_id_++;
        timers_.emplace(id, timer);
    }

    timer->async_wait(
        [this, id, timer, task = std::move(task)](boost::system::error_code const& ec) {
            if (ec)
                return;
            {
                std::lock_guard lock(mutex_);
                // Cancelled after expiry but before this handler ran
                if (timers_.erase(id) == 0)
                    return;
            }
            task();
        });

    return id;
}

bool AsioScheduler::cancel(TaskId id) {
    std::shared_ptr<Timer> timer;
    {
        std::lock_guard lock(mutex_);
        auto it = timers_.find(id);
        if (it == timers_.end())
            return false;
        timer = std::move(it->second);
        timers_.erase(it);
    }

    // Timers are only touched on the io thread
    boost::asio::post(io_, [timer] { timer->cancel(); });
    return true;
}

std::size_t AsioScheduler::pending() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
}

} // namespace zkp
} // namespace emochain
