#include "ManualScheduler.h"
#include <algorithm>

namespace emochain {
namespace zkp {

ManualScheduler::ManualScheduler(manual_clock_type& clock)
    : clock_(clock)
{
}

TaskId ManualScheduler::schedule(duration delay, std::function<void()> task) {
    TaskId id = next_id_++;
    auto due = clock_.now() + std::max(delay, duration::zero());
    tasks_.emplace(std::make_pair(due, id), std::move(task));
    return id;
}

bool ManualScheduler::cancel(TaskId id) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [id](auto const& entry) {
        return entry.first.second == id;
    });
    if (it == tasks_.end())
        return false;
    tasks_.erase(it);
    return true;
}

std::size_t ManualScheduler::runUntil(NetClock::time_point limit) {
    std::size_t ran = 0;
    while (!tasks_.empty() && tasks_.begin()->first.first <= limit) {
        auto node = tasks_.extract(tasks_.begin());
        if (node.key().first > clock_.now())
            clock_.set(node.key().first);
        node.mapped()();
        ++ran;
    }
    return ran;
}

std::size_t ManualScheduler::advance(duration elapsed) {
    auto const target = clock_.now() + elapsed;
    std::size_t ran = runUntil(target);
    if (clock_.now() < target)
        clock_.set(target);
    return ran;
}

std::size_t ManualScheduler::runDue() {
    return runUntil(clock_.now());
}

} // namespace zkp
} // namespace emochain
