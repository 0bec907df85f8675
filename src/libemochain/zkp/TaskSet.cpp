#include "TaskSet.h"
#include <algorithm>

namespace emochain {
namespace zkp {

namespace {

// Unregisters the current thread from the running list on scope exit
class RunningGuard {
public:
    RunningGuard(std::mutex& mutex, std::condition_variable& idle,
                 std::vector<std::thread::id>& running)
        : mutex_(mutex), idle_(idle), running_(running)
    {
    }

    ~RunningGuard() {
        std::lock_guard lock(mutex_);
        auto it = std::find(running_.begin(), running_.end(), std::this_thread::get_id());
        if (it != running_.end())
            running_.erase(it);
        idle_.notify_all();
    }

private:
    std::mutex& mutex_;
    std::condition_variable& idle_;
    std::vector<std::thread::id>& running_;
};

} // namespace

TaskSet::TaskSet(Scheduler& scheduler)
    : scheduler_(scheduler), state_(std::make_shared<State>())
{
}

TaskSet::~TaskSet() {
    cancelAll();
}

TaskId TaskSet::schedule(Scheduler::duration delay, std::function<void()> task) {
    auto slot = std::make_shared<TaskId>(0);

    // Held across schedule() so a zero-delay callback cannot look up its
    // id before it is registered
    std::lock_guard lock(state_->mutex);

    TaskId id = scheduler_.schedule(
        delay,
        [state = state_, slot, task = std::move(task)] {
            {
                std::lock_guard lock(state->mutex);
                if (state->pending.erase(*slot) == 0)
                    return;
                state->running.push_back(std::this_thread::get_id());
            }
            RunningGuard guard(state->mutex, state->idle, state->running);
            task();
        });

    *slot = id;
    state_->pending.insert(id);
    return id;
}

bool TaskSet::cancel(TaskId id) {
    std::lock_guard lock(state_->mutex);
    if (state_->pending.erase(id) == 0)
        return false;
    scheduler_.cancel(id);
    return true;
}

void TaskSet::cancelAll() {
    std::unique_lock lock(state_->mutex);
    auto const self = std::this_thread::get_id();

    // A callback that finishes while we wait may have re-armed itself
    do {
        for (TaskId id : state_->pending)
            scheduler_.cancel(id);
        state_->pending.clear();

        state_->idle.wait(lock, [&] {
            return std::all_of(
                state_->running.begin(), state_->running.end(),
                [self](std::thread::id t) { return t == self; });
        });
    } while (!state_->pending.empty());
}

std::size_t TaskSet::pending() const {
    std::lock_guard lock(state_->mutex);
    return state_->pending.size();
}

} // namespace zkp
} // namespace emochain
