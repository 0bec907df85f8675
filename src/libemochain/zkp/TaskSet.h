#pragma once

#include <libemochain/zkp/Scheduler.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace emochain {
namespace zkp {

/**
 * The tasks one component has scheduled on a shared Scheduler.
 *
 * cancelAll() cancels every pending task and then waits for callbacks that
 * are already running on other threads, so once it returns none of this
 * component's work is left in flight. A callback may call cancelAll() on
 * its own set without deadlocking.
 */
class TaskSet {
public:
    explicit TaskSet(Scheduler& scheduler);
    ~TaskSet();

    TaskSet(const TaskSet&) = delete;
    TaskSet& operator=(const TaskSet&) = delete;

    TaskId schedule(Scheduler::duration delay, std::function<void()> task);

    bool cancel(TaskId id);

    void cancelAll();

    std::size_t pending() const;

private:
    // Shared with scheduled callbacks so a late callback never touches a
    // destroyed TaskSet
    struct State {
        std::mutex mutex;
        std::condition_variable idle;
        std::set<TaskId> pending;
        std::vector<std::thread::id> running;
    };

    Scheduler& scheduler_;
    std::shared_ptr<State> state_;
};

} // namespace zkp
} // namespace emochain
