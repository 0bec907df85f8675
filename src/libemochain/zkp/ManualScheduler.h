#pragma once

#include <libemochain/zkp/BatchProof.h>
#include <libemochain/zkp/Scheduler.h>
#include <xrpl/beast/clock/manual_clock.h>
#include <map>
#include <utility>

namespace emochain {
namespace zkp {

/**
 * Scheduler driven by a manual clock. Nothing runs until advance() or
 * runDue() is called, and tasks then run on the calling thread in due-time
 * order (ties broken by scheduling order). Not thread safe.
 */
class ManualScheduler : public Scheduler {
public:
    using manual_clock_type = beast::manual_clock<NetClock>;

    explicit ManualScheduler(manual_clock_type& clock);

    TaskId schedule(duration delay, std::function<void()> task) override;
    bool cancel(TaskId id) override;
    std::size_t pending() const override { return tasks_.size(); }

    // Moves the clock forward by elapsed, running every task that falls due
    // with the clock set to that task's due time. Returns tasks run.
    std::size_t advance(duration elapsed);

    // Runs tasks already due at the current time
    std::size_t runDue();

    manual_clock_type& clock() { return clock_; }

private:
    manual_clock_type& clock_;
    TaskId next_id_ = 1;

    // (due, id) -> task
    std::map<std::pair<NetClock::time_point, TaskId>, std::function<void()>> tasks_;

    std::size_t runUntil(NetClock::time_point limit);
};

} // namespace zkp
} // namespace emochain
