#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace emochain {
namespace zkp {

using TaskId = std::uint64_t;

/**
 * Delayed, cancellable task execution.
 *
 * Every randomized wait in the batching pipeline (release jitter, the
 * forced-flush check, dummy traffic, periodic submission) goes through a
 * Scheduler so that shutdown can cancel it and tests can drive it without
 * wall-clock waits.
 */
class Scheduler {
public:
    using duration = std::chrono::milliseconds;

    virtual ~Scheduler() = default;

    // Runs task once after delay unless cancelled first. Ids are never 0.
    virtual TaskId schedule(duration delay, std::function<void()> task) = 0;

    // Returns false if the task already ran or was cancelled
    virtual bool cancel(TaskId id) = 0;

    virtual std::size_t pending() const = 0;
};

} // namespace zkp
} // namespace emochain
