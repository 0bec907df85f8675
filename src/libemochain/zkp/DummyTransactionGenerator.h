#pragma once

#include <libemochain/zkp/BatchProof.h>
#include <libemochain/zkp/NonceSource.h>
#include <libemochain/zkp/TaskSet.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/beast/xor_shift_engine.h>
#include <chrono>
#include <functional>
#include <mutex>

namespace emochain {
namespace zkp {

/**
 * Emits filler transactions at random intervals, independent of the batch
 * cycle, so real activity bursts cannot be read off network timing.
 */
class DummyTransactionGenerator {
public:
    using Callback = std::function<void(DummyTransaction const&)>;

    struct SizeRange {
        std::size_t min = 100;
        std::size_t max = 1100;  // exclusive
    };

    DummyTransactionGenerator(
        Scheduler& scheduler,
        NonceSource& nonces,
        clock_type& clock,
        SizeRange sizes,
        std::uint64_t seed,
        beast::Journal journal);

    ~DummyTransactionGenerator();

    DummyTransaction generateDummyTransaction();

    /**
     * Emits one transaction now, then one after each interval drawn
     * uniformly from [minInterval, maxInterval]. Restarts the schedule if
     * already generating.
     */
    void startGenerating(
        std::chrono::seconds minInterval,
        std::chrono::seconds maxInterval,
        Callback onGenerate);

    void stopGenerating();

    bool generating() const;

private:
    NonceSource& nonces_;
    clock_type& clock_;
    SizeRange sizes_;
    beast::Journal const j_;

    mutable std::mutex mutex_;
    beast::xor_shift_engine prng_;
    std::chrono::milliseconds min_interval_{0};
    std::chrono::milliseconds max_interval_{0};
    Callback on_generate_;
    bool running_ = false;

    TaskSet tasks_;

    void emit();
    void scheduleNext();
};

} // namespace zkp
} // namespace emochain
