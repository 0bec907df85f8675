#include "DummyTransactionGenerator.h"
#include <xrpl/basics/Log.h>
#include <xrpl/basics/random.h>
#include <stdexcept>

namespace emochain {
namespace zkp {

DummyTransactionGenerator::DummyTransactionGenerator(
    Scheduler& scheduler,
    NonceSource& nonces,
    clock_type& clock,
    SizeRange sizes,
    std::uint64_t seed,
    beast::Journal journal)
    : nonces_(nonces)
    , clock_(clock)
    , sizes_(sizes)
    , j_(journal)
    , prng_(seed)
    , tasks_(scheduler)
{
    if (sizes_.min == 0 || sizes_.min >= sizes_.max)
        throw std::invalid_argument("Invalid dummy transaction size range");
}

DummyTransactionGenerator::~DummyTransactionGenerator() {
    stopGenerating();
}

DummyTransaction DummyTransactionGenerator::generateDummyTransaction() {
    std::size_t size;
    {
        std::lock_guard lock(mutex_);
        size = ripple::rand_int(prng_, sizes_.min, sizes_.max - 1);
    }

    DummyTransaction tx;
    tx.id = nonces_.nonce();
    tx.timestamp = clock_.now();
    tx.payload = nonces_.bytes(size);
    return tx;
}

void DummyTransactionGenerator::startGenerating(
    std::chrono::seconds minInterval,
    std::chrono::seconds maxInterval,
    Callback onGenerate)
{
    if (minInterval.count() < 0 || minInterval > maxInterval)
        throw std::invalid_argument("Invalid dummy transaction interval");
    if (!onGenerate)
        throw std::invalid_argument("Dummy transaction callback required");

    stopGenerating();

    {
        std::lock_guard lock(mutex_);
        min_interval_ = minInterval;
        max_interval_ = maxInterval;
        on_generate_ = std::move(onGenerate);
        running_ = true;
    }

    JLOG(j_.info()) << "Dummy transaction generation started ("
                    << minInterval.count() << "-" << maxInterval.count() << "s)";

    // First emission is immediate
    tasks_.schedule(Scheduler::duration::zero(), [this] { emit(); });
}

void DummyTransactionGenerator::stopGenerating() {
    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;
        running_ = false;
    }
    tasks_.cancelAll();
    JLOG(j_.info()) << "Dummy transaction generation stopped";
}

bool DummyTransactionGenerator::generating() const {
    std::lock_guard lock(mutex_);
    return running_;
}

void DummyTransactionGenerator::emit() {
    Callback callback;
    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;
        callback = on_generate_;
    }

    try {
        auto tx = generateDummyTransaction();
        JLOG(j_.trace()) << "Dummy transaction " << tx.id << " ("
                         << tx.payload.size() << " bytes)";
        callback(tx);
    } catch (std::exception const& e) {
        JLOG(j_.error()) << "Dummy transaction emission failed: " << e.what();
    }

    scheduleNext();
}

void DummyTransactionGenerator::scheduleNext() {
    std::chrono::milliseconds next;
    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;
        next = std::chrono::milliseconds(ripple::rand_int(
            prng_,
            static_cast<std::int64_t>(min_interval_.count()),
            static_cast<std::int64_t>(max_interval_.count())));
    }
    tasks_.schedule(next, [this] { emit(); });
}

} // namespace zkp
} // namespace emochain
