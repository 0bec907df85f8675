#include "ProofSubmitter.h"
#include "ZkErrors.h"
#include <xrpl/basics/Log.h>
#include <xrpl/basics/random.h>
#include <memory>
#include <stdexcept>

namespace emochain {
namespace zkp {

ProofSubmitter::ProofSubmitter(
    Setup const& setup,
    std::string submitterId,
    CommitmentGenerator& generator,
    Scheduler& scheduler,
    std::uint64_t seed,
    beast::Journal journal)
    : setup_(setup)
    , submitter_id_(std::move(submitterId))
    , generator_(generator)
    , j_(journal)
    , prng_(seed)
    , tasks_(scheduler)
{
    if (submitter_id_.empty())
        throw std::invalid_argument("Submitter id required");
    if (setup_.interval.count() <= 0)
        throw std::invalid_argument("Submission interval must be positive");
    if (setup_.jitterMax.count() < 0)
        throw std::invalid_argument("Submission jitter must not be negative");
    if (!generator_.domain().contains(setup_.threshold))
        throw InvalidThreshold("Submission threshold outside score domain");
}

ProofSubmitter::~ProofSubmitter() {
    stop();
}

void ProofSubmitter::start(ScoreProvider scores, ProofSink sink) {
    if (!scores || !sink)
        throw std::invalid_argument("Score provider and proof sink required");

    {
        std::lock_guard lock(mutex_);
        if (running_)
            return;
        scores_ = std::move(scores);
        sink_ = std::move(sink);
        running_ = true;
    }

    JLOG(j_.info()) << submitter_id_ << ": submitting every "
                    << std::chrono::duration_cast<std::chrono::seconds>(
                           setup_.interval).count() << "s";
    tasks_.schedule(Scheduler::duration::zero(), [this] { submit(); });
}

void ProofSubmitter::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;
        running_ = false;
    }
    tasks_.cancelAll();
    JLOG(j_.debug()) << submitter_id_ << ": stopped";
}

bool ProofSubmitter::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

void ProofSubmitter::submit() {
    ScoreProvider scores;
    std::chrono::milliseconds jitter;
    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;
        scores = scores_;
        jitter = std::chrono::milliseconds(ripple::rand_int(
            prng_, std::int64_t{0},
            static_cast<std::int64_t>(setup_.jitterMax.count())));
    }

    try {
        auto proof = generator_.generateThresholdProof(
            submitter_id_, scores(), setup_.threshold);

        JLOG(j_.debug()) << submitter_id_ << ": proof ready, delivering in "
                         << jitter.count() << "ms";

        auto held = std::make_shared<ThresholdProof>(std::move(proof));
        tasks_.schedule(jitter, [this, held] { deliver(std::move(*held)); });
    } catch (std::exception const& e) {
        JLOG(j_.error()) << submitter_id_ << ": proof submission failed: "
                         << e.what();
    }

    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;
    }
    tasks_.schedule(setup_.interval, [this] { submit(); });
}

void ProofSubmitter::deliver(ThresholdProof proof) {
    ProofSink sink;
    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;
        sink = sink_;
    }

    try {
        sink(std::move(proof));
    } catch (std::exception const& e) {
        JLOG(j_.error()) << submitter_id_ << ": proof delivery failed: "
                         << e.what();
    }
}

} // namespace zkp
} // namespace emochain
