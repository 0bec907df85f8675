#include "BatchProofCoordinator.h"
#include "BatchMerkleTree.h"
#include "ZkErrors.h"
#include <xrpl/basics/Log.h>
#include <xrpl/basics/random.h>
#include <algorithm>
#include <iterator>
#include <utility>

namespace emochain {
namespace zkp {

BatchProofCoordinator::BatchProofCoordinator(
    Setup const& setup,
    DummyProofGenerator& dummies,
    BatchVerifier const& verifier,
    NonceSource& nonces,
    clock_type& clock,
    Scheduler& scheduler,
    std::uint64_t seed,
    beast::Journal journal)
    : setup_(setup)
    , dummies_(dummies)
    , verifier_(verifier)
    , nonces_(nonces)
    , clock_(clock)
    , j_(journal)
    , last_batch_time_(clock.now())
    , prng_(seed)
    , tasks_(scheduler)
{
    if (setup_.batchSize == 0)
        throw std::invalid_argument("Batch size must be positive");
    if (setup_.jitterMin.count() < 0 || setup_.jitterMin > setup_.jitterMax)
        throw std::invalid_argument("Invalid release jitter range");
    if (setup_.flushCheckInterval.count() <= 0)
        throw std::invalid_argument("Flush check interval must be positive");
}

BatchProofCoordinator::~BatchProofCoordinator() {
    stop();
}

void BatchProofCoordinator::queueProof(ThresholdProof proof) {
    if (proof.submitterId.empty())
        throw InputValidationError("Threshold proof has no submitter id");

    dummies_.observeArtifactSize(proof.proofArtifact.size());

    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(
            queue_.begin(), queue_.end(), [&](ThresholdProof const& p) {
                return p.submitterId == proof.submitterId;
            });

        if (it != queue_.end()) {
            JLOG(j_.debug()) << "Replacing queued proof from " << proof.submitterId;
            *it = std::move(proof);
        } else {
            queue_.push_back(std::move(proof));
        }

        JLOG(j_.trace()) << "Queue size " << queue_.size() << "/"
                         << setup_.batchSize;
    }

    releaseFullBatches();
}

BatchProof BatchProofCoordinator::createBatchProof() {
    std::vector<ThresholdProof> members;
    {
        std::lock_guard lock(mutex_);
        if (queue_.empty())
            throw EmptyQueueError("No proofs queued for batching");
        members = takeBatchLocked();
    }
    return assembleTaken(std::move(members));
}

std::optional<BatchProof> BatchProofCoordinator::forceCreateBatch() {
    std::vector<ThresholdProof> members;
    {
        std::lock_guard lock(mutex_);
        if (queue_.empty())
            return std::nullopt;
        members = takeBatchLocked();
    }

    JLOG(j_.info()) << "Forcing batch with " << members.size() << " of "
                    << setup_.batchSize << " real proofs";
    return assembleTaken(std::move(members));
}

void BatchProofCoordinator::start(BatchCallback onBatch) {
    if (!onBatch)
        throw std::invalid_argument("Batch callback required");

    {
        std::lock_guard lock(mutex_);
        if (running_)
            return;
        running_ = true;
        on_batch_ = std::move(onBatch);
        last_batch_time_ = clock_.now();
    }

    JLOG(j_.info()) << "Batch coordinator started, batch size "
                    << setup_.batchSize;
    scheduleFlushCheck();

    // Proofs queued while stopped
    releaseFullBatches();
}

void BatchProofCoordinator::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;
        running_ = false;
    }

    tasks_.cancelAll();

    std::size_t dropped;
    {
        std::lock_guard lock(mutex_);
        dropped = releasing_.size();
        releasing_.clear();
        on_batch_ = nullptr;
    }

    JLOG(j_.info()) << "Batch coordinator stopped";
    if (dropped != 0)
        JLOG(j_.warn()) << "Dropped " << dropped << " unreleased batches";
}

bool BatchProofCoordinator::verifyBatchProof(BatchProof const& batch) const {
    return verifier_.verifyBatchProof(batch);
}

std::size_t BatchProofCoordinator::getQueueSize() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

BatchProofCoordinator::QueueStatus BatchProofCoordinator::getQueueStatus() const {
    std::lock_guard lock(mutex_);
    QueueStatus status;
    status.size = queue_.size();
    status.batchSize = setup_.batchSize;
    status.percentFull = 100.0 * static_cast<double>(queue_.size()) /
        static_cast<double>(setup_.batchSize);
    status.timeSinceLastBatch =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            clock_.now() - last_batch_time_);
    return status;
}

std::size_t BatchProofCoordinator::pendingReleases() const {
    std::lock_guard lock(mutex_);
    return releasing_.size();
}

bool BatchProofCoordinator::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

std::vector<ThresholdProof> BatchProofCoordinator::takeBatchLocked() {
    auto const count = std::min(queue_.size(), setup_.batchSize);
    std::vector<ThresholdProof> members(
        std::make_move_iterator(queue_.begin()),
        std::make_move_iterator(queue_.begin() + count));
    queue_.erase(queue_.begin(), queue_.begin() + count);
    return members;
}

void BatchProofCoordinator::restoreLocked(std::vector<ThresholdProof> members) {
    // A submitter that queued again meanwhile keeps its newer proof
    std::erase_if(members, [this](ThresholdProof const& member) {
        return std::any_of(
            queue_.begin(), queue_.end(), [&](ThresholdProof const& p) {
                return p.submitterId == member.submitterId;
            });
    });

    JLOG(j_.warn()) << "Returning " << members.size() << " proofs to the queue";
    queue_.insert(
        queue_.begin(),
        std::make_move_iterator(members.begin()),
        std::make_move_iterator(members.end()));
}

BatchProof BatchProofCoordinator::assembleTaken(std::vector<ThresholdProof> members) {
    try {
        return assemble(members);
    } catch (std::exception const&) {
        std::lock_guard lock(mutex_);
        restoreLocked(std::move(members));
        throw;
    }
}

BatchProof BatchProofCoordinator::assemble(std::vector<ThresholdProof>& members) {
    auto const real = members.size();

    // Randomness can fail; draw it all before members is modified
    std::vector<ThresholdProof> padding;
    while (real + padding.size() < setup_.batchSize)
        padding.push_back(dummies_.generateDummyProof());

    BatchProof batch;
    batch.batchId = nonces_.id128();

    members.insert(
        members.end(),
        std::make_move_iterator(padding.begin()),
        std::make_move_iterator(padding.end()));
    shuffle(members);

    batch.timestamp = clock_.now();
    batch.validatorCount = members.size();
    batch.commitments.reserve(members.size());

    auto& aggregated = batch.aggregatedProof;
    aggregated.leaves.reserve(members.size());
    for (auto const& member : members) {
        batch.commitments.push_back(member.commitment);
        aggregated.leaves.push_back(sha256(member.proofArtifact));
        if (member.scoreAboveThreshold)
            ++batch.thresholdsPassed;
    }

    aggregated.merkleRoot = BatchMerkleTree::computeRoot(aggregated.leaves);
    aggregated.proofCount = members.size();
    aggregated.protocol = batchProtocol;
    aggregated.timestamp = batch.timestamp;

    batch.isValid = verifier_.verifyBatchProof(batch);

    JLOG(j_.debug()) << "Batch " << batch.batchId << " assembled: "
                     << real << " real, " << (members.size() - real)
                     << " padding, root " << aggregated.merkleRoot;
    return batch;
}

// Fisher-Yates
void BatchProofCoordinator::shuffle(std::vector<ThresholdProof>& members) {
    if (members.size() < 2)
        return;

    std::lock_guard lock(prng_mutex_);
    for (std::size_t i = members.size() - 1; i > 0; --i) {
        auto const j = ripple::rand_int(prng_, std::size_t{0}, i);
        if (i != j)
            std::swap(members[i], members[j]);
    }
}

void BatchProofCoordinator::scheduleRelease(BatchProof batch) {
    std::chrono::milliseconds jitter;
    {
        std::lock_guard lock(prng_mutex_);
        jitter = std::chrono::milliseconds(ripple::rand_int(
            prng_,
            static_cast<std::int64_t>(setup_.jitterMin.count()),
            static_cast<std::int64_t>(setup_.jitterMax.count())));
    }

    std::uint64_t key;
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            JLOG(j_.debug()) << "Coordinator stopped, batch "
                             << batch.batchId << " dropped";
            return;
        }
        key = next_release_++;
        JLOG(j_.debug()) << "Batch " << batch.batchId << " releases in "
                         << jitter.count() << "ms";
        releasing_.emplace(key, std::move(batch));
    }

    tasks_.schedule(jitter, [this, key] { release(key); });
}

void BatchProofCoordinator::release(std::uint64_t key) {
    BatchProof batch;
    BatchCallback callback;
    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;
        auto it = releasing_.find(key);
        if (it == releasing_.end())
            return;
        batch = std::move(it->second);
        releasing_.erase(it);

        batch.timestamp = clock_.now();
        batch.aggregatedProof.timestamp = batch.timestamp;
        last_batch_time_ = batch.timestamp;
        callback = on_batch_;
    }

    JLOG(j_.info()) << "Releasing batch " << batch.batchId << " with "
                    << batch.validatorCount << " proofs, "
                    << batch.thresholdsPassed << " passed";

    try {
        callback(batch);
    } catch (std::exception const& e) {
        JLOG(j_.error()) << "Batch callback failed: " << e.what();
    }
}

void BatchProofCoordinator::releaseFullBatches() {
    for (;;) {
        std::vector<ThresholdProof> selected;
        {
            std::lock_guard lock(mutex_);
            if (!running_ || queue_.size() < setup_.batchSize)
                return;
            selected = takeBatchLocked();
        }

        try {
            scheduleRelease(assembleTaken(std::move(selected)));
        } catch (std::exception const& e) {
            // Members are back in the queue; the next arrival or flush
            // check retries
            JLOG(j_.error()) << "Batch assembly failed: " << e.what();
            return;
        }
    }
}

void BatchProofCoordinator::scheduleFlushCheck() {
    tasks_.schedule(setup_.flushCheckInterval, [this] { checkFlush(); });
}

void BatchProofCoordinator::checkFlush() {
    releaseFullBatches();

    std::vector<ThresholdProof> selected;
    {
        std::lock_guard lock(mutex_);
        if (!running_)
            return;

        auto const waited = clock_.now() - last_batch_time_;
        if (waited >= setup_.maxWait && !queue_.empty() &&
            queue_.size() < setup_.batchSize)
        {
            JLOG(j_.info()) << "Flushing " << queue_.size()
                            << " proofs after max wait";
            selected = takeBatchLocked();
        }
    }

    if (!selected.empty()) {
        try {
            scheduleRelease(assembleTaken(std::move(selected)));
        } catch (std::exception const& e) {
            JLOG(j_.error()) << "Forced batch failed: " << e.what();
        }
    }

    scheduleFlushCheck();
}

} // namespace zkp
} // namespace emochain
