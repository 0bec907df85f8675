#pragma once

#include <libemochain/zkp/BatchProof.h>
#include <libemochain/zkp/BatchVerifier.h>
#include <libemochain/zkp/DummyProofGenerator.h>
#include <libemochain/zkp/NonceSource.h>
#include <libemochain/zkp/TaskSet.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/beast/xor_shift_engine.h>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace emochain {
namespace zkp {

/**
 * Collects threshold proofs from many submitters and publishes them as
 * shuffled, padded, Merkle-committed batches after a random delay.
 *
 * A batch moves Collecting -> Ready -> Releasing -> Closed. Members are
 * removed from the queue when the batch becomes Ready, so the next batch
 * collects while earlier ones are still waiting out their jitter.
 *
 * Submitter ids stay inside the coordinator; a published batch carries
 * only commitments and aggregates.
 */
class BatchProofCoordinator {
public:
    struct Setup {
        std::size_t batchSize = 10;
        std::chrono::milliseconds maxWait = std::chrono::minutes(5);
        std::chrono::milliseconds flushCheckInterval = std::chrono::seconds(30);
        std::chrono::milliseconds jitterMin{0};
        std::chrono::milliseconds jitterMax = std::chrono::seconds(30);
    };

    struct QueueStatus {
        std::size_t size = 0;
        std::size_t batchSize = 0;
        double percentFull = 0.0;
        std::chrono::milliseconds timeSinceLastBatch{0};
    };

    using BatchCallback = std::function<void(BatchProof const&)>;

    BatchProofCoordinator(
        Setup const& setup,
        DummyProofGenerator& dummies,
        BatchVerifier const& verifier,
        NonceSource& nonces,
        clock_type& clock,
        Scheduler& scheduler,
        std::uint64_t seed,
        beast::Journal journal);

    ~BatchProofCoordinator();

    BatchProofCoordinator(BatchProofCoordinator const&) = delete;
    BatchProofCoordinator& operator=(BatchProofCoordinator const&) = delete;

    /**
     * @brief Queue a proof, replacing any pending proof from the same
     * submitter in place. Releases a batch once batchSize proofs are
     * queued and the coordinator is running. A batch that fails to
     * assemble is logged and its members stay queued.
     *
     * @throws InputValidationError if the proof has no submitter id
     */
    void queueProof(ThresholdProof proof);

    /**
     * @brief Build a batch from the oldest queued proofs, padded with
     * dummies up to batchSize. The batch is returned, not released.
     *
     * @throws EmptyQueueError if nothing is queued
     * @throws ProofGenerationError if padding or the batch id cannot be
     *         drawn; the selected proofs are queued again
     */
    BatchProof createBatchProof();

    // As createBatchProof, but an empty queue yields nothing
    std::optional<BatchProof> forceCreateBatch();

    // Also releases every full batch queued while stopped
    void start(BatchCallback onBatch);

    // Cancels the flush check and every pending release. Batches still
    // waiting on their jitter are dropped.
    void stop();

    bool verifyBatchProof(BatchProof const& batch) const;

    std::size_t getQueueSize() const;

    QueueStatus getQueueStatus() const;

    // Batches selected but not yet handed to the callback
    std::size_t pendingReleases() const;

    bool running() const;

    Setup const& setup() const { return setup_; }

private:
    Setup const setup_;
    DummyProofGenerator& dummies_;
    BatchVerifier const& verifier_;
    NonceSource& nonces_;
    clock_type& clock_;
    beast::Journal const j_;

    mutable std::mutex mutex_;
    std::vector<ThresholdProof> queue_;  // arrival order
    std::map<std::uint64_t, BatchProof> releasing_;
    std::uint64_t next_release_ = 1;
    NetClock::time_point last_batch_time_;
    BatchCallback on_batch_;
    bool running_ = false;

    std::mutex prng_mutex_;
    beast::xor_shift_engine prng_;

    TaskSet tasks_;

    // Requires mutex_
    std::vector<ThresholdProof> takeBatchLocked();

    // Leaves members untouched if it throws
    BatchProof assemble(std::vector<ThresholdProof>& members);

    // assemble, putting members back at the front of the queue on failure
    BatchProof assembleTaken(std::vector<ThresholdProof> members);

    // Requires mutex_
    void restoreLocked(std::vector<ThresholdProof> members);

    void releaseFullBatches();

    void shuffle(std::vector<ThresholdProof>& members);

    void scheduleRelease(BatchProof batch);
    void release(std::uint64_t key);

    void scheduleFlushCheck();
    void checkFlush();
};

} // namespace zkp
} // namespace emochain
