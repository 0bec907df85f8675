#include "BatchVerifier.h"
#include "BatchMerkleTree.h"
#include <xrpl/basics/Log.h>

namespace emochain {
namespace zkp {

const char* to_string(BatchVerdict verdict) {
    switch (verdict) {
        case BatchVerdict::valid:
            return "valid";
        case BatchVerdict::replayWindowExceeded:
            return "replay window exceeded";
        case BatchVerdict::timestampInFuture:
            return "timestamp in future";
        case BatchVerdict::commitmentCountMismatch:
            return "commitment count mismatch";
        case BatchVerdict::proofCountMismatch:
            return "proof count mismatch";
        case BatchVerdict::thresholdCountExceeded:
            return "threshold count exceeded";
        case BatchVerdict::merkleRootMismatch:
            return "merkle root mismatch";
        case BatchVerdict::malformed:
            return "malformed";
    }
    return "unknown";
}

BatchVerifier::BatchVerifier(
    clock_type& clock,
    FreshnessPolicy freshness,
    beast::Journal journal)
    : clock_(clock), freshness_(freshness), j_(journal)
{
}

BatchVerdict BatchVerifier::verify(const BatchProof& batch) const {
    BatchVerdict verdict;
    try {
        verdict = check(batch);
    } catch (std::exception const& e) {
        JLOG(j_.error()) << "Batch " << batch.batchId
                         << " verification error: " << e.what();
        return BatchVerdict::malformed;
    }

    if (verdict != BatchVerdict::valid) {
        JLOG(j_.warn()) << "Batch " << batch.batchId
                        << " rejected: " << to_string(verdict);
    } else {
        JLOG(j_.debug()) << "Batch " << batch.batchId << " verified";
    }
    return verdict;
}

BatchVerdict BatchVerifier::check(const BatchProof& batch) const {
    auto const now = clock_.now();

    if (now > batch.timestamp && now - batch.timestamp > freshness_.replayWindow)
        return BatchVerdict::replayWindowExceeded;

    if (batch.timestamp > now && batch.timestamp - now > freshness_.futureTolerance)
        return BatchVerdict::timestampInFuture;

    if (batch.commitments.size() != batch.validatorCount)
        return BatchVerdict::commitmentCountMismatch;

    auto const& aggregated = batch.aggregatedProof;
    if (aggregated.proofCount != batch.validatorCount)
        return BatchVerdict::proofCountMismatch;

    if (batch.thresholdsPassed > batch.validatorCount)
        return BatchVerdict::thresholdCountExceeded;

    // Leaves are optional in the published form
    if (!aggregated.leaves.empty()) {
        if (aggregated.leaves.size() != aggregated.proofCount)
            return BatchVerdict::proofCountMismatch;
        if (BatchMerkleTree::computeRoot(aggregated.leaves) != aggregated.merkleRoot)
            return BatchVerdict::merkleRootMismatch;
    }

    return BatchVerdict::valid;
}

} // namespace zkp
} // namespace emochain
