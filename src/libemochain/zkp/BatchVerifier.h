#pragma once

#include <libemochain/zkp/BatchProof.h>
#include <xrpl/beast/utility/Journal.h>

namespace emochain {
namespace zkp {

enum class BatchVerdict {
    valid,
    replayWindowExceeded,
    timestampInFuture,
    commitmentCountMismatch,
    proofCountMismatch,
    thresholdCountExceeded,
    merkleRootMismatch,
    malformed  // checking itself failed
};

const char* to_string(BatchVerdict verdict);

/**
 * Structural and freshness checks on a published batch. Individual
 * members are not re-verified. Never throws.
 */
class BatchVerifier {
public:
    BatchVerifier(
        clock_type& clock,
        FreshnessPolicy freshness,
        beast::Journal journal);

    BatchVerdict verify(const BatchProof& batch) const;

    bool verifyBatchProof(const BatchProof& batch) const {
        return verify(batch) == BatchVerdict::valid;
    }

    const FreshnessPolicy& freshness() const { return freshness_; }

private:
    clock_type& clock_;
    FreshnessPolicy freshness_;
    beast::Journal const j_;

    BatchVerdict check(const BatchProof& batch) const;
};

} // namespace zkp
} // namespace emochain
