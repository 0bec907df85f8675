#ifndef EMOCHAIN_COMMITMENT_GENERATOR_H
#define EMOCHAIN_COMMITMENT_GENERATOR_H

#include <libemochain/zkp/BatchProof.h>
#include <libemochain/zkp/NonceSource.h>
#include <libemochain/zkp/ThresholdProofBackend.h>
#include <xrpl/beast/utility/Journal.h>
#include <cstdint>
#include <string>
#include <vector>

namespace emochain {
namespace zkp {

/**
 * @brief Inclusive range of admissible scores and thresholds
 */
struct ScoreDomain {
    std::uint32_t min = 0;
    std::uint32_t max = 100;

    bool contains(std::uint32_t v) const { return v >= min && v <= max; }
};

/**
 * @brief Structure to hold commitment data
 */
struct Commitment {
    uint256 commitment;     // SHA256(be32(score) || nonce)
    uint256 nonce;          // Never leaves the submitter
    std::uint32_t score;
};

struct ProofPartition {
    std::vector<ThresholdProof> valid;
    std::vector<ThresholdProof> invalid;
};

/**
 * @brief Client-side producer of commitments and threshold proofs
 */
class CommitmentGenerator {
public:
    CommitmentGenerator(
        const ThresholdProofBackend& backend,
        NonceSource& nonces,
        clock_type& clock,
        ScoreDomain domain,
        FreshnessPolicy freshness,
        beast::Journal journal);

    /**
     * @brief Hash the commitment components to create the commitment value
     *
     * @param score Private score
     * @param nonce 256-bit commitment randomness
     * @return uint256 The commitment hash
     */
    static uint256 hashCommitment(std::uint32_t score, const uint256& nonce);

    /**
     * @brief Commit to a score under a fresh nonce
     *
     * @throws InvalidScoreRange if the score is outside the domain
     */
    Commitment generateCommitment(std::uint32_t score);

    /**
     * @brief Produce a threshold proof for a submitter
     *
     * @param submitterId Validator identity used as the queue key
     * @param score Private score, validated against the domain
     * @param threshold Public threshold, validated against the domain
     * @return ThresholdProof with scoreAboveThreshold = (score >= threshold)
     * @throws InvalidScoreRange, InvalidThreshold, ProofGenerationError
     */
    ThresholdProof generateThresholdProof(
        const std::string& submitterId,
        std::uint32_t score,
        std::uint32_t threshold);

    // As above, with caller-supplied nonce
    ThresholdProof generateThresholdProof(
        const std::string& submitterId,
        std::uint32_t score,
        std::uint32_t threshold,
        const uint256& nonce);

    /**
     * @brief Check freshness, commitment shape and the backend artifact.
     * Never throws.
     */
    bool verifyThresholdProof(
        const ThresholdProof& proof,
        std::uint32_t threshold) const;

    ProofPartition partitionByValidity(
        const std::vector<ThresholdProof>& proofs,
        std::uint32_t threshold) const;

    const ScoreDomain& domain() const { return domain_; }

    const ThresholdProofBackend& backend() const { return backend_; }

private:
    const ThresholdProofBackend& backend_;
    NonceSource& nonces_;
    clock_type& clock_;
    ScoreDomain domain_;
    FreshnessPolicy freshness_;
    beast::Journal const j_;

    void validateInputs(std::uint32_t score, std::uint32_t threshold) const;
};

} // namespace zkp
} // namespace emochain

#endif // EMOCHAIN_COMMITMENT_GENERATOR_H
