#pragma once

#include <libemochain/zkp/Digest.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace emochain {
namespace zkp {

/**
 * Capability interface for the prover that attests score >= threshold.
 *
 * The coordinator and the verifier only ever see the artifact as opaque
 * bytes, so a real zero-knowledge prover can replace the hash placeholder
 * without touching them.
 */
class ThresholdProofBackend {
public:
    virtual ~ThresholdProofBackend() = default;

    /**
     * @brief Produce a proof artifact
     *
     * @param score Private score, already validated against the domain
     * @param threshold Public threshold
     * @param nonce Commitment randomness
     * @param commitment SHA256(be32(score) || nonce)
     * @return Blob Non-empty artifact
     * @throws ProofGenerationError
     */
    virtual Blob produce(
        std::uint32_t score,
        std::uint32_t threshold,
        const uint256& nonce,
        const uint256& commitment) const = 0;

    // Never throws
    virtual bool verify(
        const Blob& artifact,
        std::uint32_t threshold,
        const uint256& commitment,
        bool scoreAboveThreshold) const = 0;

    virtual std::string name() const = 0;

    // Typical artifact size, used to shape dummy artifacts
    virtual std::size_t nominalArtifactSize() const = 0;
};

/**
 * Placeholder backend: three tags derived from (score, nonce) plus a tag
 * binding the public statement.
 *
 *   artifact = A || B || C || SHA256(be32(threshold) || cm || passed)
 *   A = SHA256(be32(score) || nonce || "a"), likewise B and C
 *
 * This is not zero knowledge; verify() only checks that the artifact was
 * issued for the given public inputs.
 */
class HashCommitmentBackend : public ThresholdProofBackend {
public:
    static constexpr std::size_t artifactSize = 4 * 32;

    Blob produce(
        std::uint32_t score,
        std::uint32_t threshold,
        const uint256& nonce,
        const uint256& commitment) const override;

    bool verify(
        const Blob& artifact,
        std::uint32_t threshold,
        const uint256& commitment,
        bool scoreAboveThreshold) const override;

    std::string name() const override { return "hash_commitment"; }

    std::size_t nominalArtifactSize() const override { return artifactSize; }

    static uint256 statementTag(
        std::uint32_t threshold,
        const uint256& commitment,
        bool scoreAboveThreshold);
};

} // namespace zkp
} // namespace emochain
