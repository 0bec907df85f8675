#include "ThresholdProofBackend.h"
#include <algorithm>

namespace emochain {
namespace zkp {

namespace {

uint256 witnessTag(std::uint32_t score, const uint256& nonce, char label) {
    Blob preimage;
    preimage.reserve(4 + 32 + 1);
    appendBE32(preimage, score);
    append(preimage, nonce);
    preimage.push_back(static_cast<std::uint8_t>(label));
    return sha256(preimage);
}

} // namespace

uint256 HashCommitmentBackend::statementTag(
    std::uint32_t threshold,
    const uint256& commitment,
    bool scoreAboveThreshold)
{
    Blob preimage;
    preimage.reserve(4 + 32 + 1);
    appendBE32(preimage, threshold);
    append(preimage, commitment);
    preimage.push_back(scoreAboveThreshold ? 1 : 0);
    return sha256(preimage);
}

Blob HashCommitmentBackend::produce(
    std::uint32_t score,
    std::uint32_t threshold,
    const uint256& nonce,
    const uint256& commitment) const
{
    Blob artifact;
    artifact.reserve(artifactSize);
    append(artifact, witnessTag(score, nonce, 'a'));
    append(artifact, witnessTag(score, nonce, 'b'));
    append(artifact, witnessTag(score, nonce, 'c'));
    append(artifact, statementTag(threshold, commitment, score >= threshold));
    return artifact;
}

bool HashCommitmentBackend::verify(
    const Blob& artifact,
    std::uint32_t threshold,
    const uint256& commitment,
    bool scoreAboveThreshold) const
{
    if (artifact.size() != artifactSize)
        return false;

    uint256 expected = statementTag(threshold, commitment, scoreAboveThreshold);
    return std::equal(
        expected.begin(), expected.end(), artifact.begin() + 3 * 32);
}

} // namespace zkp
} // namespace emochain
