#include "CommitmentGenerator.h"
#include "ZkErrors.h"
#include <xrpl/basics/Log.h>

namespace emochain {
namespace zkp {

CommitmentGenerator::CommitmentGenerator(
    const ThresholdProofBackend& backend,
    NonceSource& nonces,
    clock_type& clock,
    ScoreDomain domain,
    FreshnessPolicy freshness,
    beast::Journal journal)
    : backend_(backend)
    , nonces_(nonces)
    , clock_(clock)
    , domain_(domain)
    , freshness_(freshness)
    , j_(journal)
{
    if (domain_.min > domain_.max)
        throw std::invalid_argument("Score domain minimum exceeds maximum");
}

uint256 CommitmentGenerator::hashCommitment(
    std::uint32_t score,
    const uint256& nonce)
{
    Blob preimage;
    preimage.reserve(4 + uint256::size());
    appendBE32(preimage, score);
    append(preimage, nonce);
    return sha256(preimage);
}

void CommitmentGenerator::validateInputs(
    std::uint32_t score,
    std::uint32_t threshold) const
{
    if (!domain_.contains(score))
        throw InvalidScoreRange(
            "Score " + std::to_string(score) + " outside [" +
            std::to_string(domain_.min) + ", " + std::to_string(domain_.max) + "]");

    if (!domain_.contains(threshold))
        throw InvalidThreshold(
            "Threshold " + std::to_string(threshold) + " outside [" +
            std::to_string(domain_.min) + ", " + std::to_string(domain_.max) + "]");
}

Commitment CommitmentGenerator::generateCommitment(std::uint32_t score) {
    if (!domain_.contains(score))
        throw InvalidScoreRange("Score " + std::to_string(score) + " outside domain");

    Commitment result;
    result.nonce = nonces_.nonce();
    result.commitment = hashCommitment(score, result.nonce);
    result.score = score;
    return result;
}

ThresholdProof CommitmentGenerator::generateThresholdProof(
    const std::string& submitterId,
    std::uint32_t score,
    std::uint32_t threshold)
{
    validateInputs(score, threshold);
    return generateThresholdProof(submitterId, score, threshold, nonces_.nonce());
}

ThresholdProof CommitmentGenerator::generateThresholdProof(
    const std::string& submitterId,
    std::uint32_t score,
    std::uint32_t threshold,
    const uint256& nonce)
{
    validateInputs(score, threshold);

    ThresholdProof proof;
    proof.submitterId = submitterId;
    proof.commitment = hashCommitment(score, nonce);

    try {
        proof.proofArtifact = backend_.produce(score, threshold, nonce, proof.commitment);
    } catch (ProofGenerationError const&) {
        throw;
    } catch (std::exception const& e) {
        throw ProofGenerationError(backend_.name() + ": " + e.what());
    }

    if (proof.proofArtifact.empty())
        throw ProofGenerationError(backend_.name() + " returned an empty artifact");

    proof.scoreAboveThreshold = score >= threshold;
    proof.isValid = true;
    proof.timestamp = clock_.now();

    JLOG(j_.debug()) << "Threshold proof generated for " << submitterId
                     << " (" << proof.proofArtifact.size() << " bytes)";
    return proof;
}

bool CommitmentGenerator::verifyThresholdProof(
    const ThresholdProof& proof,
    std::uint32_t threshold) const
{
    auto const now = clock_.now();

    if (now - proof.timestamp > freshness_.replayWindow) {
        JLOG(j_.info()) << "Proof too old: "
                        << std::chrono::duration_cast<std::chrono::seconds>(
                               now - proof.timestamp).count()
                        << " seconds";
        return false;
    }

    if (proof.timestamp - now > freshness_.futureTolerance) {
        JLOG(j_.info()) << "Proof from future";
        return false;
    }

    if (proof.commitment.isZero()) {
        JLOG(j_.info()) << "Invalid commitment format";
        return false;
    }

    if (!backend_.verify(
            proof.proofArtifact, threshold, proof.commitment, proof.scoreAboveThreshold)) {
        JLOG(j_.info()) << "Invalid threshold proof from " << proof.submitterId;
        return false;
    }

    return true;
}

ProofPartition CommitmentGenerator::partitionByValidity(
    const std::vector<ThresholdProof>& proofs,
    std::uint32_t threshold) const
{
    ProofPartition result;
    for (const auto& proof : proofs) {
        if (verifyThresholdProof(proof, threshold))
            result.valid.push_back(proof);
        else
            result.invalid.push_back(proof);
    }
    return result;
}

} // namespace zkp
} // namespace emochain
