#include "DummyProofGenerator.h"
#include <xrpl/basics/Log.h>
#include <xrpl/basics/random.h>
#include <xrpl/basics/strHex.h>
#include <random>
#include <stdexcept>

namespace emochain {
namespace zkp {

DummyProofGenerator::DummyProofGenerator(
    NonceSource& nonces,
    clock_type& clock,
    std::size_t nominalArtifactSize,
    double passRate,
    std::uint64_t seed,
    beast::Journal journal)
    : nonces_(nonces)
    , clock_(clock)
    , nominal_size_(nominalArtifactSize)
    , pass_rate_(passRate)
    , j_(journal)
    , prng_(seed)
{
    if (!(passRate >= 0.0 && passRate <= 1.0))
        throw std::invalid_argument("Dummy pass rate must be within [0, 1]");
    if (nominalArtifactSize == 0)
        throw std::invalid_argument("Nominal artifact size must be positive");
}

void DummyProofGenerator::observeArtifactSize(std::size_t size) {
    if (size == 0)
        return;

    std::lock_guard lock(mutex_);
    observed_sizes_.push_back(size);
    if (observed_sizes_.size() > sizeHistory)
        observed_sizes_.pop_front();
}

DummyProof DummyProofGenerator::makeDummy() {
    std::size_t artifactSize;
    bool passed;
    {
        std::lock_guard lock(mutex_);
        if (observed_sizes_.empty()) {
            artifactSize = nominal_size_;
        } else {
            artifactSize = observed_sizes_[ripple::rand_int(
                prng_, std::size_t{0}, observed_sizes_.size() - 1)];
        }
        passed = std::bernoulli_distribution(pass_rate_)(prng_);
    }

    // Same preimage length as be32(score) || nonce
    Blob preimage = nonces_.bytes(4 + NonceSource::nonceBytes);
    Blob id = nonces_.bytes(submitterIdBytes);

    DummyProof dummy;
    dummy.proof.submitterId = ripple::strHex(id);
    dummy.proof.timestamp = clock_.now();
    dummy.proof.proofArtifact = nonces_.bytes(artifactSize);
    dummy.proof.commitment = sha256(preimage);
    dummy.proof.scoreAboveThreshold = passed;
    dummy.proof.isValid = true;
    return dummy;
}

ThresholdProof DummyProofGenerator::generateDummyProof() {
    DummyProof dummy = makeDummy();
    JLOG(j_.trace()) << "Dummy proof generated ("
                     << dummy.proof.proofArtifact.size() << " bytes)";
    return std::move(dummy.proof);
}

} // namespace zkp
} // namespace emochain
