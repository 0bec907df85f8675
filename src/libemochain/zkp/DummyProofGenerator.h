#pragma once

#include <libemochain/zkp/BatchProof.h>
#include <libemochain/zkp/NonceSource.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/beast/xor_shift_engine.h>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace emochain {
namespace zkp {

/**
 * Produces padding proofs that are shaped like real ones: a synthetic
 * submitter id, a commitment over a random preimage of the real preimage
 * length, an artifact whose size is drawn from recently observed real
 * artifact sizes, and a pass bit drawn with probability passRate.
 *
 * Thread safe.
 */
class DummyProofGenerator {
public:
    static constexpr std::size_t sizeHistory = 64;
    static constexpr std::size_t submitterIdBytes = 20;

    DummyProofGenerator(
        NonceSource& nonces,
        clock_type& clock,
        std::size_t nominalArtifactSize,
        double passRate,
        std::uint64_t seed,
        beast::Journal journal);

    // The synthetic marker is stripped before return
    ThresholdProof generateDummyProof();

    // Record a real artifact size so padding follows the real distribution
    void observeArtifactSize(std::size_t size);

    double passRate() const { return pass_rate_; }

private:
    NonceSource& nonces_;
    clock_type& clock_;
    std::size_t nominal_size_;
    double pass_rate_;
    beast::Journal const j_;

    std::mutex mutex_;
    beast::xor_shift_engine prng_;
    std::deque<std::size_t> observed_sizes_;

    DummyProof makeDummy();
};

} // namespace zkp
} // namespace emochain
