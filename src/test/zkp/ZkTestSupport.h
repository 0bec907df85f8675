#pragma once

#include <libemochain/zkp/BatchProof.h>
#include <libemochain/zkp/NonceSource.h>
#include <libemochain/zkp/ThresholdProofBackend.h>
#include <libemochain/zkp/ZkErrors.h>
#include <xrpl/beast/clock/manual_clock.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/beast/xor_shift_engine.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>

namespace emochain {
namespace zkp {
namespace test {

using ManualClock = beast::manual_clock<NetClock>;

// Reproducible stand-in for the system RNG
class SeededNonceSource : public NonceSource {
public:
    explicit SeededNonceSource(std::uint64_t seed = 1977) : engine_(seed) {}

    void fill(void* out, std::size_t size) override {
        if (failing)
            throw ProofGenerationError("RAND_bytes failed");
        auto* p = static_cast<std::uint8_t*>(out);
        while (size != 0) {
            auto const word = engine_();
            auto const n = std::min(size, sizeof(word));
            std::memcpy(p, &word, n);
            p += n;
            size -= n;
        }
    }

    // Set to make every draw fail, as an exhausted entropy source would
    bool failing = false;

private:
    beast::xor_shift_engine engine_;
};

class ThrowingBackend : public ThresholdProofBackend {
public:
    Blob produce(std::uint32_t, std::uint32_t, const uint256&, const uint256&)
        const override
    {
        throw std::runtime_error("prover offline");
    }

    bool verify(const Blob&, std::uint32_t, const uint256&, bool) const override {
        return false;
    }

    std::string name() const override { return "throwing"; }

    std::size_t nominalArtifactSize() const override { return 1; }
};

inline beast::Journal nullJournal() {
    return beast::Journal{beast::Journal::getNullSink()};
}

// Arbitrary fixed start, well away from the epoch
inline NetClock::time_point startTime() {
    return NetClock::time_point(std::chrono::hours(24 * 365 * 55));
}

// A queued proof as the coordinator sees it; the artifact varies with id
inline ThresholdProof makeProof(
    std::string const& id,
    bool passed,
    NetClock::time_point when)
{
    ThresholdProof proof;
    proof.submitterId = id;
    proof.timestamp = when;
    proof.proofArtifact.assign(id.begin(), id.end());
    proof.proofArtifact.push_back(passed ? 1 : 0);
    proof.commitment = sha256(proof.proofArtifact);
    proof.scoreAboveThreshold = passed;
    proof.isValid = true;
    return proof;
}

} // namespace test
} // namespace zkp
} // namespace emochain
