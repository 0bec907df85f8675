#pragma once

#include <libemochain/zkp/Digest.h>
#include <xrpl/beast/clock/abstract_clock.h>
#include <xrpl/json/json_value.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace emochain {
namespace zkp {

using NetClock = std::chrono::system_clock;
using clock_type = beast::abstract_clock<NetClock>;

// Age limits applied when verifying proofs and batches
struct FreshnessPolicy {
    std::chrono::milliseconds replayWindow = std::chrono::minutes(15);
    std::chrono::milliseconds futureTolerance = std::chrono::seconds(30);
};

/**
 * A validator's assertion that its private score meets a public threshold.
 *
 * scoreAboveThreshold travels in plaintext until the proof is folded into a
 * batch; only the batch hides which submitter it belonged to.
 */
struct ThresholdProof {
    std::string submitterId;
    NetClock::time_point timestamp;
    Blob proofArtifact;           // opaque, produced by the backend
    uint256 commitment;           // SHA256(be32(score) || nonce)
    bool scoreAboveThreshold = false;
    bool isValid = false;
};

/**
 * Padding entry. The synthetic marker never leaves DummyProofGenerator.
 */
struct DummyProof {
    ThresholdProof proof;
    bool synthetic = true;
};

struct AggregatedProof {
    uint256 merkleRoot;
    std::size_t proofCount = 0;
    std::vector<uint256> leaves;  // SHA256 of each member artifact, batch order
    std::string protocol;
    NetClock::time_point timestamp;
};

struct BatchProof {
    uint128 batchId;
    std::vector<uint256> commitments;
    AggregatedProof aggregatedProof;
    NetClock::time_point timestamp;
    std::size_t validatorCount = 0;
    std::size_t thresholdsPassed = 0;
    bool isValid = false;
};

// Filler traffic; the payload is random and of randomized size
struct DummyTransaction {
    uint256 id;
    NetClock::time_point timestamp;
    Blob payload;
};

inline constexpr char batchProtocol[] = "sha256_merkle_batch";

std::int64_t toMillis(NetClock::time_point tp);

Json::Value getJson(const AggregatedProof& proof);

// Publication form of a batch. Carries aggregates only, no submitter ids.
Json::Value getJson(const BatchProof& batch);

Json::Value getJson(const DummyTransaction& tx);

} // namespace zkp
} // namespace emochain
