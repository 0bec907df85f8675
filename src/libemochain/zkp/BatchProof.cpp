#include "BatchProof.h"

namespace emochain {
namespace zkp {

std::int64_t toMillis(NetClock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

Json::Value getJson(const AggregatedProof& proof) {
    Json::Value jv(Json::objectValue);
    jv["type"] = "batch_proof";
    jv["merkle_root"] = to_string(proof.merkleRoot);
    jv["proof_count"] = static_cast<Json::UInt>(proof.proofCount);
    jv["protocol"] = proof.protocol;
    jv["timestamp"] = std::to_string(toMillis(proof.timestamp));

    Json::Value& leaves = jv["individual_proofs"] = Json::arrayValue;
    for (const auto& leaf : proof.leaves)
        leaves.append(to_string(leaf));

    return jv;
}

Json::Value getJson(const BatchProof& batch) {
    Json::Value jv(Json::objectValue);
    jv["batch_id"] = to_string(batch.batchId);

    Json::Value& commitments = jv["validator_commitments"] = Json::arrayValue;
    for (const auto& cm : batch.commitments)
        commitments.append(to_string(cm));

    jv["aggregated_proof"] = getJson(batch.aggregatedProof);
    jv["timestamp"] = std::to_string(toMillis(batch.timestamp));
    jv["validator_count"] = static_cast<Json::UInt>(batch.validatorCount);
    jv["thresholds_passed"] = static_cast<Json::UInt>(batch.thresholdsPassed);
    jv["is_valid"] = batch.isValid;
    return jv;
}

Json::Value getJson(const DummyTransaction& tx) {
    Json::Value jv(Json::objectValue);
    jv["id"] = to_string(tx.id);
    jv["type"] = "dummy";
    jv["timestamp"] = std::to_string(toMillis(tx.timestamp));
    jv["size"] = static_cast<Json::UInt>(tx.payload.size());
    return jv;
}

} // namespace zkp
} // namespace emochain
