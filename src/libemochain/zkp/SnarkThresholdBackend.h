#pragma once

#include <libemochain/zkp/ThresholdProofBackend.h>
#include <libemochain/zkp/circuits/ThresholdCircuit.h>
#include <xrpl/beast/utility/Journal.h>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>
#include <memory>

namespace emochain {
namespace zkp {

/**
 * Groth16 backend over alt_bn128 for the ThresholdCircuit.
 *
 * Keys are generated once per instance. The artifact is the serialized
 * r1cs_gg_ppzksnark proof; public inputs are rebuilt from (threshold,
 * scoreAboveThreshold) at verification time.
 */
class SnarkThresholdBackend : public ThresholdProofBackend {
public:
    using DefaultCurve = CurveType;
    using FieldT = FrType;

    SnarkThresholdBackend(std::size_t scoreBits, beast::Journal journal);

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

    std::string name() const override { return "groth16_alt_bn128"; }

    std::size_t nominalArtifactSize() const override { return nominal_size_; }

    std::size_t scoreBits() const { return score_bits_; }

    // Idempotent curve setup; also silences libff profiling output
    static void initCurve();

private:
    using ProvingKey = libsnark::r1cs_gg_ppzksnark_proving_key<DefaultCurve>;
    using VerificationKey = libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>;
    using Proof = libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>;

    std::size_t score_bits_;
    std::size_t nominal_size_ = 0;
    beast::Journal const j_;

    std::shared_ptr<ProvingKey> proving_key_;
    std::shared_ptr<VerificationKey> verification_key_;

    static Blob serializeProof(const Proof& proof);
    static Proof deserializeProof(const Blob& artifact);
};

} // namespace zkp
} // namespace emochain
