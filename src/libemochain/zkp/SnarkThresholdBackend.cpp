#include "SnarkThresholdBackend.h"
#include "ZkErrors.h"
#include <xrpl/basics/Log.h>
#include <libff/common/profiling.hpp>
#include <mutex>
#include <sstream>

namespace emochain {
namespace zkp {

void SnarkThresholdBackend::initCurve() {
    static std::once_flag once;
    std::call_once(once, [] {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
        DefaultCurve::init_public_params();
    });
}

SnarkThresholdBackend::SnarkThresholdBackend(
    std::size_t scoreBits,
    beast::Journal journal)
    : score_bits_(scoreBits), j_(journal)
{
    if (scoreBits == 0 || scoreBits > 32)
        throw std::invalid_argument("Score width must be between 1 and 32 bits");

    initCurve();

    JLOG(j_.info()) << "Generating threshold circuit keys for "
                    << score_bits_ << "-bit scores";

    protoboard<FieldT> pb;
    ThresholdCircuit<FieldT> circuit(pb, score_bits_);
    circuit.generate_r1cs_constraints();

    auto cs = pb.get_constraint_system();
    JLOG(j_.debug()) << "Threshold circuit has " << cs.num_constraints()
                     << " constraints";

    auto keypair = libsnark::r1cs_gg_ppzksnark_generator<DefaultCurve>(cs);
    proving_key_ = std::make_shared<ProvingKey>(std::move(keypair.pk));
    verification_key_ = std::make_shared<VerificationKey>(std::move(keypair.vk));

    // Proof size is fixed for a given curve and build; measure it once
    nominal_size_ = produce(0, 0, uint256{}, uint256{}).size();
    JLOG(j_.debug()) << "Threshold proof size: " << nominal_size_ << " bytes";
}

Blob SnarkThresholdBackend::produce(
    std::uint32_t score,
    std::uint32_t threshold,
    const uint256&,
    const uint256&) const
{
    // TODO: bind the commitment in-circuit with sha256_two_to_one_hash_gadget
    // so the proof also attests commitment == SHA256(score || nonce).
    if (score_bits_ < 32 &&
        (score >> score_bits_ != 0 || threshold >> score_bits_ != 0))
        throw ProofGenerationError("Score or threshold exceeds circuit width");

    try {
        protoboard<FieldT> pb;
        ThresholdCircuit<FieldT> circuit(pb, score_bits_);
        circuit.generate_r1cs_constraints();
        circuit.generate_r1cs_witness(score, threshold);

        if (!pb.is_satisfied())
            throw ProofGenerationError("Threshold witness does not satisfy circuit");

        auto proof = libsnark::r1cs_gg_ppzksnark_prover<DefaultCurve>(
            *proving_key_, pb.primary_input(), pb.auxiliary_input());

        return serializeProof(proof);
    } catch (ProofGenerationError const&) {
        throw;
    } catch (std::exception const& e) {
        JLOG(j_.error()) << "Error creating threshold proof: " << e.what();
        throw ProofGenerationError(e.what());
    }
}

bool SnarkThresholdBackend::verify(
    const Blob& artifact,
    std::uint32_t threshold,
    const uint256&,
    bool scoreAboveThreshold) const
{
    if (artifact.empty()) {
        JLOG(j_.debug()) << "Empty threshold proof";
        return false;
    }

    try {
        auto proof = deserializeProof(artifact);

        libsnark::r1cs_primary_input<FieldT> primary_input;
        primary_input.push_back(FieldT(static_cast<long>(threshold)));
        primary_input.push_back(scoreAboveThreshold ? FieldT::one() : FieldT::zero());

        bool result = libsnark::r1cs_gg_ppzksnark_verifier_strong_IC<DefaultCurve>(
            *verification_key_, primary_input, proof);

        JLOG(j_.trace()) << "Threshold proof verification: "
                         << (result ? "PASS" : "FAIL");
        return result;
    } catch (std::exception const& e) {
        JLOG(j_.warn()) << "Error verifying threshold proof: " << e.what();
        return false;
    }
}

Blob SnarkThresholdBackend::serializeProof(const Proof& proof) {
    std::ostringstream oss;
    oss << proof;

    std::string str = oss.str();
    return Blob(str.begin(), str.end());
}

SnarkThresholdBackend::Proof SnarkThresholdBackend::deserializeProof(
    const Blob& artifact)
{
    std::string str(artifact.begin(), artifact.end());
    std::istringstream iss(str);

    Proof proof;
    iss >> proof;
    if (iss.fail())
        throw std::runtime_error("Malformed threshold proof");
    return proof;
}

} // namespace zkp
} // namespace emochain
