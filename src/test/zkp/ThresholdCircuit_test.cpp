#define BOOST_TEST_MODULE ThresholdCircuit
#include <boost/test/unit_test.hpp>
#include <libemochain/zkp/CommitmentGenerator.h>
#include <libemochain/zkp/SnarkThresholdBackend.h>
#include <libemochain/zkp/ZkErrors.h>
#include <libemochain/zkp/circuits/ThresholdCircuit.h>
#include <xrpl/beast/clock/manual_clock.h>
#include <libsnark/gadgetlib1/protoboard.hpp>

using namespace emochain::zkp;
using namespace libsnark;

namespace {

using FieldT = FrType;

beast::Journal
nullJournal()
{
    return beast::Journal{beast::Journal::getNullSink()};
}

// Key generation is slow; share one backend across cases
SnarkThresholdBackend&
backend()
{
    static SnarkThresholdBackend instance(7, nullJournal());
    return instance;
}

bool
satisfied(std::uint32_t score, std::uint32_t threshold, size_t num_bits = 8)
{
    protoboard<FieldT> pb;
    ThresholdCircuit<FieldT> circuit(pb, num_bits);
    circuit.generate_r1cs_constraints();
    circuit.generate_r1cs_witness(score, threshold);
    return pb.is_satisfied();
}

}  // namespace

BOOST_AUTO_TEST_SUITE(ThresholdCircuitTest)

BOOST_AUTO_TEST_CASE(Threshold_ScoreAboveThreshold)
{
    SnarkThresholdBackend::initCurve();
    protoboard<FieldT> pb;
    ThresholdCircuit<FieldT> circuit(pb, 8);

    circuit.generate_r1cs_constraints();
    circuit.generate_r1cs_witness(90, 75);

    BOOST_CHECK(pb.is_satisfied());
    BOOST_CHECK(circuit.passed_value() == FieldT::one());
    BOOST_CHECK_EQUAL(pb.num_inputs(), ThresholdCircuit<FieldT>::num_public_inputs);
}

BOOST_AUTO_TEST_CASE(Threshold_ScoreEqualsThreshold)
{
    SnarkThresholdBackend::initCurve();
    protoboard<FieldT> pb;
    ThresholdCircuit<FieldT> circuit(pb, 8);

    circuit.generate_r1cs_constraints();
    circuit.generate_r1cs_witness(75, 75);

    BOOST_CHECK(pb.is_satisfied());
    BOOST_CHECK(circuit.passed_value() == FieldT::one());
}

BOOST_AUTO_TEST_CASE(Threshold_ScoreBelowThreshold)
{
    SnarkThresholdBackend::initCurve();
    protoboard<FieldT> pb;
    ThresholdCircuit<FieldT> circuit(pb, 8);

    circuit.generate_r1cs_constraints();
    circuit.generate_r1cs_witness(74, 75);

    // Failing the threshold is a valid statement with passed = 0
    BOOST_CHECK(pb.is_satisfied());
    BOOST_CHECK(circuit.passed_value() == FieldT::zero());
}

BOOST_AUTO_TEST_CASE(Threshold_DomainEdges)
{
    SnarkThresholdBackend::initCurve();
    BOOST_CHECK(satisfied(0, 0));
    BOOST_CHECK(satisfied(100, 0));
    BOOST_CHECK(satisfied(0, 100));
    BOOST_CHECK(satisfied(255, 255));
}

BOOST_AUTO_TEST_CASE(Threshold_TamperedPassBit)
{
    SnarkThresholdBackend::initCurve();
    protoboard<FieldT> pb;
    ThresholdCircuit<FieldT> circuit(pb, 8);

    circuit.generate_r1cs_constraints();
    circuit.generate_r1cs_witness(40, 75);
    BOOST_CHECK(pb.is_satisfied());

    pb.val(circuit.passed_variable()) = FieldT::one();
    BOOST_CHECK(!pb.is_satisfied());
}

BOOST_AUTO_TEST_CASE(Threshold_ScoreOutOfRange)
{
    SnarkThresholdBackend::initCurve();
    // 300 does not fit in 8 bits
    BOOST_CHECK(!satisfied(300, 75));
}

BOOST_AUTO_TEST_CASE(SnarkBackend_ProveAndVerify)
{
    auto& snark = backend();
    BOOST_CHECK_EQUAL(snark.scoreBits(), 7u);
    BOOST_CHECK(snark.nominalArtifactSize() > 0);

    uint256 nonce;
    nonce = 9;
    auto const cm = CommitmentGenerator::hashCommitment(90, nonce);

    auto artifact = snark.produce(90, 75, nonce, cm);
    BOOST_CHECK(!artifact.empty());
    BOOST_CHECK(snark.verify(artifact, 75, cm, true));

    // Wrong public statement
    BOOST_CHECK(!snark.verify(artifact, 75, cm, false));
    BOOST_CHECK(!snark.verify(artifact, 76, cm, true));

    // Garbage never throws
    BOOST_CHECK(!snark.verify(Blob{1, 2, 3}, 75, cm, true));
    BOOST_CHECK(!snark.verify(Blob{}, 75, cm, true));
}

BOOST_AUTO_TEST_CASE(SnarkBackend_FailingScore)
{
    auto& snark = backend();
    uint256 nonce;
    nonce = 10;
    auto const cm = CommitmentGenerator::hashCommitment(40, nonce);

    auto artifact = snark.produce(40, 75, nonce, cm);
    BOOST_CHECK(snark.verify(artifact, 75, cm, false));
    BOOST_CHECK(!snark.verify(artifact, 75, cm, true));
}

BOOST_AUTO_TEST_CASE(SnarkBackend_WidthExceeded)
{
    auto& snark = backend();
    BOOST_CHECK_THROW(
        snark.produce(200, 75, uint256{}, uint256{}), ProofGenerationError);
}

BOOST_AUTO_TEST_CASE(SnarkBackend_WithCommitmentGenerator)
{
    auto& snark = backend();
    beast::manual_clock<NetClock> clock;
    CommitmentGenerator gen(
        snark, defaultNonceSource(), clock, ScoreDomain{}, FreshnessPolicy{},
        nullJournal());

    auto proof = gen.generateThresholdProof("rSnarkValidator", 82, 75);
    BOOST_CHECK(proof.scoreAboveThreshold);
    BOOST_CHECK(gen.verifyThresholdProof(proof, 75));

    proof.scoreAboveThreshold = false;
    BOOST_CHECK(!gen.verifyThresholdProof(proof, 75));
}

BOOST_AUTO_TEST_SUITE_END()
