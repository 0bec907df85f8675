#include "ThresholdCircuit.h"

namespace emochain {
namespace zkp {

template <typename FieldT>
ThresholdCircuit<FieldT>::ThresholdCircuit(
    protoboard<FieldT>& pb,
    size_t num_bits)
    : gadget<FieldT>(pb, "ThresholdCircuit"), num_bits(num_bits)
{
    // Public inputs must be allocated first
    threshold.allocate(pb, "threshold");
    passed.allocate(pb, "passed");
    pb.set_input_sizes(num_public_inputs);

    score.allocate(pb, "score");
    score_bits.allocate(pb, num_bits, "score_bits");
    threshold_bits.allocate(pb, num_bits, "threshold_bits");
    less.allocate(pb, "less");
    less_or_eq.allocate(pb, "less_or_eq");

    unpack_score.reset(
        new packing_gadget<FieldT>(pb, score_bits, score, "unpack_score"));
    unpack_threshold.reset(new packing_gadget<FieldT>(
        pb, threshold_bits, threshold, "unpack_threshold"));

    pb_linear_combination<FieldT> threshold_lc;
    pb_linear_combination<FieldT> score_lc;
    threshold_lc.assign(pb, threshold);
    score_lc.assign(pb, score);

    // less_or_eq = (threshold <= score)
    cmp.reset(new comparison_gadget<FieldT>(
        pb, num_bits, threshold_lc, score_lc, less, less_or_eq, "cmp"));
}

template <typename FieldT>
void
ThresholdCircuit<FieldT>::generate_r1cs_constraints()
{
    // Range checks: both operands fit in num_bits
    unpack_score->generate_r1cs_constraints(true);
    unpack_threshold->generate_r1cs_constraints(true);

    cmp->generate_r1cs_constraints();

    this->pb.add_r1cs_constraint(
        libsnark::r1cs_constraint<FieldT>(1, less_or_eq, passed),
        "passed == less_or_eq");
}

template <typename FieldT>
void
ThresholdCircuit<FieldT>::generate_r1cs_witness(
    std::uint32_t score_val,
    std::uint32_t threshold_val)
{
    this->pb.val(score) = FieldT(static_cast<long>(score_val));
    this->pb.val(threshold) = FieldT(static_cast<long>(threshold_val));

    unpack_score->generate_r1cs_witness_from_packed();
    unpack_threshold->generate_r1cs_witness_from_packed();

    cmp->generate_r1cs_witness();

    this->pb.val(passed) = this->pb.val(less_or_eq);
}

template class ThresholdCircuit<FrType>;

}  // namespace zkp
}  // namespace emochain
