#ifndef EMOCHAIN_THRESHOLD_CIRCUIT_H
#define EMOCHAIN_THRESHOLD_CIRCUIT_H

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>
#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>
#include <cstdint>
#include <memory>

namespace emochain {
namespace zkp {

using libsnark::comparison_gadget;
using libsnark::gadget;
using libsnark::packing_gadget;
using libsnark::pb_linear_combination;
using libsnark::pb_variable;
using libsnark::pb_variable_array;
using libsnark::protoboard;

using CurveType = libff::alt_bn128_pp;
using FrType = libff::Fr<CurveType>;

/**
 * Threshold circuit
 *
 * PUBLIC INPUTS:  [threshold, passed]
 * PRIVATE INPUTS: [score]
 *
 * Enforces score < 2^num_bits and passed == (threshold <= score), so a
 * proof attests the published pass bit without revealing the score.
 */
template <typename FieldT>
class ThresholdCircuit : public gadget<FieldT>
{
private:
    pb_variable<FieldT> threshold;
    pb_variable<FieldT> passed;
    pb_variable<FieldT> score;
    pb_variable_array<FieldT> score_bits;
    pb_variable_array<FieldT> threshold_bits;
    std::shared_ptr<packing_gadget<FieldT>> unpack_score;
    std::shared_ptr<packing_gadget<FieldT>> unpack_threshold;
    pb_variable<FieldT> less;
    pb_variable<FieldT> less_or_eq;
    std::shared_ptr<comparison_gadget<FieldT>> cmp;
    size_t num_bits;

public:
    static constexpr size_t num_public_inputs = 2;

    ThresholdCircuit(protoboard<FieldT>& pb, size_t num_bits);

    void
    generate_r1cs_constraints();
    void
    generate_r1cs_witness(std::uint32_t score_val, std::uint32_t threshold_val);

    FieldT
    passed_value() const
    {
        return this->pb.val(passed);
    }

    const pb_variable<FieldT>&
    passed_variable() const
    {
        return passed;
    }

    size_t
    bits() const
    {
        return num_bits;
    }
};

}  // namespace zkp
}  // namespace emochain

#endif  // EMOCHAIN_THRESHOLD_CIRCUIT_H
