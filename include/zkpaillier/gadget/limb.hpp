/*
 * Copyright (C) 2023-2026 Ligero, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <string>
#include <vector>

#include <gmpxx.h>

#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

#include <zkpaillier/error.hpp>
#include <zkpaillier/util/mpz_field.hpp>

namespace zkpaillier::gadget {

/// Value of `lc` on the current assignment of `pb`
template <typename FieldT>
FieldT lc_value(const libsnark::protoboard<FieldT>& pb,
                const libsnark::linear_combination<FieldT>& lc)
{
    FieldT acc = FieldT::zero();
    for (const auto& term : lc.terms) {
        acc += term.coeff * pb.val(libsnark::pb_variable<FieldT>(term.index));
    }
    return acc;
}

/// Add `k * x` to `acc` term by term without merging indices.
template <typename FieldT>
void append_scaled(libsnark::linear_combination<FieldT>& acc,
                   const libsnark::linear_combination<FieldT>& x,
                   const FieldT& k)
{
    for (const auto& term : x.terms) {
        acc.terms.emplace_back(libsnark::variable<FieldT>(term.index), term.coeff * k);
    }
}

/// 1 * x = y
template <typename FieldT>
void enforce_equal_lc(libsnark::protoboard<FieldT>& pb,
                      const libsnark::linear_combination<FieldT>& x,
                      const libsnark::linear_combination<FieldT>& y,
                      const std::string& annotation)
{
    pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, x, y), annotation);
}

/// Fresh variable assigned `value`
template <typename FieldT>
libsnark::pb_variable<FieldT> allocate_variable(libsnark::protoboard<FieldT>& pb,
                                                const FieldT& value,
                                                const std::string& annotation)
{
    libsnark::pb_variable<FieldT> var;
    var.allocate(pb, annotation);
    pb.val(var) = value;
    return var;
}

/// Evaluated combination registered with `pb`, allocating no variable
template <typename FieldT>
libsnark::pb_linear_combination<FieldT> assign_lc(libsnark::protoboard<FieldT>& pb,
                                                  const libsnark::linear_combination<FieldT>& lc)
{
    libsnark::pb_linear_combination<FieldT> out;
    out.assign(pb, lc);
    out.evaluate(pb);
    return out;
}

/************************************************************
 * Decompose the value of `x` into `width` little-endian bits.
 *
 * The bits are fresh variables tied to `x` by a packing_gadget
 * with bitness enforced, so a satisfying assignment implies
 * 0 <= x < 2^width.
 ************************************************************/
template <typename FieldT>
libsnark::pb_linear_combination_array<FieldT>
decompose_bits(libsnark::protoboard<FieldT>& pb,
               const libsnark::pb_linear_combination<FieldT>& x,
               size_t width,
               const std::string& annotation)
{
    if (width == 0 || width > FieldT::capacity()) {
        throw structural_error("bit decomposition width " + std::to_string(width)
                               + " does not fit the field");
    }

    libsnark::pb_variable_array<FieldT> bits;
    bits.allocate(pb, width, annotation + "_bits");

    libsnark::packing_gadget<FieldT> packer(pb, bits, x, annotation + "_pack");
    packer.generate_r1cs_constraints(true);
    packer.generate_r1cs_witness_from_packed();

    return libsnark::pb_linear_combination_array<FieldT>(bits);
}

}  // namespace zkpaillier::gadget
