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

#include <cstddef>
#include <mutex>
#include <vector>

#include <gmpxx.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/common/profiling.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <zkpaillier/circuit/paillier_relation.hpp>
#include <zkpaillier/error.hpp>
#include <zkpaillier/gadget/biguint_var.hpp>
#include <zkpaillier/util/log.hpp>
#include <zkpaillier/util/timer.hpp>

namespace zkpaillier::groth16 {

/// BN254, the curve every tool and test uses
using default_pp = libff::alt_bn128_pp;

template <typename ppT> using field_type       = libff::Fr<ppT>;
template <typename ppT> using keypair          = libsnark::r1cs_gg_ppzksnark_keypair<ppT>;
template <typename ppT> using proving_key      = libsnark::r1cs_gg_ppzksnark_proving_key<ppT>;
template <typename ppT> using verification_key = libsnark::r1cs_gg_ppzksnark_verification_key<ppT>;
template <typename ppT> using proof            = libsnark::r1cs_gg_ppzksnark_proof<ppT>;

template <typename ppT, size_t W = 32>
using relation = circuit::paillier_relation<field_type<ppT>, W>;

/// Initialize curve parameters once and silence libff's profiling output
inline void init_public_params() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        default_pp::init_public_params();
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
    });
}

template <typename ppT, size_t W>
libsnark::protoboard<field_type<ppT>> synthesize(const relation<ppT, W>& rel) {
    auto t = make_timer("synthesize");

    libsnark::protoboard<field_type<ppT>> pb;
    rel.generate_constraints(pb);
    return pb;
}

/// Groth16 parameters for `bits`-bit moduli
template <typename ppT = default_pp, size_t W = 32>
keypair<ppT> generate_parameters(size_t bits) {
    const auto pb = synthesize<ppT, W>(relation<ppT, W>::placeholder(bits));

    ZKPAILLIER_LOG_INFO << "Generating parameters for a " << bits << "-bit modulus ("
                        << pb.num_constraints() << " constraints, "
                        << pb.num_inputs() << " public inputs)";

    auto t = make_timer("generate_parameters");
    return libsnark::r1cs_gg_ppzksnark_generator<ppT>(pb.get_constraint_system());
}

/// Prove knowledge of (m, r) for the ciphertext in `rel`. Throws
/// synthesis_error if the witnesses do not satisfy the relation.
template <typename ppT, size_t W>
proof<ppT> prove(const proving_key<ppT>& pk, const relation<ppT, W>& rel) {
    const auto pb = synthesize<ppT, W>(rel);

    if (!pb.is_satisfied()) {
        throw synthesis_error("witnesses do not satisfy the Paillier relation");
    }

    ZKPAILLIER_LOG_INFO << "Proving over " << pb.num_constraints() << " constraints";

    auto t = make_timer("prove");
    return libsnark::r1cs_gg_ppzksnark_prover<ppT>(pk, pb.primary_input(), pb.auxiliary_input());
}

/// Verifier-side public inputs in allocation order: nn, g, n, c
template <typename ppT = default_pp, size_t W = 32>
std::vector<field_type<ppT>> public_inputs(const mpz_class& n, const mpz_class& c, size_t bits) {
    using var = gadget::biguint_var<field_type<ppT>, W>;

    std::vector<field_type<ppT>> out;
    for (auto&& part : { var::inputize(n * n, 2 * bits),
                         var::inputize(n + 1, 2 * bits),
                         var::inputize(n, bits),
                         var::inputize(c, 2 * bits) })
    {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

/// False for a rejected proof, including one checked against public
/// inputs of the wrong length
template <typename ppT>
bool verify(const verification_key<ppT>& vk,
            const std::vector<field_type<ppT>>& inputs,
            const proof<ppT>& pi)
{
    auto t = make_timer("verify");

    const auto pvk = libsnark::r1cs_gg_ppzksnark_verifier_process_vk<ppT>(vk);
    return libsnark::r1cs_gg_ppzksnark_online_verifier_strong_IC<ppT>(pvk, inputs, pi);
}

}  // namespace zkpaillier::groth16
