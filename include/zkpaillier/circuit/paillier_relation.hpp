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

#include <gmpxx.h>

#include <libsnark/gadgetlib1/protoboard.hpp>

#include <zkpaillier/gadget/biguint_var.hpp>
#include <zkpaillier/util/log.hpp>

namespace zkpaillier::circuit {

/************************************************************
 * Knowledge of a Paillier plaintext and nonce.
 *
 * Public:  nn = n^2, g = n + 1, n, c
 * Private: m < n, r < n
 * Claim:   c = g^m * r^n mod n^2
 *
 * `bits` is the modulus size N. Limb layout and constraint count
 * depend on N alone, so a placeholder instance with all values
 * zero yields the same system as a real one.
 ************************************************************/
template <typename FieldT, size_t W = 32>
struct paillier_relation {
    using pb_type = libsnark::protoboard<FieldT>;
    using var     = gadget::biguint_var<FieldT, W>;

    size_t bits = 0;
    mpz_class m;
    mpz_class p;
    mpz_class q;
    mpz_class r;
    mpz_class c;

    /// All-zero instance used to shape parameter generation
    static paillier_relation placeholder(size_t bits) {
        paillier_relation rel;
        rel.bits = bits;
        return rel;
    }

    mpz_class n() const { return p * q; }

    /// Public inputs occupy the first protoboard variables in the order
    /// nn, g, n, c; witnesses follow.
    void generate_constraints(pb_type& pb) const {
        const size_t N = bits;
        const mpz_class n_val  = n();
        const mpz_class nn_val = n_val * n_val;
        const mpz_class g_val  = n_val + 1;

        auto nn_var = var::new_input(pb, nn_val, 2 * N);
        auto g_var  = var::new_input(pb, g_val, 2 * N);
        auto n_var  = var::new_input(pb, n_val, N);
        auto c_var  = var::new_input(pb, c, 2 * N);

        auto m_var  = var::new_witness(pb, m, N);
        auto r_var  = var::new_witness(pb, r, 2 * N);

        nn_var.enforce_range(pb);
        g_var.enforce_range(pb);
        n_var.enforce_range(pb);
        c_var.enforce_range(pb);

        // nn = n * n, g = n + 1
        n_var.mul_no_carry(pb, n_var).enforce_equal_when_carried(pb, nn_var.to_unnormalized());
        n_var.to_unnormalized()
            .add_no_carry(var::constant(pb, 1, 1).to_unnormalized())
            .enforce_equal_when_carried(pb, g_var.to_unnormalized());

        const auto gm = g_var.powm(pb, m_var.to_bits_le(pb), nn_var, 2 * N);
        const auto rn = r_var.powm(pb, n_var.to_bits_le(pb), nn_var, 2 * N);
        const auto res = gm.mul_no_carry(pb, rn).rem(pb, nn_var, 2 * N);

        res.enforce_equal(pb, c_var);

        ZKPAILLIER_LOG_DEBUG << "paillier relation for " << N << "-bit modulus: "
                             << pb.num_inputs() << " inputs, "
                             << pb.num_variables() - pb.num_inputs() << " witnesses, "
                             << pb.num_constraints() << " constraints";
    }
};

}  // namespace zkpaillier::circuit
