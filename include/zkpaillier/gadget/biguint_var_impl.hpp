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

#include <algorithm>

#include <zkpaillier/util/log.hpp>

namespace zkpaillier::gadget {

template <typename FieldT, size_t W>
unnormalized_biguint_var<FieldT, W>
biguint_var<FieldT, W>::to_unnormalized() const {
    return unnormalized_type(std::vector<libsnark::linear_combination<FieldT>>(limbs_.begin(), limbs_.end()),
                             mpz_pow2(W) - 1, bound_, value_);
}

/************************************************************
 * Schoolbook product with deferred carries.
 *
 * The product limbs c_k are fresh witnesses. Viewing limbs as
 * polynomial coefficients, A(x) * B(x) = C(x) is checked at
 * x = 0, 1, ..., deg C. As every coefficient of C stays below
 * the field characteristic, this pins C to the integer
 * convolution.
 ************************************************************/
template <typename FieldT, size_t W>
unnormalized_biguint_var<FieldT, W>
biguint_var<FieldT, W>::mul_no_carry(pb_type& pb, const biguint_var& other) const {
    const size_t na = limbs_.size();
    const size_t nb = other.limbs_.size();
    if (na == 0 || nb == 0) {
        throw structural_error("multiplication by an integer without limbs");
    }
    const size_t nc = na + nb - 1;

    const mpz_class single = mpz_pow2(W) - 1;
    const mpz_class limb_max = mpz_class(static_cast<unsigned long>(std::min(na, nb))) * single * single;
    if (mpz_bit_length(limb_max) + 2 >= FieldT::capacity()) {
        throw structural_error("product limbs of width " + std::to_string(W)
                               + " do not fit the field");
    }

    std::vector<mpz_class> a(na), b(nb), c(nc, 0);
    for (size_t i = 0; i < na; i++)
        a[i] = mpz_from_field(lc_value(pb, limbs_[i]));
    for (size_t j = 0; j < nb; j++)
        b[j] = mpz_from_field(lc_value(pb, other.limbs_[j]));
    for (size_t i = 0; i < na; i++) {
        for (size_t j = 0; j < nb; j++) {
            c[i + j] += a[i] * b[j];
        }
    }

    std::vector<libsnark::linear_combination<FieldT>> product;
    product.reserve(nc);
    for (size_t k = 0; k < nc; k++) {
        product.emplace_back(allocate_variable(pb, field_from_mpz<FieldT>(c[k]), "product_limb"));
    }

    for (size_t t = 0; t < nc; t++) {
        const FieldT x(static_cast<long>(t));
        libsnark::linear_combination<FieldT> lhs, rhs, out;

        FieldT pow = FieldT::one();
        for (size_t i = 0; i < nc; i++) {
            if (i < na) append_scaled(lhs, limbs_[i], pow);
            if (i < nb) append_scaled(rhs, other.limbs_[i], pow);
            append_scaled(out, product[i], pow);
            pow *= x;
        }
        pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(lhs, rhs, out), "mul_no_carry");
    }

    return unnormalized_type(std::move(product), limb_max,
                             bound_ + other.bound_, value_ * other.value_);
}

template <typename FieldT, size_t W>
unnormalized_biguint_var<FieldT, W>
unnormalized_biguint_var<FieldT, W>::add_no_carry(const unnormalized_biguint_var& other) const {
    const size_t n = std::max(limbs_.size(), other.limbs_.size());

    std::vector<lc_type> sum;
    sum.reserve(n);
    for (size_t i = 0; i < n; i++) {
        if (i >= limbs_.size())
            sum.push_back(other.limbs_[i]);
        else if (i >= other.limbs_.size())
            sum.push_back(limbs_[i]);
        else
            sum.push_back(limbs_[i] + other.limbs_[i]);
    }

    return unnormalized_biguint_var(std::move(sum),
                                    limb_max_ + other.limb_max_,
                                    std::max(bound_, other.bound_) + 1,
                                    value_ + other.value_);
}

/************************************************************
 * Carry chain between two limb sequences.
 *
 * Carries may be negative. Each is shifted by 2^(carry_bits - 1)
 * and range checked, which keeps every per-limb identity far
 * below the field characteristic so the field equations imply
 * the integer ones:
 *
 *     lhs_k - rhs_k + carry_{k-1} = carry_k * 2^W
 *
 * with the last carry fixed to zero.
 ************************************************************/
template <typename FieldT, size_t W>
void unnormalized_biguint_var<FieldT, W>::enforce_equal_when_carried(
    pb_type& pb, const unnormalized_biguint_var& other) const
{
    const size_t n = std::max(limbs_.size(), other.limbs_.size());
    const mpz_class max_limb = std::max(limb_max_, other.limb_max_);
    const size_t max_bits = mpz_bit_length(max_limb);

    if (max_bits + 2 >= FieldT::capacity()) {
        throw structural_error("carried limbs of " + std::to_string(max_bits)
                               + " bits do not fit the field");
    }

    const size_t carry_bits = max_bits + 2 > W + 1 ? max_bits + 2 - W : 1;
    const mpz_class offset = mpz_pow2(carry_bits - 1);
    const FieldT offset_f = field_from_mpz<FieldT>(offset);
    const FieldT shift = field_from_mpz<FieldT>(mpz_pow2(W));

    auto limb_or_zero = [](const unnormalized_biguint_var& v, size_t i) {
        return i < v.limbs_.size() ? v.limbs_[i] : lc_type();
    };

    lc_type carry_in;
    mpz_class carry = 0;
    for (size_t k = 0; k < n; k++) {
        const lc_type diff = limb_or_zero(*this, k) - limb_or_zero(other, k) + carry_in;
        const mpz_class d = limb_value(pb, k) - other.limb_value(pb, k) + carry;

        if (k + 1 == n) {
            enforce_equal_lc(pb, diff, lc_type(FieldT::zero()), "carry_final");
            break;
        }

        mpz_class shifted;
        mpz_fdiv_q_2exp(shifted.get_mpz_t(), d.get_mpz_t(), W);
        shifted += offset;
        mpz_fdiv_r_2exp(shifted.get_mpz_t(), shifted.get_mpz_t(), carry_bits);

        const auto s = allocate_variable(pb, field_from_mpz<FieldT>(shifted), "carry");
        decompose_bits(pb, libsnark::pb_linear_combination<FieldT>(s), carry_bits, "carry");

        const lc_type carry_out = lc_type(s) - lc_type(offset_f);
        enforce_equal_lc(pb, diff, carry_out * shift, "carry");

        carry_in = carry_out;
        carry = shifted - offset;
    }
}

/************************************************************
 * Reduction with a prover-supplied quotient and remainder.
 *
 * The quotient gets the dividend's bound, the remainder `bound`
 * bits. A zero modulus only occurs for placeholder instances;
 * q = r = 0 is assigned and the system is left unsatisfied.
 ************************************************************/
template <typename FieldT, size_t W>
biguint_var<FieldT, W>
unnormalized_biguint_var<FieldT, W>::rem(pb_type& pb, const biguint_t& modulus, size_t bound) const {
    if (bound == 0) {
        throw structural_error("remainder bound must be positive");
    }

    mpz_class dividend = 0;
    for (size_t i = limbs_.size(); i-- > 0;) {
        dividend <<= W;
        dividend += limb_value(pb, i);
    }

    mpz_class q = 0, r = 0;
    if (modulus.value() != 0) {
        mpz_fdiv_qr(q.get_mpz_t(), r.get_mpz_t(), dividend.get_mpz_t(), modulus.value().get_mpz_t());
    }

    auto q_var = biguint_t::allocate(pb, q, bound_, var_kind::witness);
    auto r_var = biguint_t::allocate(pb, r, bound, var_kind::witness);

    enforce_divmod(pb, modulus, q_var, r_var);
    return r_var;
}

/// dividend = q * modulus + r as a carried identity, then r < modulus
template <typename FieldT, size_t W>
void unnormalized_biguint_var<FieldT, W>::enforce_divmod(pb_type& pb,
                                                         const biguint_t& modulus,
                                                         const biguint_t& quotient,
                                                         const biguint_t& remainder) const
{
    const auto rhs = quotient.mul_no_carry(pb, modulus).add_no_carry(remainder.to_unnormalized());
    enforce_equal_when_carried(pb, rhs);
    remainder.enforce_lt(pb, modulus);
}

template <typename FieldT, size_t W>
biguint_var<FieldT, W>
biguint_var<FieldT, W>::rem(pb_type& pb, const biguint_var& modulus, size_t bound) const {
    return to_unnormalized().rem(pb, modulus, bound);
}

/// a < b via a + d + 1 = b with d range checked
template <typename FieldT, size_t W>
void biguint_var<FieldT, W>::enforce_lt(pb_type& pb, const biguint_var& other) const {
    const size_t width = std::max(bound_, other.bound_);
    const mpz_class gap = other.value_ - value_ - 1;

    const auto d = allocate(pb, gap, width, var_kind::witness);
    const auto lhs = to_unnormalized()
        .add_no_carry(d.to_unnormalized())
        .add_no_carry(constant(pb, 1, 1).to_unnormalized());

    lhs.enforce_equal_when_carried(pb, other.to_unnormalized());
}

template <typename FieldT, size_t W>
void biguint_var<FieldT, W>::enforce_equal(pb_type& pb, const biguint_var& other) const {
    if (limbs_.size() != other.limbs_.size()) {
        throw structural_error("aligned equality between " + std::to_string(limbs_.size())
                               + " and " + std::to_string(other.limbs_.size()) + " limbs");
    }

    for (size_t i = 0; i < limbs_.size(); i++) {
        enforce_equal_lc<FieldT>(pb, limbs_[i], other.limbs_[i], "limb_eq");
    }
}

/************************************************************
 * Equality of two normalized values regardless of their limb
 * counts. Limbs are packed positionally into chunks that stay
 * below the field characteristic and the chunks are equated;
 * limbs one side lacks count as zero.
 ************************************************************/
template <typename FieldT, size_t W>
void biguint_var<FieldT, W>::enforce_equal_unaligned(pb_type& pb, const biguint_var& other) const {
    const size_t chunk = (FieldT::capacity() - 1) / W;
    if (chunk == 0) {
        throw structural_error("limb width " + std::to_string(W) + " does not fit the field");
    }

    const FieldT shift = field_from_mpz<FieldT>(mpz_pow2(W));
    const size_t n = std::max(limbs_.size(), other.limbs_.size());

    for (size_t start = 0; start < n; start += chunk) {
        libsnark::linear_combination<FieldT> lhs, rhs;
        FieldT coeff = FieldT::one();
        for (size_t i = start; i < std::min(start + chunk, n); i++) {
            if (i < limbs_.size())       append_scaled(lhs, limbs_[i], coeff);
            if (i < other.limbs_.size()) append_scaled(rhs, other.limbs_[i], coeff);
            coeff *= shift;
        }
        enforce_equal_lc(pb, lhs, rhs, "chunk_eq");
    }
}

/// Fresh limbs r_i with bit * (a_i - b_i) = r_i - b_i. `bit` must be boolean.
template <typename FieldT, size_t W>
biguint_var<FieldT, W>
biguint_var<FieldT, W>::select(pb_type& pb, const lc_type& bit, const biguint_var& a, const biguint_var& b) {
    if (a.limbs_.size() != b.limbs_.size()) {
        throw structural_error("selection between " + std::to_string(a.limbs_.size())
                               + " and " + std::to_string(b.limbs_.size()) + " limbs");
    }

    const bool take_a = lc_value(pb, bit) == FieldT::one();

    biguint_var out;
    out.bound_ = std::max(a.bound_, b.bound_);
    out.kind_  = var_kind::witness;
    out.value_ = take_a ? a.value_ : b.value_;

    out.limbs_.reserve(a.limbs_.size());
    for (size_t i = 0; i < a.limbs_.size(); i++) {
        const FieldT v = lc_value(pb, take_a ? a.limbs_[i] : b.limbs_[i]);
        const lc_type r(allocate_variable(pb, v, "select"));
        pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(bit, a.limbs_[i] - b.limbs_[i], r - b.limbs_[i]),
                               "select");
        out.limbs_.push_back(r);
    }
    return out;
}

/************************************************************
 * base^e mod modulus by square-and-multiply.
 *
 * `exp_bits` is little-endian and must be boolean; it is walked
 * from the most significant end. The accumulator starts at the
 * constant one and both the square and the product are reduced
 * to `bound` bits before the selector picks one.
 ************************************************************/
template <typename FieldT, size_t W>
biguint_var<FieldT, W>
biguint_var<FieldT, W>::powm(pb_type& pb,
                             const bits_type& exp_bits,
                             const biguint_var& modulus,
                             size_t bound) const
{
    if (exp_bits.empty()) {
        throw structural_error("exponent has no bits");
    }
    if (bound_ > modulus.bound_) {
        throw structural_error("base of " + std::to_string(bound_)
                               + " bits is wider than the modulus of "
                               + std::to_string(modulus.bound_) + " bits");
    }

    const size_t before = pb.num_constraints();

    biguint_var acc = constant(pb, 1, bound);
    for (auto it = exp_bits.rbegin(); it != exp_bits.rend(); ++it) {
        auto sq  = acc.mul_no_carry(pb, acc).rem(pb, modulus, bound);
        auto mul = sq.mul_no_carry(pb, *this).rem(pb, modulus, bound);
        acc = select(pb, *it, mul, sq);
    }

    ZKPAILLIER_LOG_DEBUG << "powm over " << exp_bits.size() << " exponent bits: "
                         << pb.num_constraints() - before << " constraints";
    return acc;
}

}  // namespace zkpaillier::gadget
