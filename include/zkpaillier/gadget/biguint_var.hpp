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
#include <string>
#include <vector>

#include <gmpxx.h>

#include <libsnark/gadgetlib1/protoboard.hpp>

#include <zkpaillier/error.hpp>
#include <zkpaillier/gadget/limb.hpp>
#include <zkpaillier/util/mpz_field.hpp>

namespace zkpaillier::gadget {

enum class var_kind : unsigned char {
    witness,
    input,
    constant
};

template <typename FieldT, size_t W>
class unnormalized_biguint_var;

/************************************************************
 * Non-negative integer of at most `bound` bits, represented as
 * ceil(bound / W) little-endian base-2^W limbs.
 *
 * Every limb is range checked: limb i < 2^W, and the top limb
 * is limited to the bits left over by `bound`, so the value is
 * below 2^bound whenever the system is satisfied.
 *
 * Witness limbs are checked at allocation. Public limbs are
 * allocated bare so that every public input precedes the first
 * witness on the protoboard; their range checks are added by
 * enforce_range (or to_bits_le) once all inputs exist.
 ************************************************************/
template <typename FieldT, size_t W = 32>
class biguint_var {
    static_assert(W > 0, "limb width must be positive");

    friend class unnormalized_biguint_var<FieldT, W>;

public:
    using pb_type           = libsnark::protoboard<FieldT>;
    using lc_type           = libsnark::pb_linear_combination<FieldT>;
    using bits_type         = libsnark::pb_linear_combination_array<FieldT>;
    using unnormalized_type = unnormalized_biguint_var<FieldT, W>;

    static constexpr size_t limb_bits = W;

    biguint_var() = default;

    /// Allocate a private value. Throws structural_error if `value` does
    /// not fit in `bound` bits.
    static biguint_var new_witness(pb_type& pb, const mpz_class& value, size_t bound) {
        check_fits(value, bound);
        return allocate(pb, value, bound, var_kind::witness);
    }

    /// Allocate a public value, one primary input per limb. Every variable
    /// already on `pb` must be a primary input.
    static biguint_var new_input(pb_type& pb, const mpz_class& value, size_t bound) {
        check_fits(value, bound);
        if (pb.num_inputs() != pb.num_variables()) {
            throw structural_error("public inputs must be allocated before any witness");
        }

        auto out = allocate(pb, value, bound, var_kind::input);
        pb.set_input_sizes(pb.num_variables());
        return out;
    }

    /// Constant value without variables or constraints
    static biguint_var constant(pb_type& pb, const mpz_class& value, size_t bound) {
        check_fits(value, bound);

        biguint_var out;
        out.bound_ = bound;
        out.value_ = value;
        out.kind_  = var_kind::constant;
        for (size_t i = 0; i < num_limbs_for(bound); i++) {
            const auto limb = mpz_bit_slice(value, i * W, limb_width(bound, i));
            out.limbs_.push_back(assign_lc(pb, libsnark::linear_combination<FieldT>(field_from_mpz<FieldT>(limb))));
        }
        for (size_t i = 0; i < bound; i++) {
            const bool bit = mpz_tstbit(value.get_mpz_t(), i);
            out.bits_.push_back(assign_lc(pb, libsnark::linear_combination<FieldT>(bit ? FieldT::one() : FieldT::zero())));
        }
        return out;
    }

    /// Reassemble a value from little-endian bits that are already boolean
    static biguint_var from_bits_le(pb_type& pb, const bits_type& bits) {
        if (bits.empty()) {
            throw structural_error("cannot build an integer from zero bits");
        }

        biguint_var out;
        out.bound_ = bits.size();
        out.bits_  = bits;
        out.kind_  = var_kind::witness;

        const size_t n = num_limbs_for(out.bound_);
        for (size_t i = 0; i < n; i++) {
            const auto first = bits.begin() + i * W;
            const auto last  = bits.begin() + i * W + limb_width(out.bound_, i);
            out.limbs_.push_back(assign_lc(pb, libsnark::pb_packing_sum<FieldT>(bits_type(first, last))));
        }

        for (size_t i = 0; i < bits.size(); i++) {
            if (lc_value(pb, bits[i]) == FieldT::one())
                mpz_setbit(out.value_.get_mpz_t(), i);
        }
        return out;
    }

    /// Field elements a verifier supplies for a value allocated by new_input
    static std::vector<FieldT> inputize(const mpz_class& value, size_t bound) {
        check_fits(value, bound);

        std::vector<FieldT> out;
        out.reserve(num_limbs_for(bound));
        for (size_t i = 0; i < num_limbs_for(bound); i++) {
            out.push_back(field_from_mpz<FieldT>(mpz_bit_slice(value, i * W, limb_width(bound, i))));
        }
        return out;
    }

    /// Little-endian bits spanning every limb, exactly `bound()` of them.
    /// Values built without bits are decomposed once and the bits kept.
    const bits_type& to_bits_le(pb_type& pb) {
        if (bits_.empty()) {
            for (size_t i = 0; i < limbs_.size(); i++) {
                auto decomposed = decompose_bits(pb, limbs_[i], limb_width(bound_, i), "limb");
                bits_.insert(bits_.end(), decomposed.begin(), decomposed.end());
            }
        }
        return bits_;
    }

    /// Range check limbs that were allocated without one
    void enforce_range(pb_type& pb) {
        to_bits_le(pb);
    }

    const std::vector<lc_type>& limbs() const noexcept { return limbs_; }
    size_t num_limbs() const noexcept { return limbs_.size(); }
    size_t bound()     const noexcept { return bound_; }
    var_kind kind()    const noexcept { return kind_; }

    /// Native value assigned by the prover
    const mpz_class& value() const noexcept { return value_; }

    /// View as an unnormalized value with limbs below 2^W
    unnormalized_type to_unnormalized() const;

    unnormalized_type mul_no_carry(pb_type& pb, const biguint_var& other) const;

    biguint_var rem(pb_type& pb, const biguint_var& modulus, size_t bound) const;

    biguint_var powm(pb_type& pb,
                     const bits_type& exp_bits,
                     const biguint_var& modulus,
                     size_t bound) const;

    void enforce_lt(pb_type& pb, const biguint_var& other) const;

    void enforce_equal(pb_type& pb, const biguint_var& other) const;

    void enforce_equal_unaligned(pb_type& pb, const biguint_var& other) const;

    /// bit ? a : b, limb by limb
    static biguint_var select(pb_type& pb,
                              const lc_type& bit,
                              const biguint_var& a,
                              const biguint_var& b);

    static constexpr size_t num_limbs_for(size_t bound) noexcept {
        return (bound + W - 1) / W;
    }

    static constexpr size_t limb_width(size_t bound, size_t i) noexcept {
        return (bound - i * W) < W ? bound - i * W : W;
    }

private:
    static void check_fits(const mpz_class& value, size_t bound) {
        if (bound == 0) {
            throw structural_error("bit bound must be positive");
        }
        if (value < 0 || mpz_bit_length(value) > bound) {
            throw structural_error("value does not fit in "
                                   + std::to_string(bound) + " bits");
        }
    }

    /// Allocate limbs from the low `bound` bits of `value`. Prover-computed
    /// witnesses go through here unchecked: an out-of-range value is
    /// wrapped and the system is left unsatisfied instead of throwing.
    /// Witness limbs are range checked here, input limbs later.
    static biguint_var allocate(pb_type& pb, const mpz_class& value, size_t bound, var_kind kind) {
        if (bound == 0) {
            throw structural_error("bit bound must be positive");
        }

        biguint_var out;
        out.bound_ = bound;
        out.kind_  = kind;
        mpz_fdiv_r_2exp(out.value_.get_mpz_t(), value.get_mpz_t(), bound);

        const size_t n = num_limbs_for(bound);
        const char* annotation = kind == var_kind::input ? "input_limb" : "witness_limb";
        out.limbs_.reserve(n);
        for (size_t i = 0; i < n; i++) {
            const auto limb = mpz_bit_slice(out.value_, i * W, limb_width(bound, i));
            out.limbs_.emplace_back(allocate_variable(pb, field_from_mpz<FieldT>(limb), annotation));
        }

        if (kind == var_kind::witness) {
            out.enforce_range(pb);
        }
        return out;
    }

    std::vector<lc_type> limbs_;
    bits_type bits_;
    size_t bound_ = 0;
    mpz_class value_;
    var_kind kind_ = var_kind::constant;
};


/************************************************************
 * Integer whose limbs may exceed 2^W, as produced by products
 * and sums before carries are resolved.
 *
 * `limb_max` bounds every limb and `bound` bounds the value in
 * bits. Only reduction and carried equality consume it.
 ************************************************************/
template <typename FieldT, size_t W = 32>
class unnormalized_biguint_var {
public:
    using pb_type   = libsnark::protoboard<FieldT>;
    using lc_type   = libsnark::linear_combination<FieldT>;
    using biguint_t = biguint_var<FieldT, W>;

    unnormalized_biguint_var(std::vector<lc_type> limbs,
                             mpz_class limb_max,
                             size_t bound,
                             mpz_class value)
        : limbs_(std::move(limbs)),
          limb_max_(std::move(limb_max)),
          bound_(bound),
          value_(std::move(value))
        { }

    const std::vector<lc_type>& limbs() const noexcept { return limbs_; }
    size_t num_limbs()          const noexcept { return limbs_.size(); }
    const mpz_class& limb_max() const noexcept { return limb_max_; }
    size_t bound()              const noexcept { return bound_; }
    const mpz_class& value()    const noexcept { return value_; }

    /// Limb-wise sum, no constraints
    unnormalized_biguint_var add_no_carry(const unnormalized_biguint_var& other) const;

    /// Reduce modulo `modulus` into a normalized value of `bound` bits
    biguint_t rem(pb_type& pb, const biguint_t& modulus, size_t bound) const;

    /// Enforce this = quotient * modulus + remainder and remainder < modulus
    void enforce_divmod(pb_type& pb,
                        const biguint_t& modulus,
                        const biguint_t& quotient,
                        const biguint_t& remainder) const;

    /// Enforce that both sides denote the same integer
    void enforce_equal_when_carried(pb_type& pb, const unnormalized_biguint_var& other) const;

private:
    mpz_class limb_value(const pb_type& pb, size_t i) const {
        return i < limbs_.size() ? mpz_from_field(lc_value(pb, limbs_[i])) : mpz_class(0);
    }

    std::vector<lc_type> limbs_;
    mpz_class limb_max_;
    size_t bound_;
    mpz_class value_;
};

}  // namespace zkpaillier::gadget

#include <zkpaillier/gadget/biguint_var_impl.hpp>
