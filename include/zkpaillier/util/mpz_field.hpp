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

#include <stdexcept>
#include <string>
#include <string_view>

#include <gmp.h>
#include <gmpxx.h>

#include <libff/algebra/fields/bigint.hpp>

/// @file mpz_field.hpp
/// @brief Conversions between GMP integers and libff prime-field elements

namespace zkpaillier {

/// Extract bits [offset, offset + width) of a non-negative integer
inline mpz_class mpz_bit_slice(const mpz_class& val, size_t offset, size_t width) {
    mpz_class out;
    mpz_fdiv_q_2exp(out.get_mpz_t(), val.get_mpz_t(), offset);
    mpz_fdiv_r_2exp(out.get_mpz_t(), out.get_mpz_t(), width);
    return out;
}

/// 2^bits as an mpz_class
inline mpz_class mpz_pow2(size_t bits) {
    mpz_class out;
    mpz_ui_pow_ui(out.get_mpz_t(), 2, bits);
    return out;
}

/// Number of significant bits, zero for zero
inline size_t mpz_bit_length(const mpz_class& val) {
    return val == 0 ? 0 : mpz_sizeinbase(val.get_mpz_t(), 2);
}

/// Parse a hexadecimal string with an optional "0x" prefix
inline mpz_class mpz_from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }

    mpz_class out;
    if (hex.empty() || out.set_str(std::string(hex), 16) != 0) {
        throw std::invalid_argument("invalid hexadecimal integer: " + std::string(hex));
    }
    return out;
}

inline std::string mpz_to_hex(const mpz_class& val) {
    return "0x" + val.get_str(16);
}

/// Characteristic of the field as an mpz_class
template <typename FieldT>
mpz_class field_modulus() {
    mpz_class out;
    FieldT::field_char().to_mpz(out.get_mpz_t());
    return out;
}

/// Canonical integer representative in [0, p)
template <typename FieldT>
mpz_class mpz_from_field(const FieldT& x) {
    mpz_class out;
    x.as_bigint().to_mpz(out.get_mpz_t());
    return out;
}

/// Map an integer (possibly negative or larger than p) into the field.
/// Throws std::logic_error until the curve parameters are initialized.
template <typename FieldT>
FieldT field_from_mpz(const mpz_class& val) {
    const mpz_class p = field_modulus<FieldT>();
    if (p == 0) {
        throw std::logic_error("field parameters are not initialized");
    }

    mpz_class reduced;
    mpz_mod(reduced.get_mpz_t(), val.get_mpz_t(), p.get_mpz_t());
    return FieldT(libff::bigint<FieldT::num_limbs>(reduced.get_mpz_t()));
}

}  // namespace zkpaillier
