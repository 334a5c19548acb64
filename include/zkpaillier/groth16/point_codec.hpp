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

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include <gmpxx.h>

#include <boost/serialization/string.hpp>

#include <libff/algebra/fields/fp.hpp>
#include <libff/algebra/fields/fp2.hpp>
#include <libff/algebra/fields/fp6_3over2.hpp>
#include <libff/algebra/fields/fp12_2over3over2.hpp>

#include <zkpaillier/error.hpp>
#include <zkpaillier/util/mpz_field.hpp>

/// @file point_codec.hpp
/// @brief Affine, uncompressed encoding of field elements and curve points
///        for Boost archives. Decoding never takes a square root: both
///        coordinates are read, and the point must lie on the curve and
///        in the prime-order subgroup.

namespace zkpaillier::groth16::codec {

// ------------------------------------------------------------------------------
// Field elements
// ------------------------------------------------------------------------------

template <typename Archive, mp_size_t n, const libff::bigint<n>& modulus>
void write_field(Archive& ar, const libff::Fp_model<n, modulus>& x) {
    const std::string hex = mpz_from_field(x).get_str(16);
    ar << hex;
}

/// Canonical representatives only: values >= p are rejected
template <typename Archive, mp_size_t n, const libff::bigint<n>& modulus>
void read_field(Archive& ar, libff::Fp_model<n, modulus>& x) {
    using field_t = libff::Fp_model<n, modulus>;

    std::string hex;
    ar >> hex;

    mpz_class v;
    if (hex.empty() || v.set_str(hex, 16) != 0 || v < 0 || v >= field_modulus<field_t>()) {
        throw deserialization_error("field element is not a canonical residue");
    }
    x = field_from_mpz<field_t>(v);
}

template <typename Archive, mp_size_t n, const libff::bigint<n>& modulus>
void write_field(Archive& ar, const libff::Fp2_model<n, modulus>& x) {
    write_field(ar, x.c0);
    write_field(ar, x.c1);
}

template <typename Archive, mp_size_t n, const libff::bigint<n>& modulus>
void read_field(Archive& ar, libff::Fp2_model<n, modulus>& x) {
    read_field(ar, x.c0);
    read_field(ar, x.c1);
}

template <typename Archive, mp_size_t n, const libff::bigint<n>& modulus>
void write_field(Archive& ar, const libff::Fp6_3over2_model<n, modulus>& x) {
    write_field(ar, x.c0);
    write_field(ar, x.c1);
    write_field(ar, x.c2);
}

template <typename Archive, mp_size_t n, const libff::bigint<n>& modulus>
void read_field(Archive& ar, libff::Fp6_3over2_model<n, modulus>& x) {
    read_field(ar, x.c0);
    read_field(ar, x.c1);
    read_field(ar, x.c2);
}

template <typename Archive, mp_size_t n, const libff::bigint<n>& modulus>
void write_field(Archive& ar, const libff::Fp12_2over3over2_model<n, modulus>& x) {
    write_field(ar, x.c0);
    write_field(ar, x.c1);
}

template <typename Archive, mp_size_t n, const libff::bigint<n>& modulus>
void read_field(Archive& ar, libff::Fp12_2over3over2_model<n, modulus>& x) {
    read_field(ar, x.c0);
    read_field(ar, x.c1);
}

// ------------------------------------------------------------------------------
// Curve points
// ------------------------------------------------------------------------------

/// Coordinate field of a libff group in Jacobian form
template <typename G>
using coordinate_t = std::remove_cvref_t<decltype(std::declval<G&>().X)>;

/// One flag byte, then the affine x and y unless the point is zero
template <typename Archive, typename G>
void write_point(Archive& ar, const G& p) {
    G affine(p);
    affine.to_affine_coordinates();

    const uint8_t is_zero = affine.is_zero() ? 1 : 0;
    ar << is_zero;
    if (!is_zero) {
        write_field(ar, affine.X);
        write_field(ar, affine.Y);
    }
}

template <typename G, typename Archive>
G read_point(Archive& ar) {
    uint8_t is_zero = 0;
    ar >> is_zero;
    if (is_zero > 1) {
        throw deserialization_error("bad point flag " + std::to_string(is_zero));
    }
    if (is_zero) {
        return G::zero();
    }

    coordinate_t<G> x, y;
    read_field(ar, x);
    read_field(ar, y);

    G p(x, y, coordinate_t<G>::one());
    if (!p.is_well_formed()) {
        throw deserialization_error("point is not on the curve");
    }
    if (!(G::order() * p).is_zero()) {
        throw deserialization_error("point is outside the prime-order subgroup");
    }
    return p;
}

}  // namespace zkpaillier::groth16::codec
