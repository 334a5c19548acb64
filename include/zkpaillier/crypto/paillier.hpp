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

#include <zkpaillier/util/csprng.hpp>

namespace zkpaillier::crypto {

struct paillier_public_key {
    size_t bits = 0;
    mpz_class n;
    mpz_class n_squared;
    mpz_class n_plusone;

    /// Derive n^2 and g = n + 1 from a modulus of `bits` bits
    static paillier_public_key from_modulus(const mpz_class& n, size_t bits);
};

struct paillier_private_key {
    mpz_class p;
    mpz_class q;
};

struct paillier_keypair {
    paillier_public_key pub;
    paillier_private_key priv;
};

/// Random prime of exactly `bits` bits with the top two bits set
mpz_class random_prime(size_t bits, mpz_random_engine& engine);

/// Distinct primes p, q of bits/2 bits each with n = p q of exactly
/// `bits` bits. `bits` must be even and at least 16.
paillier_keypair paillier_keygen(size_t bits, mpz_random_engine& engine);

/// Uniform sample from [0, n)
mpz_class paillier_sample_below(const mpz_class& n, mpz_random_engine& engine);

/// g^m r^n mod n^2
mpz_class paillier_encrypt(const paillier_public_key& pub, const mpz_class& m, const mpz_class& r);

}  // namespace zkpaillier::crypto
