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

#include <stdexcept>
#include <string>

#include <zkpaillier/crypto/paillier.hpp>
#include <zkpaillier/util/log.hpp>
#include <zkpaillier/util/mpz_field.hpp>

namespace zkpaillier::crypto {

paillier_public_key paillier_public_key::from_modulus(const mpz_class& n, size_t bits) {
    if (n <= 1 || mpz_bit_length(n) > bits) {
        throw std::invalid_argument("Paillier modulus does not fit in "
                                    + std::to_string(bits) + " bits");
    }

    paillier_public_key pub;
    pub.bits      = bits;
    pub.n         = n;
    pub.n_squared = n * n;
    pub.n_plusone = n + 1;
    return pub;
}

mpz_class random_prime(size_t bits, mpz_random_engine& engine) {
    if (bits < 8) {
        throw std::invalid_argument("primes need at least 8 bits");
    }

    mpz_class p;
    do {
        engine.random_bits(p, bits);
        mpz_setbit(p.get_mpz_t(), bits - 1);
        mpz_setbit(p.get_mpz_t(), bits - 2);
        mpz_nextprime(p.get_mpz_t(), p.get_mpz_t());
    } while (mpz_bit_length(p) != bits);

    return p;
}

paillier_keypair paillier_keygen(size_t bits, mpz_random_engine& engine) {
    if (bits < 16 || bits % 2 != 0) {
        throw std::invalid_argument("Paillier modulus size must be even and at least 16, got "
                                    + std::to_string(bits));
    }

    mpz_class p, q, n;
    do {
        p = random_prime(bits / 2, engine);
        do {
            q = random_prime(bits / 2, engine);
        } while (p == q);

        n = p * q;
    } while (mpz_bit_length(n) != bits);

    ZKPAILLIER_LOG_DEBUG << "generated " << bits << "-bit Paillier modulus";

    paillier_keypair kp;
    kp.pub = paillier_public_key::from_modulus(n, bits);
    kp.priv.p = p;
    kp.priv.q = q;
    return kp;
}

mpz_class paillier_sample_below(const mpz_class& n, mpz_random_engine& engine) {
    mpz_class out;
    engine.random_below(out, n);
    return out;
}

mpz_class paillier_encrypt(const paillier_public_key& pub, const mpz_class& m, const mpz_class& r) {
    mpz_class gm, rn, c;
    mpz_powm(gm.get_mpz_t(), pub.n_plusone.get_mpz_t(), m.get_mpz_t(), pub.n_squared.get_mpz_t());
    mpz_powm(rn.get_mpz_t(), r.get_mpz_t(), pub.n.get_mpz_t(), pub.n_squared.get_mpz_t());

    c = gm * rn;
    mpz_mod(c.get_mpz_t(), c.get_mpz_t(), pub.n_squared.get_mpz_t());
    return c;
}

}  // namespace zkpaillier::crypto
