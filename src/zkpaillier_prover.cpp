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

#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <string>

#include <zkpaillier/crypto/paillier.hpp>
#include <zkpaillier/groth16/harness.hpp>
#include <zkpaillier/groth16/serialize.hpp>
#include <zkpaillier/util/csprng.hpp>
#include <zkpaillier/util/log.hpp>
#include <zkpaillier/util/mpz_field.hpp>
#include <zkpaillier/util/timer.hpp>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

using namespace zkpaillier;

int main(int argc, const char *argv[]) {
    const std::string version_string =
        std::format("zkpaillier-prover v{}.{}.{}",
                    ZKPAILLIER_VERSION_MAJOR,
                    ZKPAILLIER_VERSION_MINOR,
                    ZKPAILLIER_VERSION_PATCH);
    std::cout << version_string << std::endl;

    if (argc < 2) {
        std::cerr << "Error: No JSON input provided" << std::endl;
        exit(EXIT_FAILURE);
    }

    size_t bits = 1024;
    std::string pk_name = "proving_key.gz";
    std::string proof_name = "proof.gz";
    mpz_class p, q;
    std::optional<mpz_class> m, r;

    try {
        json jconfig = json::parse(std::string_view(argv[1]));

        if (jconfig.contains("bits")) {
            bits = jconfig["bits"].template get<size_t>();
        }
        if (jconfig.contains("proving-key")) {
            pk_name = jconfig["proving-key"].template get<std::string>();
        }
        if (jconfig.contains("proof")) {
            proof_name = jconfig["proof"].template get<std::string>();
        }
        if (jconfig.contains("log-level")) {
            set_logging_level(parse_log_level(jconfig["log-level"].template get<std::string>()));
        }

        if (!jconfig.contains("p") || !jconfig.contains("q")) {
            std::cerr << "Error: the factors \"p\" and \"q\" are required" << std::endl;
            exit(EXIT_FAILURE);
        }
        p = mpz_from_hex(jconfig["p"].template get<std::string>());
        q = mpz_from_hex(jconfig["q"].template get<std::string>());

        if (jconfig.contains("m")) {
            m = mpz_from_hex(jconfig["m"].template get<std::string>());
        }
        if (jconfig.contains("r")) {
            r = mpz_from_hex(jconfig["r"].template get<std::string>());
        }
    }
    catch (const json::exception& e) {
        std::cerr << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    const mpz_class n = p * q;
    if (mpz_bit_length(n) > bits) {
        std::cerr << std::format("Error: p * q has {} bits, the keys are for {} bits",
                                 mpz_bit_length(n), bits)
                  << std::endl;
        exit(EXIT_FAILURE);
    }

    try {
        groth16::init_public_params();

        auto engine = mpz_random_engine::from_device();
        if (!m) {
            m = crypto::paillier_sample_below(n, *engine);
        }
        if (!r) {
            mpz_class g;
            do {
                r = crypto::paillier_sample_below(n, *engine);
                mpz_gcd(g.get_mpz_t(), r->get_mpz_t(), n.get_mpz_t());
            } while (g != 1);
        }

        if (*m >= n || *r >= n) {
            std::cerr << "Error: m and r must both be below n" << std::endl;
            exit(EXIT_FAILURE);
        }

        const auto pub = crypto::paillier_public_key::from_modulus(n, bits);

        groth16::relation<groth16::default_pp> rel;
        rel.bits = bits;
        rel.m = *m;
        rel.p = p;
        rel.q = q;
        rel.r = *r;
        rel.c = crypto::paillier_encrypt(pub, *m, *r);

        const auto pk = groth16::load<groth16::proving_key<groth16::default_pp>>(pk_name);
        const auto pi = groth16::prove(pk, rel);
        groth16::save(proof_name, pi);

        std::cout << "n: " << mpz_to_hex(n) << std::endl
                  << "c: " << mpz_to_hex(rel.c) << std::endl
                  << "Proof written to: " << proof_name << std::endl;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    show_timer();
    return 0;
}
