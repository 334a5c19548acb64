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
#include <string>

#include <zkpaillier/error.hpp>
#include <zkpaillier/groth16/harness.hpp>
#include <zkpaillier/groth16/serialize.hpp>
#include <zkpaillier/util/log.hpp>
#include <zkpaillier/util/mpz_field.hpp>
#include <zkpaillier/util/timer.hpp>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

using namespace zkpaillier;

constexpr int exit_rejected = 1;
constexpr int exit_bad_input = 2;

int main(int argc, const char *argv[]) {
    const std::string version_string =
        std::format("zkpaillier-verifier v{}.{}.{}",
                    ZKPAILLIER_VERSION_MAJOR,
                    ZKPAILLIER_VERSION_MINOR,
                    ZKPAILLIER_VERSION_PATCH);
    std::cout << version_string << std::endl;

    if (argc < 2) {
        std::cerr << "Error: No JSON input provided" << std::endl;
        exit(exit_bad_input);
    }

    size_t bits = 1024;
    std::string vk_name = "verifying_key.gz";
    std::string proof_name = "proof.gz";
    mpz_class n, c;

    try {
        json jconfig = json::parse(std::string_view(argv[1]));

        if (jconfig.contains("bits")) {
            bits = jconfig["bits"].template get<size_t>();
        }
        if (jconfig.contains("verifying-key")) {
            vk_name = jconfig["verifying-key"].template get<std::string>();
        }
        if (jconfig.contains("proof")) {
            proof_name = jconfig["proof"].template get<std::string>();
        }
        if (jconfig.contains("log-level")) {
            set_logging_level(parse_log_level(jconfig["log-level"].template get<std::string>()));
        }

        if (!jconfig.contains("n") || !jconfig.contains("c")) {
            std::cerr << "Error: the public values \"n\" and \"c\" are required" << std::endl;
            exit(exit_bad_input);
        }
        n = mpz_from_hex(jconfig["n"].template get<std::string>());
        c = mpz_from_hex(jconfig["c"].template get<std::string>());
    }
    catch (const json::exception& e) {
        std::cerr << e.what() << std::endl;
        exit(exit_bad_input);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit(exit_bad_input);
    }

    bool verify_result = false;
    try {
        groth16::init_public_params();

        const auto vk = groth16::load<groth16::verification_key<groth16::default_pp>>(vk_name);
        const auto pi = groth16::load<groth16::proof<groth16::default_pp>>(proof_name);
        const auto inputs = groth16::public_inputs(n, c, bits);

        verify_result = groth16::verify(vk, inputs, pi);
    }
    catch (const deserialization_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit(exit_bad_input);
    }
    catch (const structural_error& e) {
        // n or c wider than the key's modulus size
        std::cerr << "Error: " << e.what() << std::endl;
        exit(exit_bad_input);
    }

    std::cout << "-----------------------------------------" << std::endl
              << "Final Verify Result:                 " << verify_result << std::endl;

    show_timer();
    return verify_result ? EXIT_SUCCESS : exit_rejected;
}
