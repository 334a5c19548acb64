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

#include <zkpaillier/groth16/harness.hpp>
#include <zkpaillier/groth16/serialize.hpp>
#include <zkpaillier/util/log.hpp>
#include <zkpaillier/util/timer.hpp>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

using namespace zkpaillier;

int main(int argc, const char *argv[]) {
    const std::string version_string =
        std::format("zkpaillier-setup v{}.{}.{}",
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
    std::string vk_name = "verifying_key.gz";

    try {
        json jconfig = json::parse(std::string_view(argv[1]));

        if (jconfig.contains("bits")) {
            bits = jconfig["bits"].template get<size_t>();
        }
        if (jconfig.contains("proving-key")) {
            pk_name = jconfig["proving-key"].template get<std::string>();
        }
        if (jconfig.contains("verifying-key")) {
            vk_name = jconfig["verifying-key"].template get<std::string>();
        }
        if (jconfig.contains("log-level")) {
            set_logging_level(parse_log_level(jconfig["log-level"].template get<std::string>()));
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

    if (bits < 16 || bits % 2 != 0) {
        std::cerr << std::format("Error: modulus size must be even and at least 16, got {}", bits)
                  << std::endl;
        exit(EXIT_FAILURE);
    }

    std::cout << "bits: " << bits << std::endl;

    try {
        groth16::init_public_params();

        const auto keys = groth16::generate_parameters(bits);
        groth16::save(pk_name, keys.pk);
        groth16::save(vk_name, keys.vk);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    std::cout << "Proving key written to:    " << pk_name << std::endl
              << "Verifying key written to:  " << vk_name << std::endl;

    show_timer();
    return 0;
}
