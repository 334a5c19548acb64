// tests/fixture.hpp
#pragma once

#include <memory>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

#include <zkpaillier/groth16/harness.hpp>
#include <zkpaillier/util/csprng.hpp>
#include <zkpaillier/util/log.hpp>

using Fr   = libff::alt_bn128_Fr;
using pb_t = libsnark::protoboard<Fr>;

/// Curve parameters must be set before any field arithmetic
struct curve_fixture {
    curve_fixture() {
        zkpaillier::groth16::init_public_params();
        zkpaillier::set_logging_level(zkpaillier::log_level::info);
    }
};

/// Engine with a fixed key so every run sees the same values
inline std::unique_ptr<zkpaillier::mpz_random_engine> make_test_engine(unsigned char seed = 0x5a) {
    unsigned char key[zkpaillier::mpz_random_engine::key_size];
    unsigned char iv[zkpaillier::mpz_random_engine::block_size] = { 0 };
    for (size_t i = 0; i < sizeof(key); i++) {
        key[i] = static_cast<unsigned char>(seed + i);
    }
    return std::make_unique<zkpaillier::mpz_random_engine>(key, iv);
}

/// Satisfaction of the exported system on the exported assignment
inline bool exported_satisfied(const pb_t& pb) {
    return pb.get_constraint_system().is_satisfied(pb.primary_input(), pb.auxiliary_input());
}

/// Position of a single-variable combination inside auxiliary_input()
inline size_t aux_index(const pb_t& pb, const libsnark::linear_combination<Fr>& lc) {
    return lc.terms.front().index - 1 - pb.num_inputs();
}
