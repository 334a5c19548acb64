// tests/circuit/test_paillier_relation.cpp
#define BOOST_TEST_MODULE Paillier_Relation_Tests
#include <boost/test/included/unit_test.hpp>
#include <gmpxx.h>
#include <zkpaillier/circuit/paillier_relation.hpp>
#include <zkpaillier/crypto/paillier.hpp>
#include <zkpaillier/error.hpp>
#include <zkpaillier/groth16/harness.hpp>

#include "../fixture.hpp"

using namespace zkpaillier;

using relation = circuit::paillier_relation<Fr>;

BOOST_TEST_GLOBAL_FIXTURE(curve_fixture);

namespace {

constexpr size_t test_bits = 32;

/// Honest instance with a fixed-key engine
relation make_instance(unsigned char seed = 0x5a) {
    auto engine = make_test_engine(seed);
    const auto kp = crypto::paillier_keygen(test_bits, *engine);

    relation rel;
    rel.bits = test_bits;
    rel.p = kp.priv.p;
    rel.q = kp.priv.q;
    rel.m = crypto::paillier_sample_below(kp.pub.n, *engine);
    rel.r = crypto::paillier_sample_below(kp.pub.n, *engine);
    rel.c = crypto::paillier_encrypt(kp.pub, rel.m, rel.r);
    return rel;
}

pb_t synthesize(const relation& rel) {
    pb_t pb;
    rel.generate_constraints(pb);
    return pb;
}

}  // namespace

// ============================================================================
// Test Suite: native Paillier
// ============================================================================

BOOST_AUTO_TEST_SUITE(Paillier_Native_Tests)

BOOST_AUTO_TEST_CASE(keygen_sizes) {
    auto engine = make_test_engine();
    for (size_t bits : { 16u, 32u, 64u, 256u }) {
        const auto kp = crypto::paillier_keygen(bits, *engine);

        BOOST_CHECK_EQUAL(mpz_bit_length(kp.pub.n), bits);
        BOOST_CHECK_EQUAL(mpz_bit_length(kp.priv.p), bits / 2);
        BOOST_CHECK_EQUAL(mpz_bit_length(kp.priv.q), bits / 2);
        BOOST_CHECK_NE(kp.priv.p, kp.priv.q);
        BOOST_CHECK_EQUAL(kp.pub.n, mpz_class(kp.priv.p * kp.priv.q));
        BOOST_CHECK_EQUAL(kp.pub.n_squared, mpz_class(kp.pub.n * kp.pub.n));
        BOOST_CHECK_EQUAL(kp.pub.n_plusone, mpz_class(kp.pub.n + 1));
        BOOST_CHECK(mpz_probab_prime_p(kp.priv.p.get_mpz_t(), 30) > 0);
        BOOST_CHECK(mpz_probab_prime_p(kp.priv.q.get_mpz_t(), 30) > 0);
    }
}

BOOST_AUTO_TEST_CASE(keygen_rejects_bad_sizes) {
    auto engine = make_test_engine();
    BOOST_CHECK_THROW(crypto::paillier_keygen(15, *engine), std::invalid_argument);
    BOOST_CHECK_THROW(crypto::paillier_keygen(8, *engine), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(encryption_is_additively_homomorphic) {
    auto engine = make_test_engine(0x77);
    const auto kp = crypto::paillier_keygen(64, *engine);
    const auto& pub = kp.pub;

    const mpz_class m1 = 1234, m2 = 4321;
    const mpz_class r1 = crypto::paillier_sample_below(pub.n, *engine);
    const mpz_class r2 = crypto::paillier_sample_below(pub.n, *engine);

    mpz_class product = crypto::paillier_encrypt(pub, m1, r1) * crypto::paillier_encrypt(pub, m2, r2);
    mpz_mod(product.get_mpz_t(), product.get_mpz_t(), pub.n_squared.get_mpz_t());

    mpz_class r12 = r1 * r2;
    mpz_mod(r12.get_mpz_t(), r12.get_mpz_t(), pub.n.get_mpz_t());
    BOOST_CHECK_EQUAL(product, crypto::paillier_encrypt(pub, m1 + m2, r12));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: relation circuit
// ============================================================================

BOOST_AUTO_TEST_SUITE(Relation_Tests)

BOOST_AUTO_TEST_CASE(honest_instance_is_satisfied) {
    for (unsigned char seed : { 0x01, 0x02, 0x03 }) {
        const auto pb = synthesize(make_instance(seed));
        BOOST_CHECK(pb.is_satisfied());
        BOOST_CHECK(exported_satisfied(pb));
    }
}

BOOST_AUTO_TEST_CASE(public_inputs_follow_allocation_order) {
    const auto rel = make_instance();
    const auto pb = synthesize(rel);

    const auto expected = groth16::public_inputs(rel.n(), rel.c, test_bits);
    const auto actual = pb.primary_input();

    // nn, g and c take two limbs each, n one
    BOOST_REQUIRE_EQUAL(actual.size(), 7u);
    BOOST_REQUIRE_EQUAL(expected.size(), actual.size());
    for (size_t i = 0; i < actual.size(); i++) {
        BOOST_CHECK(actual[i] == expected[i]);
    }
}

BOOST_AUTO_TEST_CASE(mutating_any_public_value_breaks_the_system) {
    const auto pb = synthesize(make_instance());
    const auto r1cs = pb.get_constraint_system();
    const auto aux = pb.auxiliary_input();

    for (size_t i = 0; i < pb.num_inputs(); i++) {
        auto primary = pb.primary_input();
        primary[i] += Fr::one();
        BOOST_CHECK_MESSAGE(!r1cs.is_satisfied(primary, aux),
                            "public input " << i << " was altered undetected");
    }
}

BOOST_AUTO_TEST_CASE(wrong_ciphertext_is_unsatisfied) {
    auto rel = make_instance();
    rel.c += 1;
    BOOST_CHECK(!synthesize(rel).is_satisfied());
}

BOOST_AUTO_TEST_CASE(consistent_alternative_public_values_are_rejected) {
    // c recomputed for a different plaintext, but the witness keeps the old m
    auto rel = make_instance();
    const auto pub = crypto::paillier_public_key::from_modulus(rel.n(), test_bits);
    rel.c = crypto::paillier_encrypt(pub, rel.m + 1, rel.r);
    BOOST_CHECK(!synthesize(rel).is_satisfied());
}

BOOST_AUTO_TEST_CASE(shape_depends_only_on_bits) {
    const auto honest = synthesize(make_instance());
    const auto placeholder = synthesize(relation::placeholder(test_bits));

    BOOST_CHECK_EQUAL(honest.num_constraints(), placeholder.num_constraints());
    BOOST_CHECK_EQUAL(honest.num_inputs(), placeholder.num_inputs());
    BOOST_CHECK_EQUAL(honest.num_variables(), placeholder.num_variables());
    BOOST_CHECK(!placeholder.is_satisfied());
}

BOOST_AUTO_TEST_CASE(oversized_values_are_structural) {
    auto rel = make_instance();
    rel.m = mpz_pow2(test_bits);
    BOOST_CHECK_THROW(synthesize(rel), structural_error);

    rel = make_instance();
    rel.c = mpz_pow2(2 * test_bits);
    BOOST_CHECK_THROW(synthesize(rel), structural_error);
}

BOOST_AUTO_TEST_SUITE_END()
