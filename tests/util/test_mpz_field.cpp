// tests/util/test_mpz_field.cpp
#define BOOST_TEST_MODULE MPZ_Field_Tests
#include <boost/test/included/unit_test.hpp>
#include <gmp.h>
#include <gmpxx.h>
#include <libff/algebra/curves/mnt/mnt4/mnt4_pp.hpp>
#include <zkpaillier/util/csprng.hpp>
#include <zkpaillier/util/mpz_field.hpp>
#include <stdexcept>

#include "../fixture.hpp"

using namespace zkpaillier;

BOOST_TEST_GLOBAL_FIXTURE(curve_fixture);

// ============================================================================
// Test Suite: bit helpers and hex
// ============================================================================

BOOST_AUTO_TEST_SUITE(MPZ_Bits_Tests)

BOOST_AUTO_TEST_CASE(bit_slice_extracts_limbs) {
    mpz_class val;
    mpz_set_str(val.get_mpz_t(), "0123456789abcdef00112233", 16);

    BOOST_CHECK_EQUAL(mpz_bit_slice(val, 0, 32),  0x00112233);
    BOOST_CHECK_EQUAL(mpz_bit_slice(val, 32, 32), 0x89abcdefUL);
    BOOST_CHECK_EQUAL(mpz_bit_slice(val, 64, 32), 0x01234567);
    BOOST_CHECK_EQUAL(mpz_bit_slice(val, 96, 32), 0);
    BOOST_CHECK_EQUAL(mpz_bit_slice(val, 4, 8),   0x23);
}

BOOST_AUTO_TEST_CASE(bit_length) {
    BOOST_CHECK_EQUAL(mpz_bit_length(0), 0u);
    BOOST_CHECK_EQUAL(mpz_bit_length(1), 1u);
    BOOST_CHECK_EQUAL(mpz_bit_length(255), 8u);
    BOOST_CHECK_EQUAL(mpz_bit_length(256), 9u);
    BOOST_CHECK_EQUAL(mpz_bit_length(mpz_pow2(1024)), 1025u);
}

BOOST_AUTO_TEST_CASE(hex_accepts_optional_prefix) {
    BOOST_CHECK_EQUAL(mpz_from_hex("0xff"), 255);
    BOOST_CHECK_EQUAL(mpz_from_hex("0XFF"), 255);
    BOOST_CHECK_EQUAL(mpz_from_hex("ff"), 255);
    BOOST_CHECK_EQUAL(mpz_to_hex(mpz_class(255)), "0xff");
    const mpz_class big = mpz_pow2(200) + 7;
    BOOST_CHECK_EQUAL(mpz_from_hex(mpz_to_hex(big)), big);
}

BOOST_AUTO_TEST_CASE(hex_rejects_garbage) {
    BOOST_CHECK_THROW(mpz_from_hex(""), std::invalid_argument);
    BOOST_CHECK_THROW(mpz_from_hex("0x"), std::invalid_argument);
    BOOST_CHECK_THROW(mpz_from_hex("0xfg"), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: field conversion
// ============================================================================

BOOST_AUTO_TEST_SUITE(Field_Conversion_Tests)

BOOST_AUTO_TEST_CASE(bn254_scalar_field_size) {
    BOOST_CHECK_EQUAL(mpz_bit_length(field_modulus<Fr>()), 254u);
}

BOOST_AUTO_TEST_CASE(small_values_map_to_field) {
    BOOST_CHECK(field_from_mpz<Fr>(0) == Fr::zero());
    BOOST_CHECK(field_from_mpz<Fr>(1) == Fr::one());
    BOOST_CHECK(field_from_mpz<Fr>(12345) == Fr(12345));
    BOOST_CHECK_EQUAL(mpz_from_field(Fr(12345)), 12345);
}

BOOST_AUTO_TEST_CASE(negative_values_wrap) {
    const mpz_class p = field_modulus<Fr>();
    BOOST_CHECK(field_from_mpz<Fr>(-1) == -Fr::one());
    BOOST_CHECK_EQUAL(mpz_from_field(field_from_mpz<Fr>(-1)), mpz_class(p - 1));
}

BOOST_AUTO_TEST_CASE(large_values_reduce) {
    const mpz_class p = field_modulus<Fr>();
    BOOST_CHECK(field_from_mpz<Fr>(p) == Fr::zero());
    BOOST_CHECK(field_from_mpz<Fr>(mpz_class(p + 5)) == Fr(5));

    const mpz_class big = mpz_pow2(200) + 99;
    BOOST_CHECK_EQUAL(mpz_from_field(field_from_mpz<Fr>(big)), big);
}

BOOST_AUTO_TEST_CASE(uninitialized_field_is_rejected_until_init) {
    // the global fixture only sets up alt_bn128
    BOOST_CHECK_EQUAL(field_modulus<libff::mnt4_Fr>(), 0);
    BOOST_CHECK_THROW(field_from_mpz<libff::mnt4_Fr>(5), std::logic_error);

    libff::mnt4_pp::init_public_params();
    BOOST_CHECK(field_from_mpz<libff::mnt4_Fr>(5) == libff::mnt4_Fr(5));
    BOOST_CHECK(field_from_mpz<libff::mnt4_Fr>(field_modulus<libff::mnt4_Fr>()) == libff::mnt4_Fr::zero());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: random engine
// ============================================================================

BOOST_AUTO_TEST_SUITE(Random_Engine_Tests)

BOOST_AUTO_TEST_CASE(fixed_key_is_reproducible) {
    auto a = make_test_engine(0x33);
    auto b = make_test_engine(0x33);

    mpz_class x, y;
    a->random_bits(x, 1024);
    b->random_bits(y, 1024);
    BOOST_CHECK_EQUAL(x, y);
}

BOOST_AUTO_TEST_CASE(device_engines_draw_independent_keys) {
    auto a = mpz_random_engine::from_device();
    auto b = mpz_random_engine::from_device();

    mpz_class x, y;
    a->random_bits(x, 256);
    b->random_bits(y, 256);
    BOOST_CHECK_NE(x, y);
}

BOOST_AUTO_TEST_CASE(random_below_stays_below) {
    auto engine = make_test_engine(0x44);
    const mpz_class bound = mpz_pow2(100) + 3;
    for (int i = 0; i < 64; i++) {
        mpz_class v;
        engine->random_below(v, bound);
        BOOST_CHECK_LT(v, bound);
        BOOST_CHECK_GE(v, 0);
    }
}

BOOST_AUTO_TEST_SUITE_END()
