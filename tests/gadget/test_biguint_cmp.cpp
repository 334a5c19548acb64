// tests/gadget/test_biguint_cmp.cpp
#define BOOST_TEST_MODULE BigUint_Cmp_Tests
#include <boost/test/included/unit_test.hpp>
#include <gmpxx.h>
#include <zkpaillier/error.hpp>
#include <zkpaillier/gadget/biguint_var.hpp>
#include <zkpaillier/util/mpz_field.hpp>

#include "../fixture.hpp"

using namespace zkpaillier;

using var = gadget::biguint_var<Fr>;

BOOST_TEST_GLOBAL_FIXTURE(curve_fixture);

namespace {

bool lt_holds(const mpz_class& a, size_t a_bound, const mpz_class& b, size_t b_bound) {
    pb_t pb;
    auto x = var::new_witness(pb, a, a_bound);
    auto y = var::new_witness(pb, b, b_bound);
    x.enforce_lt(pb, y);
    return pb.is_satisfied();
}

bool unaligned_holds(const mpz_class& a, size_t a_bound, const mpz_class& b, size_t b_bound) {
    pb_t pb;
    auto y = var::new_input(pb, b, b_bound);
    auto x = var::new_witness(pb, a, a_bound);
    y.enforce_range(pb);
    x.enforce_equal_unaligned(pb, y);
    return pb.is_satisfied();
}

}  // namespace

// ============================================================================
// Test Suite: enforce_lt
// ============================================================================

BOOST_AUTO_TEST_SUITE(Less_Than_Tests)

BOOST_AUTO_TEST_CASE(accepts_smaller) {
    BOOST_CHECK(lt_holds(0, 8, 1, 8));
    BOOST_CHECK(lt_holds(254, 8, 255, 8));
    BOOST_CHECK(lt_holds(mpz_from_hex("ffffffff"), 32, mpz_from_hex("100000000"), 33));
    BOOST_CHECK(lt_holds(5, 4, mpz_from_hex("123456789abcdef0123"), 80));
    BOOST_CHECK(lt_holds(mpz_from_hex("fffffffffffffffffffe"), 80, mpz_from_hex("ffffffffffffffffffff"), 80));
}

BOOST_AUTO_TEST_CASE(rejects_equal) {
    BOOST_CHECK(!lt_holds(0, 8, 0, 8));
    BOOST_CHECK(!lt_holds(mpz_from_hex("123456789abcdef"), 60, mpz_from_hex("123456789abcdef"), 64));
}

BOOST_AUTO_TEST_CASE(rejects_greater) {
    BOOST_CHECK(!lt_holds(2, 8, 1, 8));
    BOOST_CHECK(!lt_holds(mpz_from_hex("100000000"), 33, mpz_from_hex("ffffffff"), 32));
    BOOST_CHECK(!lt_holds(mpz_from_hex("ffffffffffffffffffff"), 80, 0, 8));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: enforce_equal
// ============================================================================

BOOST_AUTO_TEST_SUITE(Aligned_Equal_Tests)

BOOST_AUTO_TEST_CASE(same_value) {
    pb_t pb;
    auto y = var::new_input(pb, mpz_from_hex("abcdef0123456789"), 64);
    auto x = var::new_witness(pb, mpz_from_hex("abcdef0123456789"), 64);
    y.enforce_range(pb);
    x.enforce_equal(pb, y);
    BOOST_CHECK(pb.is_satisfied());
}

BOOST_AUTO_TEST_CASE(different_value) {
    pb_t pb;
    auto y = var::new_input(pb, mpz_from_hex("abcdef0123456788"), 64);
    auto x = var::new_witness(pb, mpz_from_hex("abcdef0123456789"), 64);
    y.enforce_range(pb);
    x.enforce_equal(pb, y);
    BOOST_CHECK(!pb.is_satisfied());
}

BOOST_AUTO_TEST_CASE(constant_operand) {
    pb_t pb;
    auto x = var::new_witness(pb, 1, 40);
    x.enforce_equal(pb, var::constant(pb, 1, 40));
    BOOST_CHECK(pb.is_satisfied());
}

BOOST_AUTO_TEST_CASE(limb_count_mismatch_is_structural) {
    pb_t pb;
    auto x = var::new_witness(pb, 7, 32);
    auto y = var::new_witness(pb, 7, 64);
    BOOST_CHECK_THROW(x.enforce_equal(pb, y), structural_error);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: enforce_equal_unaligned
// ============================================================================

BOOST_AUTO_TEST_SUITE(Unaligned_Equal_Tests)

BOOST_AUTO_TEST_CASE(different_bounds_same_value) {
    BOOST_CHECK(unaligned_holds(7, 3, 7, 200));
    BOOST_CHECK(unaligned_holds(0, 1, 0, 64));
    BOOST_CHECK(unaligned_holds(mpz_from_hex("123456789abcdef"), 64, mpz_from_hex("123456789abcdef"), 130));
}

BOOST_AUTO_TEST_CASE(spans_several_chunks) {
    auto engine = make_test_engine(0x33);
    mpz_class v;
    engine->random_bits(v, 500);

    BOOST_CHECK(unaligned_holds(v, 500, v, 520));
    BOOST_CHECK(unaligned_holds(v, 600, v, 500));
}

BOOST_AUTO_TEST_CASE(different_values) {
    auto engine = make_test_engine(0x44);
    mpz_class v;
    engine->random_bits(v, 500);

    BOOST_CHECK(!unaligned_holds(7, 3, 6, 200));
    BOOST_CHECK(!unaligned_holds(v, 520, mpz_class(v ^ mpz_pow2(450)), 520));
    BOOST_CHECK(!unaligned_holds(v, 500, mpz_class(v + mpz_pow2(500)), 520));
}

BOOST_AUTO_TEST_SUITE_END()
