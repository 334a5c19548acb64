// tests/util/test_log.cpp
#define BOOST_TEST_MODULE Log_Tests
#include <boost/test/included/unit_test.hpp>
#include <boost/log/core.hpp>
#include <stdexcept>
#include <zkpaillier/util/log.hpp>

using namespace zkpaillier;

// ============================================================================
// Test Suite: log level names
// ============================================================================

BOOST_AUTO_TEST_SUITE(Log_Level_Tests)

BOOST_AUTO_TEST_CASE(every_level_has_a_name) {
    BOOST_CHECK(parse_log_level("disabled")  == log_level::disabled);
    BOOST_CHECK(parse_log_level("debug")     == log_level::debug_only);
    BOOST_CHECK(parse_log_level("info-only") == log_level::info_only);
    BOOST_CHECK(parse_log_level("info")      == log_level::info);
    BOOST_CHECK(parse_log_level("full")      == log_level::full);
}

BOOST_AUTO_TEST_CASE(unknown_names_are_rejected) {
    BOOST_CHECK_THROW(parse_log_level(""), std::invalid_argument);
    BOOST_CHECK_THROW(parse_log_level("INFO"), std::invalid_argument);
    BOOST_CHECK_THROW(parse_log_level("warning"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(levels_toggle_the_core) {
    set_logging_level(log_level::disabled);
    BOOST_CHECK(!logging::core::get()->get_logging_enabled());

    set_logging_level(log_level::info_only);
    BOOST_CHECK(logging::core::get()->get_logging_enabled());
    ZKPAILLIER_LOG_INFO << "info-only logging enabled";

    set_logging_level(log_level::info);
    BOOST_CHECK(logging::core::get()->get_logging_enabled());
}

BOOST_AUTO_TEST_SUITE_END()
