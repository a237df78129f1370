// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#include "identity.hpp"

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(identity_tests)

BOOST_AUTO_TEST_CASE(key_is_stable_per_creator_and_name)
{
	BOOST_CHECK(campaign_key(42, "moon rocket") == campaign_key(42, "moon rocket"));
	BOOST_CHECK(campaign_key(42, "moon rocket") != campaign_key(42, "moon rocket 2"));
	BOOST_CHECK(campaign_key(42, "moon rocket") != campaign_key(43, "moon rocket"));
}

BOOST_AUTO_TEST_CASE(creator_occupies_high_half)
{
	auto key = campaign_key(0x1234'5678'9abc'def0ULL, "x");

	BOOST_CHECK_EQUAL((uint64_t)(key >> 64), 0x1234'5678'9abc'def0ULL);
	BOOST_CHECK_EQUAL((uint64_t)key, fnv1a64("x"));
}

BOOST_AUTO_TEST_CASE(fnv1a_reference_values)
{
	BOOST_CHECK_EQUAL(fnv1a64(""), 14695981039346656037ULL);
	BOOST_CHECK_EQUAL(fnv1a64("a"), 0xaf63dc4c8601ec8cULL);
}

BOOST_AUTO_TEST_SUITE_END()
