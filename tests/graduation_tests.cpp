// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#include "graduation.hpp"

#include <boost/test/unit_test.hpp>

namespace {

const int64_t NATIVE = 10'000;
const int64_t TOKEN = 10'000;

const graduation_terms TERMS = default_graduation_terms(NATIVE);

graduation_snapshot eligible() {
	return evaluate_graduation(70'000, 9 * NATIVE, TERMS);
}

}

BOOST_AUTO_TEST_SUITE(graduation_tests)

BOOST_AUTO_TEST_CASE(default_thresholds)
{
	BOOST_CHECK_CLOSE(TERMS.minMarketCapUsd, 69'000.0, 1e-9);
	BOOST_CHECK_EQUAL(TERMS.minLiquidity, 8 * NATIVE);
}

BOOST_AUTO_TEST_CASE(below_thresholds_reports_weighted_progress)
{
	auto snapshot = evaluate_graduation(15'000, 5 * NATIVE, TERMS);

	BOOST_CHECK(!snapshot.eligible);

	// 15000/69000 * 50 + 5/8 * 50
	BOOST_CHECK_CLOSE(snapshot.progress, 15'000.0 / 69'000.0 * 50.0 + 31.25, 1e-9);
	BOOST_CHECK_CLOSE(snapshot.progress, 42.12, 0.01);
	BOOST_CHECK_CLOSE(snapshot.missingMarketCap, 54'000.0, 1e-9);
	BOOST_CHECK_EQUAL(snapshot.missingLiquidity, 3 * NATIVE);
}

BOOST_AUTO_TEST_CASE(both_thresholds_are_required)
{
	BOOST_CHECK(!evaluate_graduation(1'000'000, 7 * NATIVE, TERMS).eligible);
	BOOST_CHECK(!evaluate_graduation(68'999, 100 * NATIVE, TERMS).eligible);

	auto snapshot = eligible();
	BOOST_CHECK(snapshot.eligible);
	BOOST_CHECK_CLOSE(snapshot.progress, 100.0, 1e-9);
	BOOST_CHECK_EQUAL(snapshot.missingMarketCap, 0.0);
	BOOST_CHECK_EQUAL(snapshot.missingLiquidity, 0);
}

BOOST_AUTO_TEST_CASE(progress_is_capped_per_component)
{
	// a huge market cap does not make up for missing liquidity
	auto snapshot = evaluate_graduation(10'000'000, 4 * NATIVE, TERMS);

	BOOST_CHECK(!snapshot.eligible);
	BOOST_CHECK_CLOSE(snapshot.progress, 75.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(market_cap_uses_average_price)
{
	// 10 units raised for 12,000,000 tokens, 1,000,000,000 supply, 5 usd per unit
	auto cap = market_cap_usd(10 * NATIVE, 12'000'000 * TOKEN, 1'000'000'000 * TOKEN, 5.0, NATIVE, TOKEN);
	BOOST_CHECK_CLOSE(cap, 10.0 / 12'000'000 * 5.0 * 1'000'000'000, 1e-9);

	// tier price before the first purchase
	auto initial = market_cap_usd(0, 0, 1'000'000'000 * TOKEN, 5.0, NATIVE, TOKEN);
	BOOST_CHECK_CLOSE(initial, 1.0 / 1'200'000 * 5.0 * 1'000'000'000, 1e-9);
}

BOOST_AUTO_TEST_CASE(execution_seeds_pool)
{
	auto plan = plan_graduation(eligible(), false, 10'000, 5'000, 1'000'000'000 * TOKEN,
		100'000, 1'000'000'000, NATIVE, TOKEN);

	BOOST_REQUIRE(plan.error == ledger_error::none);
	BOOST_CHECK_EQUAL(plan.fee, 100);
	BOOST_CHECK_EQUAL(plan.poolNative, 14'900);
	BOOST_CHECK_EQUAL(plan.poolTokens, 149'000'000);
}

BOOST_AUTO_TEST_CASE(pool_tokens_capped_by_escrow)
{
	auto plan = plan_graduation(eligible(), false, 10'000, 5'000, 1'000,
		100'000, 1'000'000'000, NATIVE, TOKEN);

	BOOST_REQUIRE(plan.error == ledger_error::none);
	BOOST_CHECK_EQUAL(plan.poolTokens, 1'000);
}

BOOST_AUTO_TEST_CASE(execution_fails_twice_or_when_ineligible)
{
	BOOST_CHECK(plan_graduation(eligible(), true, 10'000, 5'000, 1'000, 100'000, 1'000, NATIVE, TOKEN).error
		== ledger_error::already_graduated);

	auto snapshot = evaluate_graduation(15'000, 5 * NATIVE, TERMS);
	BOOST_CHECK(plan_graduation(snapshot, false, 10'000, 5'000, 1'000, 100'000, 1'000, NATIVE, TOKEN).error
		== ledger_error::not_eligible);
	BOOST_CHECK(plan_graduation(snapshot, true, 10'000, 5'000, 1'000, 100'000, 1'000, NATIVE, TOKEN).error
		== ledger_error::already_graduated);
}

BOOST_AUTO_TEST_CASE(empty_escrow_cannot_seed)
{
	BOOST_CHECK(plan_graduation(eligible(), false, 10'000, 5'000, 0, 100'000, 1'000, NATIVE, TOKEN).error
		== ledger_error::insufficient_liquidity);
}

BOOST_AUTO_TEST_SUITE_END()
