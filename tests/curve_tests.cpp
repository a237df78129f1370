// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#include "curve.hpp"

#include <boost/test/unit_test.hpp>

namespace {

const int64_t NATIVE = 10'000;  // precision 4
const int64_t TOKEN = 10'000;

sale_state after_purchase(int64_t raised, int64_t distributed) {
	return sale_state{ raised, distributed, MAX_AMOUNT, 0, 80 };
}

}

BOOST_AUTO_TEST_SUITE(curve_tests)

BOOST_AUTO_TEST_CASE(early_bird_purchase_from_zero)
{
	auto quote = quote_purchase(1 * NATIVE, 0, NATIVE, TOKEN);

	BOOST_CHECK(quote.error == ledger_error::none);
	BOOST_CHECK_EQUAL(quote.rate, EARLY_BIRD_RATE);
	BOOST_CHECK_EQUAL(quote.tokens, 1'200'000 * TOKEN);
	BOOST_CHECK_CLOSE(quote.price, 1.0 / 1'200'000, 1e-9);
}

BOOST_AUTO_TEST_CASE(base_rate_above_threshold)
{
	auto quote = quote_purchase(1 * NATIVE, 10 * NATIVE, NATIVE, TOKEN);

	BOOST_CHECK(quote.error == ledger_error::none);
	BOOST_CHECK_EQUAL(quote.rate, BASE_RATE);
	BOOST_CHECK_EQUAL(quote.tokens, 1'000'000 * TOKEN);
}

BOOST_AUTO_TEST_CASE(tier_is_keyed_on_raised_before_purchase)
{
	BOOST_CHECK_EQUAL(curve_rate(10 * NATIVE - 1, NATIVE), EARLY_BIRD_RATE);
	BOOST_CHECK_EQUAL(curve_rate(10 * NATIVE, NATIVE), BASE_RATE);

	// a purchase straddling the threshold still gets the bonus
	auto quote = quote_purchase(5 * NATIVE, 9 * NATIVE, NATIVE, TOKEN);
	BOOST_CHECK_EQUAL(quote.tokens, 6'000'000 * TOKEN);
}

BOOST_AUTO_TEST_CASE(rejects_non_positive_amounts)
{
	BOOST_CHECK(quote_purchase(0, 0, NATIVE, TOKEN).error == ledger_error::invalid_amount);
	BOOST_CHECK(quote_purchase(-5, 0, NATIVE, TOKEN).error == ledger_error::invalid_amount);
}

BOOST_AUTO_TEST_CASE(rejects_degenerate_purchase)
{
	// one smallest native unit of an 18-decimal currency buys less than one token unit
	auto quote = quote_purchase(1, 0, 1'000'000'000'000'000'000LL, 1);

	BOOST_CHECK(quote.error == ledger_error::invalid_amount);
	BOOST_CHECK_EQUAL(quote.tokens, 0);
}

BOOST_AUTO_TEST_CASE(rejects_overflowing_purchase)
{
	auto quote = quote_purchase(MAX_AMOUNT, 0, 1, TOKEN);
	BOOST_CHECK(quote.error == ledger_error::invalid_amount);
}

BOOST_AUTO_TEST_CASE(eighteen_decimal_token_does_not_overflow)
{
	const int64_t WEI = 1'000'000'000'000'000'000LL;

	// 200,000,000 units would issue far more than an asset can hold
	auto large = quote_purchase(2'000'000'000'000LL, 0, NATIVE, WEI);
	BOOST_CHECK(large.error == ledger_error::invalid_amount);
	BOOST_CHECK_EQUAL(tokens_at_rate(2'000'000'000'000LL, EARLY_BIRD_RATE, NATIVE, WEI), -1);

	// one smallest unit still prices exactly when both sides carry 18 decimals
	BOOST_CHECK_EQUAL(tokens_at_rate(1, EARLY_BIRD_RATE, WEI, WEI), 1'200'000);

	// selling against an 18-decimal native currency
	BOOST_CHECK_EQUAL(native_at_rate(MAX_AMOUNT, BASE_RATE, WEI, 1), -1);
	auto sale = quote_sale(MAX_AMOUNT, sale_state{ MAX_AMOUNT, MAX_AMOUNT, MAX_AMOUNT, 0, 80 }, WEI, 1);
	BOOST_CHECK(sale.error == ledger_error::invalid_amount);
}

BOOST_AUTO_TEST_CASE(spot_and_average_price)
{
	BOOST_CHECK_CLOSE(spot_price(0, NATIVE), 1.0 / 1'200'000, 1e-9);
	BOOST_CHECK_CLOSE(spot_price(10 * NATIVE, NATIVE), 1.0 / 1'000'000, 1e-9);

	// nothing distributed yet
	BOOST_CHECK_CLOSE(average_price(0, 0, NATIVE, TOKEN), spot_price(0, NATIVE), 1e-9);

	// 10 units for 12,000,000 tokens
	BOOST_CHECK_CLOSE(average_price(10 * NATIVE, 12'000'000 * TOKEN, NATIVE, TOKEN), 10.0 / 12'000'000, 1e-9);
}

BOOST_AUTO_TEST_CASE(sell_returns_base_price_above_threshold)
{
	auto tokens = 3'000'000 * TOKEN;
	auto sale = quote_sale(tokens, after_purchase(23 * NATIVE, tokens), NATIVE, TOKEN);

	BOOST_CHECK(sale.error == ledger_error::none);
	BOOST_CHECK_EQUAL(sale.rate, BASE_RATE);
	BOOST_CHECK_EQUAL(sale.gross, 3 * NATIVE);
	BOOST_CHECK_EQUAL(sale.fee, 300);
	BOOST_CHECK_EQUAL(sale.net, 3 * NATIVE - 300);
}

BOOST_AUTO_TEST_CASE(sell_uses_bonus_price_below_threshold)
{
	auto tokens = 1'200'000 * TOKEN;
	auto sale = quote_sale(tokens, after_purchase(1 * NATIVE, tokens), NATIVE, TOKEN);

	BOOST_CHECK(sale.error == ledger_error::none);
	BOOST_CHECK_EQUAL(sale.rate, EARLY_BIRD_RATE);
	BOOST_CHECK_EQUAL(sale.gross, 1 * NATIVE);
}

BOOST_AUTO_TEST_CASE(buy_then_sell_never_profits)
{
	struct trade { int64_t raised; int64_t paid; };
	const trade trades[] = {
		{ 0, 1 * NATIVE },
		{ 9 * NATIVE + NATIVE / 2, 1 * NATIVE },
		{ 10 * NATIVE - 1, 7 },
		{ 20 * NATIVE, 3 * NATIVE },
		{ 3, 1 },
		{ 10 * NATIVE - 3, 3 },
		{ 0, 12 * NATIVE + 3 }
	};

	for (auto& t : trades) {
		auto purchase = quote_purchase(t.paid, t.raised, NATIVE, TOKEN);
		BOOST_REQUIRE(purchase.error == ledger_error::none);

		auto sale = quote_sale(purchase.tokens,
			after_purchase(t.raised + t.paid, purchase.tokens), NATIVE, TOKEN);
		BOOST_REQUIRE(sale.error == ledger_error::none);

		BOOST_CHECK_LE(sale.gross, t.paid);
		BOOST_CHECK_LE(sale.net, sale.gross);
	}
}

BOOST_AUTO_TEST_CASE(sell_more_than_distributed_fails)
{
	auto sale = quote_sale(2 * TOKEN, after_purchase(NATIVE, TOKEN), NATIVE, TOKEN);
	BOOST_CHECK(sale.error == ledger_error::insufficient_liquidity);
}

BOOST_AUTO_TEST_CASE(sell_beyond_trading_pool_fails)
{
	auto tokens = 3'000'000 * TOKEN;
	auto state = sale_state{ 23 * NATIVE, tokens, 2 * NATIVE, 0, 80 };

	BOOST_CHECK(quote_sale(tokens, state, NATIVE, TOKEN).error == ledger_error::insufficient_liquidity);
}

BOOST_AUTO_TEST_CASE(sell_cannot_break_withdrawal_invariant)
{
	// 8 units withdrawn against 10 raised at 80%
	auto tokens = 1'000'000 * TOKEN;
	auto state = sale_state{ 10 * NATIVE, 12'000'000 * TOKEN, 5 * NATIVE, 8 * NATIVE, 80 };

	BOOST_CHECK(quote_sale(tokens, state, NATIVE, TOKEN).error == ledger_error::insufficient_liquidity);
}

BOOST_AUTO_TEST_CASE(sell_rejects_zero_tokens)
{
	BOOST_CHECK(quote_sale(0, after_purchase(NATIVE, TOKEN), NATIVE, TOKEN).error == ledger_error::invalid_amount);
}

BOOST_AUTO_TEST_SUITE_END()
