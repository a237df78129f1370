// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <cstdint>

#include "constants.hpp"
#include "errors.hpp"

enum class conversion_strategy: uint8_t { instant = 0, hybrid = 1, on_withdrawal = 2 };

// oracle row: stable smallest units per one whole native unit
struct price_reading {
	bool present;
	int64_t price;
	uint64_t updatedAt;
};

// router pool connectors
struct pool_reading {
	bool present;
	int64_t nativeReserve;
	int64_t stableReserve;
};

struct conversion_plan {
	ledger_error error;
	int64_t convert;    // native sent to the router
	int64_t stableOut;  // fee-free pool quote
	int64_t minReturn;  // oracle slippage floor, sent to the router and credited
	int64_t keep;       // native left in custody
	bool fellBack;
};

inline bool valid_strategy(uint8_t strategy) {
	return strategy <= (uint8_t)conversion_strategy::on_withdrawal;
}

inline ledger_error check_feed(const price_reading& feed) {
	if (!feed.present || feed.price <= 0) {
		return ledger_error::price_feed_error;
	}
	return ledger_error::none;
}

inline bool is_fresh(const price_reading& feed, uint64_t now) {
	return feed.updatedAt >= now || now - feed.updatedAt <= ORACLE_MAX_AGE;
}

// constant product output, same shape as get_bancor_output
inline int64_t pool_output(const pool_reading& pool, int64_t nativeIn) {
	if (!pool.present || pool.nativeReserve <= 0 || pool.stableReserve <= 0 || nativeIn <= 0) {
		return 0;
	}
	__int128 out = (__int128)pool.stableReserve * nativeIn;
	out /= (__int128)pool.nativeReserve + nativeIn;
	return (int64_t)out;
}

// lowest acceptable router output under the oracle price and slippage bound
inline int64_t min_acceptable(int64_t nativeIn, const price_reading& feed, int64_t nativeUnit) {
	__int128 expected = (__int128)nativeIn * feed.price / nativeUnit;
	return (int64_t)(expected * (10'000 - MAX_SLIPPAGE_BPS) / 10'000);
}

inline conversion_plan quote_conversion(int64_t nativeIn, const price_reading& feed,
		const pool_reading& pool, uint64_t now, int64_t nativeUnit) {

	conversion_plan plan{ ledger_error::none, 0, 0, 0, 0, false };

	auto feedError = check_feed(feed);
	if (feedError != ledger_error::none) {
		plan.error = feedError;
		return plan;
	}

	auto out = pool_output(pool, nativeIn);
	auto lowest = min_acceptable(nativeIn, feed, nativeUnit);
	if (!is_fresh(feed, now) || out <= 0 || lowest <= 0 || out < lowest) {
		plan.error = ledger_error::swap_failed;
		return plan;
	}

	// the router keeps its own fee, so only the floor is guaranteed
	plan.convert = nativeIn;
	plan.stableOut = out;
	plan.minReturn = lowest;
	return plan;
} // conversion_plan quote_conversion

inline int64_t purchase_share(int64_t amount, conversion_strategy strategy) {
	switch (strategy) {
		case conversion_strategy::instant: return amount;
		case conversion_strategy::hybrid: return amount * (int64_t)HYBRID_CONVERT_PERCENT / 100;
		case conversion_strategy::on_withdrawal: return 0;
	}
	return 0;
}

// An unreadable feed fails the purchase; any other conversion problem keeps
// the amount native so it can be converted at a later withdrawal.
inline conversion_plan plan_purchase_conversion(int64_t amount, conversion_strategy strategy,
		const price_reading& feed, const pool_reading& pool, uint64_t now, int64_t nativeUnit) {

	conversion_plan plan{ ledger_error::none, 0, 0, 0, amount, false };

	auto share = purchase_share(amount, strategy);
	if (share <= 0) {
		return plan;
	}

	auto quote = quote_conversion(share, feed, pool, now, nativeUnit);
	if (quote.error == ledger_error::price_feed_error) {
		plan.error = quote.error;
		return plan;
	}
	if (quote.error != ledger_error::none) {
		plan.fellBack = true;
		return plan;
	}

	plan.convert = share;
	plan.stableOut = quote.stableOut;
	plan.minReturn = quote.minReturn;
	plan.keep = amount - share;
	return plan;
} // conversion_plan plan_purchase_conversion

// Withdrawals move real funds: every conversion problem is an error.
inline conversion_plan plan_withdraw_conversion(int64_t amount, const price_reading& feed,
		const pool_reading& pool, uint64_t now, int64_t nativeUnit) {

	if (amount <= 0) {
		return conversion_plan{ ledger_error::none, 0, 0, 0, 0, false };
	}
	return quote_conversion(amount, feed, pool, now, nativeUnit);
}
