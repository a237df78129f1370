// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <cstdint>

#include "constants.hpp"
#include "errors.hpp"
#include "curve.hpp"

struct graduation_terms {
	double minMarketCapUsd;
	int64_t minLiquidity;
};

struct graduation_snapshot {
	bool eligible;
	double marketCapUsd;
	int64_t liquidity;
	double progress;           // percent, display only
	double missingMarketCap;
	int64_t missingLiquidity;
};

struct graduation_plan {
	ledger_error error;
	int64_t fee;
	int64_t poolNative;
	int64_t poolTokens;
};

inline graduation_terms default_graduation_terms(int64_t nativeUnit) {
	return graduation_terms{ GRADUATION_MARKET_CAP_USD, GRADUATION_LIQUIDITY_UNITS * nativeUnit };
}

// usdPerNative comes from the oracle, supply is in token smallest units
inline double market_cap_usd(int64_t raised, int64_t distributed, int64_t supply,
		double usdPerNative, int64_t nativeUnit, int64_t tokenUnit) {

	auto price = average_price(raised, distributed, nativeUnit, tokenUnit);
	return price * usdPerNative * ((double)supply / (double)tokenUnit);
}

inline graduation_snapshot evaluate_graduation(double marketCapUsd, int64_t liquidity,
		const graduation_terms& terms) {

	graduation_snapshot snapshot{ false, marketCapUsd, liquidity, 0, 0, 0 };

	snapshot.eligible = marketCapUsd >= terms.minMarketCapUsd && liquidity >= terms.minLiquidity;

	double capProgress = terms.minMarketCapUsd > 0 ? marketCapUsd / terms.minMarketCapUsd : 1;
	double liquidityProgress = terms.minLiquidity > 0 ? (double)liquidity / (double)terms.minLiquidity : 1;
	if (capProgress > 1) capProgress = 1;
	if (liquidityProgress > 1) liquidityProgress = 1;
	if (capProgress < 0) capProgress = 0;
	if (liquidityProgress < 0) liquidityProgress = 0;
	snapshot.progress = (capProgress * 0.5 + liquidityProgress * 0.5) * 100;

	if (marketCapUsd < terms.minMarketCapUsd) {
		snapshot.missingMarketCap = terms.minMarketCapUsd - marketCapUsd;
	}
	if (liquidity < terms.minLiquidity) {
		snapshot.missingLiquidity = terms.minLiquidity - liquidity;
	}
	return snapshot;
} // graduation_snapshot evaluate_graduation

// Seed for the external pool: the liquidity reserve less the graduation fee,
// plus the trading pool, matched with tokens at the average price.
inline graduation_plan plan_graduation(const graduation_snapshot& snapshot, bool graduated,
		int64_t liquidityReserve, int64_t tradingPool, int64_t tokensAvailable,
		int64_t raised, int64_t distributed, int64_t nativeUnit, int64_t tokenUnit) {

	graduation_plan plan{ ledger_error::none, 0, 0, 0 };

	if (graduated) {
		plan.error = ledger_error::already_graduated;
		return plan;
	}
	if (!snapshot.eligible) {
		plan.error = ledger_error::not_eligible;
		return plan;
	}

	plan.fee = liquidityReserve * (int64_t)GRADUATION_FEE_PERCENT / 100;
	plan.poolNative = liquidityReserve - plan.fee + tradingPool;

	if (distributed > 0 && raised > 0) {
		plan.poolTokens = (int64_t)((__int128)plan.poolNative * distributed / raised);
	}
	else {
		plan.poolTokens = tokens_at_rate(plan.poolNative, curve_rate(raised, nativeUnit), nativeUnit, tokenUnit);
	}
	if (plan.poolTokens > tokensAvailable || plan.poolTokens < 0) {
		plan.poolTokens = tokensAvailable;
	}

	if (plan.poolNative <= 0 || plan.poolTokens <= 0) {
		plan.error = ledger_error::insufficient_liquidity;
	}
	return plan;
} // graduation_plan plan_graduation
