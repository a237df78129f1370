// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <cstdint>

#include "constants.hpp"
#include "errors.hpp"

// Two-tier step curve keyed on the amount raised so far. Amounts are in
// smallest units; nativeUnit and tokenUnit are 10^precision of each symbol.

const int64_t MAX_AMOUNT = (1LL << 62) - 1;

struct purchase_quote {
	ledger_error error;
	int64_t tokens;
	uint64_t rate;
	double price; // native units per whole token
};

struct sale_state {
	int64_t raised;
	int64_t distributed;
	int64_t tradingPool;
	int64_t withdrawn;
	uint64_t fundingRatio;
};

struct sale_quote {
	ledger_error error;
	int64_t gross;  // leaves the trading pool and raised
	int64_t fee;
	int64_t net;    // paid to the seller
	uint64_t rate;
};

inline int64_t early_bird_threshold(int64_t nativeUnit) {
	return EARLY_BIRD_THRESHOLD_UNITS * nativeUnit;
}

inline uint64_t curve_rate(int64_t raised, int64_t nativeUnit) {
	return raised < early_bird_threshold(nativeUnit) ? EARLY_BIRD_RATE : BASE_RATE;
}

// -1 when the result does not fit an asset amount
inline int64_t tokens_at_rate(int64_t nativeIn, uint64_t rate, int64_t nativeUnit, int64_t tokenUnit) {
	__int128 scaled = (__int128)nativeIn * TOKENS_PER_UNIT * rate;
	__int128 divisor = (__int128)nativeUnit * 100;

	// split the division so scaling by tokenUnit cannot overflow
	__int128 whole = scaled / divisor;
	__int128 rest = scaled % divisor;
	if (whole > MAX_AMOUNT / tokenUnit) {
		return -1;
	}

	__int128 tokens = whole * tokenUnit + rest * tokenUnit / divisor;
	return tokens > MAX_AMOUNT ? -1 : (int64_t)tokens;
}

// -1 when the result does not fit an asset amount
inline int64_t native_at_rate(int64_t tokens, uint64_t rate, int64_t nativeUnit, int64_t tokenUnit) {
	__int128 scaled = (__int128)tokens * 100;
	if (scaled > ((__int128)1 << 126) / nativeUnit) {
		return -1;
	}

	__int128 native = scaled * nativeUnit;
	native /= (__int128)TOKENS_PER_UNIT * tokenUnit * rate;
	return native > MAX_AMOUNT ? -1 : (int64_t)native;
}

// native units per whole token at the current tier
inline double spot_price(int64_t raised, int64_t nativeUnit) {
	return 1.0 / ((double)TOKENS_PER_UNIT * (double)curve_rate(raised, nativeUnit) / 100.0);
}

// falls back to the tier price until something is distributed
inline double average_price(int64_t raised, int64_t distributed, int64_t nativeUnit, int64_t tokenUnit) {
	if (distributed <= 0 || raised <= 0) {
		return spot_price(raised, nativeUnit);
	}
	return ((double)raised / (double)nativeUnit) / ((double)distributed / (double)tokenUnit);
}

inline purchase_quote quote_purchase(int64_t nativeIn, int64_t raised,
		int64_t nativeUnit, int64_t tokenUnit) {

	purchase_quote quote{ ledger_error::none, 0, 0, 0 };

	if (nativeIn <= 0 || nativeIn > MAX_AMOUNT || raised < 0) {
		quote.error = ledger_error::invalid_amount;
		return quote;
	}

	quote.rate = curve_rate(raised, nativeUnit);
	quote.tokens = tokens_at_rate(nativeIn, quote.rate, nativeUnit, tokenUnit);

	// degenerate purchase or overflow
	if (quote.tokens < 1) {
		quote.error = ledger_error::invalid_amount;
		quote.tokens = 0;
		return quote;
	}

	quote.price = ((double)nativeIn / (double)nativeUnit) / ((double)quote.tokens / (double)tokenUnit);
	return quote;
} // purchase_quote quote_purchase

// Inverse of a purchase: the native amount that, bought at (raised - gross),
// would have issued `tokens`. Uses the base tier only when the whole sale
// stays above the early-bird threshold, otherwise the cheaper bonus tier.
inline sale_quote quote_sale(int64_t tokens, const sale_state& state,
		int64_t nativeUnit, int64_t tokenUnit) {

	sale_quote quote{ ledger_error::none, 0, 0, 0, 0 };

	if (tokens <= 0) {
		quote.error = ledger_error::invalid_amount;
		return quote;
	}
	if (tokens > state.distributed) {
		quote.error = ledger_error::insufficient_liquidity;
		return quote;
	}

	auto atBase = native_at_rate(tokens, BASE_RATE, nativeUnit, tokenUnit);
	if (state.raised - atBase >= early_bird_threshold(nativeUnit)) {
		quote.gross = atBase;
		quote.rate = BASE_RATE;
	}
	else {
		quote.gross = native_at_rate(tokens, EARLY_BIRD_RATE, nativeUnit, tokenUnit);
		quote.rate = EARLY_BIRD_RATE;
	}

	if (quote.gross <= 0) {
		quote.error = ledger_error::invalid_amount;
		return quote;
	}

	if (quote.gross > state.tradingPool || quote.gross > state.raised) {
		quote.error = ledger_error::insufficient_liquidity;
		return quote;
	}

	// creator withdrawals must stay covered by what remains raised
	__int128 fundingAfter = (__int128)(state.raised - quote.gross) * state.fundingRatio / 100;
	if (fundingAfter < state.withdrawn) {
		quote.error = ledger_error::insufficient_liquidity;
		return quote;
	}

	quote.fee = quote.gross * (int64_t)PLATFORM_FEE_PERCENT / 100;
	quote.net = quote.gross - quote.fee;
	return quote;
} // sale_quote quote_sale
