// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <cstdint>

#include "constants.hpp"
#include "errors.hpp"

struct allocation {
	ledger_error error;
	int64_t creator;
	int64_t liquidity;
	int64_t trading;
	int64_t fee;
};

// Fee comes off the top, the rest is split by fundingRatio into the creator
// bucket and the liquidity side, which feeds the trading pool and the
// liquidity reserve. Division remainders land in the fee bucket.
inline allocation split_purchase(int64_t gross, uint64_t fundingRatio) {
	allocation result{ ledger_error::none, 0, 0, 0, 0 };

	if (gross <= 0) {
		result.error = ledger_error::invalid_amount;
		return result;
	}
	if (fundingRatio > 100) {
		result.error = ledger_error::invalid_config;
		return result;
	}

	__int128 net = gross - (__int128)gross * PLATFORM_FEE_PERCENT / 100;
	__int128 liquiditySide = net * (100 - fundingRatio) / 100;

	result.creator = (int64_t)(net * fundingRatio / 100);
	result.trading = (int64_t)(liquiditySide * TRADING_POOL_PERCENT / 100);
	result.liquidity = (int64_t)liquiditySide - result.trading;
	result.fee = gross - result.creator - result.liquidity - result.trading;

	return result;
} // allocation split_purchase
