// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <cstdint>

const uint64_t SECOND = 1000;
const uint64_t MINUTE = 60 * SECOND;
const uint64_t HOUR = 60 * MINUTE;
const uint64_t DAY = 24 * HOUR;

// bonding curve tiers
const int64_t TOKENS_PER_UNIT = 1'000'000;
const int64_t EARLY_BIRD_THRESHOLD_UNITS = 10;
const uint64_t EARLY_BIRD_RATE = 120;
const uint64_t BASE_RATE = 100;

// allocation
const uint64_t PLATFORM_FEE_PERCENT = 1;

// share of the liquidity side that goes to the trading pool
const uint64_t TRADING_POOL_PERCENT = 25;

// share of the creator bucket converted at purchase time by the hybrid strategy
const uint64_t HYBRID_CONVERT_PERCENT = 50;

// conversion
const uint64_t MAX_SLIPPAGE_BPS = 300;
const uint64_t ORACLE_MAX_AGE = 5 * MINUTE;

// graduation thresholds
const double GRADUATION_MARKET_CAP_USD = 69'000;
const int64_t GRADUATION_LIQUIDITY_UNITS = 8;
const uint64_t GRADUATION_FEE_PERCENT = 1;
const uint64_t LIQUIDITY_LOCK_DAYS = 90;

// campaign limits
const uint64_t MIN_CAMPAIGN_DURATION = 1 * DAY;
const uint64_t MAX_CAMPAIGN_DURATION = 180 * DAY;
const uint64_t MAX_MILESTONES = 10;
const uint64_t MAX_TASKS = 20;

const uint64_t MAX_NAME_LENGTH = 50;
const uint64_t MAX_DESCRIPTION_LENGTH = 200;
const uint64_t MAX_PROOF_LENGTH = 256;
const uint64_t MAX_REASON_LENGTH = 200;
