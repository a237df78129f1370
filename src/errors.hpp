// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <cstdint>

// Codes are part of the client contract: messages are "[[code]] Name: detail".
enum class ledger_error: uint8_t {
	none = 0,
	invalid_amount = 1,
	unauthorized = 2,
	milestone_locked = 3,
	nothing_to_withdraw = 4,
	insufficient_liquidity = 5,
	insufficient_balance = 6,
	task_not_found = 7,
	already_exists = 8,
	already_finalized = 9,
	budget_exceeded = 10,
	price_feed_error = 11,
	swap_failed = 12,
	already_graduated = 13,
	not_eligible = 14,
	invalid_schedule = 15,
	invalid_config = 16,
	campaign_inactive = 17,
	not_found = 18
};

inline const char* error_message(ledger_error error) {
	switch (error) {
		case ledger_error::none: return "[[0]] Ok";
		case ledger_error::invalid_amount: return "[[1]] InvalidAmount: amount is not valid";
		case ledger_error::unauthorized: return "[[2]] Unauthorized: only the campaign creator can do this";
		case ledger_error::milestone_locked: return "[[3]] MilestoneLocked: milestone is not unlocked yet";
		case ledger_error::nothing_to_withdraw: return "[[4]] NothingToWithdraw: there is nothing to withdraw";
		case ledger_error::insufficient_liquidity: return "[[5]] InsufficientLiquidity: not enough liquidity";
		case ledger_error::insufficient_balance: return "[[6]] InsufficientBalance: token balance is too low";
		case ledger_error::task_not_found: return "[[7]] TaskNotFound: task index is out of range or inactive";
		case ledger_error::already_exists: return "[[8]] AlreadyExists: record already exists";
		case ledger_error::already_finalized: return "[[9]] AlreadyFinalized: completion is not pending";
		case ledger_error::budget_exceeded: return "[[10]] BudgetExceeded: reward budget or completion limit reached";
		case ledger_error::price_feed_error: return "[[11]] PriceFeedError: price feed is invalid";
		case ledger_error::swap_failed: return "[[12]] SwapFailed: currency conversion failed";
		case ledger_error::already_graduated: return "[[13]] AlreadyGraduated: campaign has graduated";
		case ledger_error::not_eligible: return "[[14]] NotEligible: graduation requirements are not met";
		case ledger_error::invalid_schedule: return "[[15]] InvalidSchedule: milestone schedule is malformed";
		case ledger_error::invalid_config: return "[[16]] InvalidConfig: configuration is not valid";
		case ledger_error::campaign_inactive: return "[[17]] CampaignInactive: campaign is not accepting this operation";
		case ledger_error::not_found: return "[[18]] NotFound: record does not exist";
	}
	return "[[255]] Unknown";
}
