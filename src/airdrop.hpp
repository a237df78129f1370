// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <cstdint>
#include <vector>

#include "constants.hpp"
#include "errors.hpp"

enum class reward_mode: uint8_t { per_task = 0, all_required = 1 };

enum class completion_status: uint8_t { pending = 0, approved = 1, rejected = 2 };

enum class task_type: uint8_t {
	twitter_follow = 0,
	twitter_retweet = 1,
	twitter_like = 2,
	discord_join = 3,
	telegram_join = 4,
	instagram_follow = 5,
	instagram_story = 6,
	email_subscribe = 7,
	website_visit = 8,
	referral = 9,
	custom = 10
};

struct task_terms {
	uint8_t type;
	int64_t reward;
	uint64_t maxCompletions;
	uint64_t completions;
	bool active;
};

struct pool_terms {
	reward_mode mode;
	int64_t budget;
	int64_t distributed;
	int64_t bundleReward;
	bool active;
	uint64_t endAt;
};

struct approval_plan {
	ledger_error error;
	int64_t payout;
};

inline bool valid_task_type(uint8_t type) {
	return type <= (uint8_t)task_type::custom;
}

inline bool valid_reward_mode(uint8_t mode) {
	return mode <= (uint8_t)reward_mode::all_required;
}

// tokensAvailable is the unsold, unreserved part of the campaign escrow
inline ledger_error validate_pool(const pool_terms& pool, const std::vector<task_terms>& tasks,
		uint64_t now, int64_t tokensAvailable) {

	if (tasks.empty() || tasks.size() > MAX_TASKS) {
		return ledger_error::invalid_config;
	}
	if (pool.budget <= 0) {
		return ledger_error::invalid_amount;
	}
	if (pool.endAt <= now) {
		return ledger_error::invalid_config;
	}

	for (auto& task : tasks) {
		if (!valid_task_type(task.type) || task.maxCompletions == 0) {
			return ledger_error::invalid_config;
		}
		if (task.reward <= 0 || task.reward > pool.budget) {
			return ledger_error::invalid_amount;
		}
	}

	if (pool.mode == reward_mode::all_required
			&& (pool.bundleReward <= 0 || pool.bundleReward > pool.budget)) {
		return ledger_error::invalid_amount;
	}

	if (pool.budget > tokensAvailable) {
		return ledger_error::insufficient_liquidity;
	}
	return ledger_error::none;
} // ledger_error validate_pool

inline ledger_error check_submission(const pool_terms& pool, const std::vector<task_terms>& tasks,
		uint64_t index, bool exists, uint64_t now) {

	if (!pool.active || now > pool.endAt) {
		return ledger_error::campaign_inactive;
	}
	if (index >= tasks.size() || !tasks[index].active) {
		return ledger_error::task_not_found;
	}
	if (exists) {
		return ledger_error::already_exists;
	}
	return ledger_error::none;
}

// true when approving `index` leaves the user with approvals for every active task
inline bool completes_bundle(const std::vector<task_terms>& tasks,
		const std::vector<bool>& approved, uint64_t index) {

	for (uint64_t i = 0; i < tasks.size(); ++i) {
		if (i == index || !tasks[i].active) continue;
		if (i >= approved.size() || !approved[i]) return false;
	}
	return true;
}

// bundlePaid: the user already received the bundle reward
inline approval_plan plan_approval(const pool_terms& pool, const task_terms& task,
		completion_status status, bool completesBundle, bool bundlePaid) {

	approval_plan plan{ ledger_error::none, 0 };

	if (status != completion_status::pending) {
		plan.error = ledger_error::already_finalized;
		return plan;
	}

	if (pool.mode == reward_mode::per_task) {
		plan.payout = task.reward;
	}
	else if (completesBundle && !bundlePaid) {
		plan.payout = pool.bundleReward;
	}

	if (task.completions + 1 > task.maxCompletions
			|| pool.distributed + plan.payout > pool.budget) {
		plan.error = ledger_error::budget_exceeded;
		plan.payout = 0;
	}
	return plan;
} // approval_plan plan_approval

inline void apply_approval(pool_terms& pool, task_terms& task, const approval_plan& plan) {
	task.completions += 1;
	pool.distributed += plan.payout;
}

inline ledger_error check_rejection(completion_status status) {
	return status == completion_status::pending ? ledger_error::none : ledger_error::already_finalized;
}
