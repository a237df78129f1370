// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <cstdint>
#include <vector>

#include "constants.hpp"
#include "errors.hpp"

struct milestone_terms {
	int64_t required;   // cumulative raised amount
	uint64_t unlockAt;  // ms
};

struct roadmap_state {
	int64_t raised;
	int64_t withdrawn;
	int64_t backed;     // what the funding pool actually holds, valued in native
	uint64_t current;
	uint64_t fundingRatio;
	uint64_t endAt;
};

struct withdrawal_plan {
	ledger_error error;
	int64_t amount;
	uint64_t nextMilestone;
};

// how a withdrawal valued in native is drawn from the funding pool
struct custody_split {
	int64_t fromStable;  // native basis released from stable custody
	int64_t stablePaid;  // stable handed out for that basis
	int64_t fromNative;  // native that still has to be converted
};

inline ledger_error validate_schedule(const std::vector<milestone_terms>& milestones) {
	if (milestones.empty() || milestones.size() > MAX_MILESTONES) {
		return ledger_error::invalid_schedule;
	}

	int64_t previous = 0;
	for (auto& milestone : milestones) {
		if (milestone.required <= previous) {
			return ledger_error::invalid_schedule;
		}
		previous = milestone.required;
	}
	return ledger_error::none;
}

// requested == 0 draws everything available for the current milestone
inline withdrawal_plan plan_withdrawal(const roadmap_state& state,
		const std::vector<milestone_terms>& milestones, uint64_t now, int64_t requested) {

	withdrawal_plan plan{ ledger_error::none, 0, state.current };

	if (requested < 0) {
		plan.error = ledger_error::invalid_amount;
		return plan;
	}

	// fully withdrawn
	if (state.current >= milestones.size()) {
		plan.error = ledger_error::nothing_to_withdraw;
		return plan;
	}

	auto& milestone = milestones[state.current];
	if (now < milestone.unlockAt) {
		plan.error = ledger_error::milestone_locked;
		return plan;
	}

	auto reached = state.raised >= milestone.required;
	if (!reached && now < state.endAt) {
		plan.error = ledger_error::nothing_to_withdraw;
		return plan;
	}

	auto cumulative = reached ? milestone.required : state.raised;
	auto allowed = (int64_t)((__int128)cumulative * state.fundingRatio / 100);
	auto available = allowed - state.withdrawn;
	if (available > state.backed) {
		available = state.backed;
	}

	if (available <= 0) {
		plan.error = ledger_error::nothing_to_withdraw;
		return plan;
	}
	if (requested > available) {
		plan.error = ledger_error::insufficient_liquidity;
		return plan;
	}

	plan.amount = requested == 0 ? available : requested;
	if (reached && plan.amount == available) {
		plan.nextMilestone = state.current + 1;
	}
	return plan;
} // withdrawal_plan plan_withdrawal

inline void apply_withdrawal(roadmap_state& state, const withdrawal_plan& plan) {
	state.withdrawn += plan.amount;
	state.backed -= plan.amount;
	state.current = plan.nextMilestone;
}

// Stable custody pays first, pro rata to the native it was bought with.
inline custody_split split_custody(int64_t amount, int64_t basis, int64_t stable) {
	custody_split split{ 0, 0, 0 };
	if (amount <= 0) {
		return split;
	}

	if (basis > 0) {
		split.fromStable = amount < basis ? amount : basis;
		split.stablePaid = (int64_t)((__int128)stable * split.fromStable / basis);
	}
	split.fromNative = amount - split.fromStable;
	return split;
} // custody_split split_custody
