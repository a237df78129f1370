// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#include "airdrop.hpp"

#include <boost/test/unit_test.hpp>

namespace {

const uint64_t NOW = 50'000;

pool_terms per_task_pool() {
	return pool_terms{ reward_mode::per_task, 100, 0, 0, true, NOW + DAY };
}

std::vector<task_terms> three_tasks() {
	return {
		{ (uint8_t)task_type::twitter_follow, 10, 5, 0, true },
		{ (uint8_t)task_type::discord_join, 20, 2, 0, true },
		{ (uint8_t)task_type::custom, 30, 1, 0, true }
	};
}

}

BOOST_AUTO_TEST_SUITE(airdrop_tests)

BOOST_AUTO_TEST_CASE(pool_validation)
{
	auto pool = per_task_pool();
	auto tasks = three_tasks();
	BOOST_CHECK(validate_pool(pool, tasks, NOW, 1'000) == ledger_error::none);

	BOOST_CHECK(validate_pool(pool, {}, NOW, 1'000) == ledger_error::invalid_config);
	BOOST_CHECK(validate_pool(pool, tasks, NOW, 99) == ledger_error::insufficient_liquidity);
	BOOST_CHECK(validate_pool(pool, tasks, NOW + DAY, 1'000) == ledger_error::invalid_config);

	auto expensive = tasks;
	expensive[1].reward = 101;
	BOOST_CHECK(validate_pool(pool, expensive, NOW, 1'000) == ledger_error::invalid_amount);

	auto uncapped = tasks;
	uncapped[0].maxCompletions = 0;
	BOOST_CHECK(validate_pool(pool, uncapped, NOW, 1'000) == ledger_error::invalid_config);

	auto unknown = tasks;
	unknown[2].type = 11;
	BOOST_CHECK(validate_pool(pool, unknown, NOW, 1'000) == ledger_error::invalid_config);

	auto bundle = pool;
	bundle.mode = reward_mode::all_required;
	BOOST_CHECK(validate_pool(bundle, tasks, NOW, 1'000) == ledger_error::invalid_amount);
	bundle.bundleReward = 50;
	BOOST_CHECK(validate_pool(bundle, tasks, NOW, 1'000) == ledger_error::none);
}

BOOST_AUTO_TEST_CASE(duplicate_submission_fails)
{
	auto pool = per_task_pool();
	auto tasks = three_tasks();

	BOOST_CHECK(check_submission(pool, tasks, 1, false, NOW) == ledger_error::none);
	BOOST_CHECK(check_submission(pool, tasks, 1, true, NOW) == ledger_error::already_exists);
}

BOOST_AUTO_TEST_CASE(submission_needs_live_task)
{
	auto pool = per_task_pool();
	auto tasks = three_tasks();

	BOOST_CHECK(check_submission(pool, tasks, 3, false, NOW) == ledger_error::task_not_found);

	tasks[2].active = false;
	BOOST_CHECK(check_submission(pool, tasks, 2, false, NOW) == ledger_error::task_not_found);

	BOOST_CHECK(check_submission(pool, tasks, 0, false, NOW + DAY + 1) == ledger_error::campaign_inactive);

	pool.active = false;
	BOOST_CHECK(check_submission(pool, tasks, 0, false, NOW) == ledger_error::campaign_inactive);
}

BOOST_AUTO_TEST_CASE(per_task_approval_pays_reward)
{
	auto pool = per_task_pool();
	auto tasks = three_tasks();

	auto plan = plan_approval(pool, tasks[1], completion_status::pending, false, false);
	BOOST_REQUIRE(plan.error == ledger_error::none);
	BOOST_CHECK_EQUAL(plan.payout, 20);

	apply_approval(pool, tasks[1], plan);
	BOOST_CHECK_EQUAL(pool.distributed, 20);
	BOOST_CHECK_EQUAL(tasks[1].completions, 1u);
}

BOOST_AUTO_TEST_CASE(approval_beyond_budget_leaves_counters)
{
	auto pool = per_task_pool();
	auto tasks = three_tasks();
	pool.distributed = 80;

	auto plan = plan_approval(pool, tasks[2], completion_status::pending, false, false);
	BOOST_CHECK(plan.error == ledger_error::budget_exceeded);
	BOOST_CHECK_EQUAL(plan.payout, 0);
	BOOST_CHECK_EQUAL(pool.distributed, 80);
	BOOST_CHECK_EQUAL(tasks[2].completions, 0u);
}

BOOST_AUTO_TEST_CASE(approval_beyond_max_completions_fails)
{
	auto pool = per_task_pool();
	auto tasks = three_tasks();

	for (int i = 0; i < 2; ++i) {
		auto plan = plan_approval(pool, tasks[1], completion_status::pending, false, false);
		BOOST_REQUIRE(plan.error == ledger_error::none);
		apply_approval(pool, tasks[1], plan);
	}

	auto plan = plan_approval(pool, tasks[1], completion_status::pending, false, false);
	BOOST_CHECK(plan.error == ledger_error::budget_exceeded);
	BOOST_CHECK_EQUAL(tasks[1].completions, 2u);
	BOOST_CHECK_EQUAL(pool.distributed, 40);
}

BOOST_AUTO_TEST_CASE(sequential_approvals_stop_at_budget)
{
	auto pool = per_task_pool();
	auto tasks = three_tasks();

	// ten users on task 0: the budget of 100 covers five of them, the cap stops at five too
	int approved = 0;
	for (int user = 0; user < 10; ++user) {
		auto plan = plan_approval(pool, tasks[0], completion_status::pending, false, false);
		if (plan.error != ledger_error::none) {
			BOOST_CHECK(plan.error == ledger_error::budget_exceeded);
			continue;
		}
		apply_approval(pool, tasks[0], plan);
		++approved;
	}

	BOOST_CHECK_EQUAL(approved, 5);
	BOOST_CHECK_EQUAL(pool.distributed, 50);
	BOOST_CHECK_LE(pool.distributed, pool.budget);
}

BOOST_AUTO_TEST_CASE(finalized_completion_cannot_change)
{
	auto pool = per_task_pool();
	auto tasks = three_tasks();

	BOOST_CHECK(plan_approval(pool, tasks[0], completion_status::approved, false, false).error
		== ledger_error::already_finalized);
	BOOST_CHECK(plan_approval(pool, tasks[0], completion_status::rejected, false, false).error
		== ledger_error::already_finalized);

	BOOST_CHECK(check_rejection(completion_status::pending) == ledger_error::none);
	BOOST_CHECK(check_rejection(completion_status::approved) == ledger_error::already_finalized);
	BOOST_CHECK(check_rejection(completion_status::rejected) == ledger_error::already_finalized);
}

BOOST_AUTO_TEST_CASE(all_required_pays_bundle_once)
{
	auto pool = per_task_pool();
	pool.mode = reward_mode::all_required;
	pool.bundleReward = 60;
	auto tasks = three_tasks();

	std::vector<bool> approved{ true, false, false };
	BOOST_CHECK(!completes_bundle(tasks, approved, 1));

	auto partial = plan_approval(pool, tasks[1], completion_status::pending, false, false);
	BOOST_CHECK(partial.error == ledger_error::none);
	BOOST_CHECK_EQUAL(partial.payout, 0);

	approved[1] = true;
	BOOST_CHECK(completes_bundle(tasks, approved, 2));

	auto last = plan_approval(pool, tasks[2], completion_status::pending, true, false);
	BOOST_CHECK_EQUAL(last.payout, 60);

	auto repeat = plan_approval(pool, tasks[2], completion_status::pending, true, true);
	BOOST_CHECK_EQUAL(repeat.payout, 0);
}

BOOST_AUTO_TEST_CASE(inactive_tasks_are_not_required)
{
	auto tasks = three_tasks();
	tasks[2].active = false;

	std::vector<bool> approved{ true, false, false };
	BOOST_CHECK(completes_bundle(tasks, approved, 1));
}

BOOST_AUTO_TEST_SUITE_END()
