// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

pool_terms launchfund::_poolTerms(const airdrop& item) {
	return pool_terms{ (reward_mode)item.mode, item.budget.amount, item.distributed.amount,
		item.bundleReward.amount, item.active, item.endTimestamp };
} // pool_terms _poolTerms

task_terms launchfund::_taskTerms(const tasks& item) {
	return task_terms{ item.type, item.reward.amount, item.maxCompletions, item.completions, item.active };
} // task_terms _taskTerms

void launchfund::newairdrop(name caller, uint64_t campaignId, uint8_t mode, vector<taskInfo> tasks,
		asset budget, asset bundleReward, uint64_t endTimestamp) {

  _assertPaused();
	require_auth(caller);

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(caller == campaignItem->creator, ledger_error::unauthorized);

	CHECKC(!campaignItem->graduated, ledger_error::already_graduated);
	CHECKC(campaignItem->active && campaignItem->supplyReceived, ledger_error::campaign_inactive);
	CHECKC(!campaignItem->hasAirdrop, ledger_error::already_exists);

	auto tokenSymbol = campaignItem->supply.symbol;
	CHECKC(valid_reward_mode(mode), ledger_error::invalid_config);
	CHECKC(budget.symbol == tokenSymbol && bundleReward.symbol == tokenSymbol, ledger_error::invalid_amount);

	vector<task_terms> terms;
	for (auto& task : tasks) {
		CHECKC(task.reward.symbol == tokenSymbol, ledger_error::invalid_amount);
		CHECKC(!task.verificationData.empty(), ledger_error::invalid_config);
		CHECKC(task.verificationData.size() <= MAX_DESCRIPTION_LENGTH, ledger_error::invalid_config);
		terms.push_back(task_terms{ task.type, task.reward.amount, task.maxCompletions, 0, true });
	}

	auto now = time_ms();
	auto pool = pool_terms{ (reward_mode)mode, budget.amount, 0, bundleReward.amount, true, endTimestamp };
	CHECK_OK(validate_pool(pool, terms, now, _tokensAvailable(*campaignItem).amount));

	airdrop_i airdrop(_self, campaignId);
	airdrop.emplace(caller, [&](auto& r) {
		r.mode = mode;
		r.budget = budget;
		r.distributed = asset(0, tokenSymbol);
		r.bundleReward = bundleReward;
		r.active = true;
		r.createdTimestamp = now;
		r.endTimestamp = endTimestamp;
	});

	tasks_i table(_self, campaignId);
	for (auto& task : tasks) {
		table.emplace(caller, [&](auto& r) {
			r.id = table.available_primary_key();
			r.type = task.type;
			r.reward = task.reward;
			r.verificationData = task.verificationData;
			r.maxCompletions = task.maxCompletions;
			r.completions = 0;
			r.active = true;
		});
	}

	// budget leaves the sellable part of the escrow
	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.reserved += budget;
		r.hasAirdrop = true;
	});

} // void launchfund::newairdrop

void launchfund::settask(name caller, uint64_t campaignId, uint64_t taskIndex, bool active) {
  _assertPaused();
	require_auth(caller);

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(caller == campaignItem->creator, ledger_error::unauthorized);

	tasks_i table(_self, campaignId);
	auto taskItem = table.find(taskIndex);
	CHECKC(taskItem != table.end(), ledger_error::task_not_found);

	table.modify(taskItem, same_payer, [&](auto& r) {
		r.active = active;
	});

} // void launchfund::settask

void launchfund::setairdrop(name caller, uint64_t campaignId, bool active) {
  _assertPaused();
	require_auth(caller);

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(caller == campaignItem->creator, ledger_error::unauthorized);

	airdrop_i airdrop(_self, campaignId);
	auto airdropItem = airdrop.find(0);
	CHECKC(airdropItem != airdrop.end(), ledger_error::not_found);

	airdrop.modify(airdropItem, same_payer, [&](auto& r) {
		r.active = active;
	});

} // void launchfund::setairdrop

void launchfund::submittask(name account, uint64_t campaignId, uint64_t taskIndex, string proof) {
  _assertPaused();
	require_auth(account);

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(account != campaignItem->creator, ledger_error::unauthorized);
	CHECKC(!proof.empty() && proof.size() <= MAX_PROOF_LENGTH, ledger_error::invalid_config);

	airdrop_i airdrop(_self, campaignId);
	auto airdropItem = airdrop.find(0);
	CHECKC(airdropItem != airdrop.end(), ledger_error::not_found);

	vector<task_terms> terms;
	tasks_i table(_self, campaignId);
	for (auto& item : table) {
		terms.push_back(_taskTerms(item));
	}

	completions_i completions(_self, campaignId);
	auto index = completions.get_index<"byusertask"_n>();
	auto exists = index.find(((uint128_t)account.value << 64) | taskIndex) != index.end();

	auto now = time_ms();
	CHECK_OK(check_submission(_poolTerms(*airdropItem), terms, taskIndex, exists, now));

	completions.emplace(account, [&](auto& r) {
		r.key = completions.available_primary_key();
		r.account = account;
		r.taskIndex = taskIndex;
		r.status = (uint8_t)completion_status::pending;
		r.proof = proof;
		r.submittedTimestamp = now;
		r.decidedTimestamp = 0;
	});

} // void launchfund::submittask

void launchfund::approvetask(name caller, uint64_t campaignId, name account, uint64_t taskIndex) {
  _assertPaused();
	require_auth(caller);

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(caller == campaignItem->creator, ledger_error::unauthorized);

	airdrop_i airdrop(_self, campaignId);
	auto airdropItem = airdrop.find(0);
	CHECKC(airdropItem != airdrop.end(), ledger_error::not_found);

	tasks_i table(_self, campaignId);
	auto taskItem = table.find(taskIndex);
	CHECKC(taskItem != table.end(), ledger_error::task_not_found);

	completions_i completions(_self, campaignId);
	auto index = completions.get_index<"byusertask"_n>();
	auto completionItem = index.find(((uint128_t)account.value << 64) | taskIndex);
	CHECKC(completionItem != index.end(), ledger_error::not_found);

	// tasks this user already has approved
	vector<task_terms> terms;
	for (auto& item : table) {
		terms.push_back(_taskTerms(item));
	}
	vector<bool> approved(terms.size(), false);
	auto byUser = completions.get_index<"byuser"_n>();
	for (auto item = byUser.find(account.value); item != byUser.end() && item->account == account; item++) {
		if (item->status == (uint8_t)completion_status::approved && item->taskIndex < approved.size()) {
			approved[item->taskIndex] = true;
		}
	}

	holders_i holders(_self, campaignId);
	auto holderItem = holders.find(account.value);
	auto bundlePaid = holderItem != holders.end() && holderItem->bundlePaid;

	auto pool = _poolTerms(*airdropItem);
	auto plan = plan_approval(pool, _taskTerms(*taskItem), (completion_status)completionItem->status,
		completes_bundle(terms, approved, taskIndex), bundlePaid);
	CHECK_OK(plan.error);

	auto now = time_ms();
	auto reward = asset(plan.payout, campaignItem->supply.symbol);

	index.modify(completionItem, same_payer, [&](auto& r) {
		r.status = (uint8_t)completion_status::approved;
		r.decidedTimestamp = now;
	});

	table.modify(taskItem, same_payer, [&](auto& r) {
		r.completions += 1;
	});

	airdrop.modify(airdropItem, same_payer, [&](auto& r) {
		r.distributed += reward;
	});

	if (plan.payout == 0) { return; }

	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.reserved -= reward;
		r.rewarded += reward;
	});

	auto bundle = pool.mode == reward_mode::all_required;
	if (holderItem == holders.end()) {
		holders.emplace(_self, [&](auto& r) {
			r.account = account;
			r.purchased = asset(0, reward.symbol);
			r.rewards = reward;
			r.contributed = asset(0, campaignItem->raised.symbol);
			r.bundlePaid = bundle;
		});
	}
	else {
		holders.modify(holderItem, same_payer, [&](auto& r) {
			r.rewards += reward;
			r.bundlePaid = r.bundlePaid || bundle;
		});
	}

	_transfer(account, reward, "LaunchFund: task reward", campaignItem->tokenContract);

} // void launchfund::approvetask

void launchfund::rejecttask(name caller, uint64_t campaignId, name account, uint64_t taskIndex, string reason) {
  _assertPaused();
	require_auth(caller);

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(caller == campaignItem->creator, ledger_error::unauthorized);
	CHECKC(reason.size() <= MAX_REASON_LENGTH, ledger_error::invalid_config);

	completions_i completions(_self, campaignId);
	auto index = completions.get_index<"byusertask"_n>();
	auto completionItem = index.find(((uint128_t)account.value << 64) | taskIndex);
	CHECKC(completionItem != index.end(), ledger_error::not_found);

	CHECK_OK(check_rejection((completion_status)completionItem->status));

	index.modify(completionItem, same_payer, [&](auto& r) {
		r.status = (uint8_t)completion_status::rejected;
		r.reason = reason;
		r.decidedTimestamp = time_ms();
	});

} // void launchfund::rejecttask
