// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

void launchfund::withdraw(name caller, uint64_t campaignId, asset quantity) {
	auto config = _settings();
	CHECKC(quantity.symbol == config.nativeSymbol, ledger_error::invalid_amount);
	CHECKC(quantity.amount > 0, ledger_error::invalid_amount);

	_withdraw(caller, campaignId, quantity.amount);

} // void launchfund::withdraw

void launchfund::withdrawms(name caller, uint64_t campaignId) {
	_withdraw(caller, campaignId, 0);

} // void launchfund::withdrawms

// Amounts are valued in native. Stable custody pays first, at its own
// native cost basis, and whatever is left is converted now.
void launchfund::_withdraw(name caller, uint64_t campaignId, int64_t requested) {
  _assertPaused();
	require_auth(caller);

	auto config = _settings();
	auto now = time_ms();

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(caller == campaignItem->creator, ledger_error::unauthorized);

	auto state = roadmap_state{
		campaignItem->raised.amount,
		campaignItem->withdrawn.amount,
		campaignItem->fundingNative.amount + campaignItem->fundingBasis.amount,
		campaignItem->currentMilestone,
		campaignItem->fundingRatio,
		campaignItem->endTimestamp
	};

	auto plan = plan_withdrawal(state, _roadmap(campaignId), now, requested);
	CHECK_OK(plan.error);

	auto custody = split_custody(plan.amount, campaignItem->fundingBasis.amount, campaignItem->fundingStable.amount);

	int64_t converted = 0;
	if (custody.fromNative > 0) {
		auto conversion = plan_withdraw_conversion(custody.fromNative, _readPrice(config), _readPool(config),
			now, unit_of(config.nativeSymbol));
		CHECK_OK(conversion.error);

		converted = conversion.minReturn;
		_swap(config, asset(custody.fromNative, config.nativeSymbol), converted);
	}

	auto paid = asset(custody.stablePaid + converted, config.stableSymbol);
	CHECKC(paid.amount > 0, ledger_error::nothing_to_withdraw);

	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.withdrawn.amount += plan.amount;
		r.fundingBasis.amount -= custody.fromStable;
		r.fundingStable.amount -= custody.stablePaid;
		r.fundingNative.amount -= custody.fromNative;
		r.currentMilestone = plan.nextMilestone;
	});

	_transfer(campaignItem->creator, paid, "LaunchFund: milestone funds", config.stableContract);
	_fundlog(campaignId, campaignItem->creator, asset(plan.amount, config.nativeSymbol), paid, plan.nextMilestone);

} // void launchfund::_withdraw
