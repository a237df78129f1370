// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

void launchfund::evalgrad(uint64_t campaignId) {
	auto config = _settings();

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);

	auto snapshot = _graduation(*campaignItem, config);

	PRINT("eligible", snapshot.eligible);
	PRINT("graduated", campaignItem->graduated);
	PRINT("progress", snapshot.progress);
	PRINT("marketCapUsd", snapshot.marketCapUsd);
	PRINT("liquidity", asset(snapshot.liquidity, config.nativeSymbol));
	PRINT("missingMarketCap", snapshot.missingMarketCap);
	PRINT("missingLiquidity", asset(snapshot.missingLiquidity, config.nativeSymbol));

} // void launchfund::evalgrad

void launchfund::graduate(name executor, uint64_t campaignId) {
  _assertPaused();
	require_auth(executor);

	auto config = _settings();

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(!campaignItem->graduated, ledger_error::already_graduated);

	// eligibility is checked again, whatever an earlier evalgrad said
	auto snapshot = _graduation(*campaignItem, config);

	auto plan = plan_graduation(snapshot, campaignItem->graduated,
		campaignItem->liquidityReserve.amount, campaignItem->tradingPool.amount,
		_tokensAvailable(*campaignItem).amount,
		campaignItem->raised.amount, campaignItem->distributed.amount,
		unit_of(config.nativeSymbol), unit_of(campaignItem->supply.symbol));
	CHECK_OK(plan.error);

	auto native = asset(plan.poolNative, config.nativeSymbol);
	auto tokens = asset(plan.poolTokens, campaignItem->supply.symbol);
	auto fee = asset(plan.fee, config.nativeSymbol);
	auto poolId = campaignItem->supply.symbol.code();

	// unsold tokens that are not seeded go back to the creator
	auto unsold = _tokensAvailable(*campaignItem) - tokens;

	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.platformFee += fee;
		r.liquidityReserve.amount = 0;
		r.tradingPool.amount = 0;
		r.graduated = true;
		r.poolId = poolId;
	});

	auto memo = "liquidity," + to_string(campaignId) + "," + to_string(LIQUIDITY_LOCK_DAYS);
	_transfer(config.dex, native, memo, config.nativeContract);
	_transfer(config.dex, tokens, memo, campaignItem->tokenContract);

	if (unsold.amount > 0) {
		_transfer(campaignItem->creator, unsold, "LaunchFund: unsold tokens return", campaignItem->tokenContract);
	}

	_gradlog(campaignId, poolId, native, tokens, fee);

} // void launchfund::graduate
