// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

void launchfund::_transfer(name account, asset quantity, string memo, name contract) {
  _assertPaused();

	action(
		permission_level{ _self, "active"_n },
		contract, "transfer"_n,
		make_tuple(_self, account, quantity, memo)
	).send();
} // void _transfer

void launchfund::_assertPaused() {
  information_i information(_self, _self.value);
  auto infoItem = information.begin();
  if (information.begin() != information.end()) {
    CHECKC(!infoItem->isPaused, ledger_error::campaign_inactive);
  }
} // void _assertPaused

launchfund::settings launchfund::_settings() {
	settings_i config(_self, _self.value);
	auto item = config.find(0);
	CHECKC(item != config.end(), ledger_error::invalid_config);
	return *item;
} // settings _settings

price_reading launchfund::_readPrice(const settings& config) {
	feeds_i feeds(config.oracle, config.oracle.value);
	auto item = feeds.find(config.oracleFeed.raw());

	if (item == feeds.end()) {
		return price_reading{ false, 0, 0 };
	}
	if (item->price > (uint64_t)MAX_AMOUNT) {
		return price_reading{ false, 0, item->timestamp };
	}
	return price_reading{ true, (int64_t)item->price, item->timestamp };
} // price_reading _readPrice

pool_reading launchfund::_readPool(const settings& config) {
	markets_i markets(config.swapRouter, config.swapRouter.value);
	auto item = markets.find(config.swapPair.raw());

	if (item == markets.end()) {
		return pool_reading{ false, 0, 0 };
	}

	// connectors can be listed either way round
	auto base = item->base.balance;
	auto quote = item->quote.balance;
	if (base.symbol == config.nativeSymbol && quote.symbol == config.stableSymbol) {
		return pool_reading{ true, base.amount, quote.amount };
	}
	if (base.symbol == config.stableSymbol && quote.symbol == config.nativeSymbol) {
		return pool_reading{ true, quote.amount, base.amount };
	}
	return pool_reading{ false, 0, 0 };
} // pool_reading _readPool

// router pays the stable side back to us within the same transaction
void launchfund::_swap(const settings& config, asset native, int64_t minReturn) {
	auto memo = "swap," + to_string(minReturn) + "," + config.swapPair.code().to_string();
	_transfer(config.swapRouter, native, memo, config.nativeContract);
} // void _swap

vector<milestone_terms> launchfund::_roadmap(uint64_t campaignId) {
	milestones_i milestones(_self, campaignId);
	vector<milestone_terms> terms;
	for (auto& item : milestones) {
		terms.push_back(milestone_terms{ item.requiredAmount.amount, item.unlockTimestamp });
	}
	return terms;
} // vector<milestone_terms> _roadmap

asset launchfund::_tokensAvailable(const campaigns& campaignItem) {
	return campaignItem.supply - campaignItem.distributed - campaignItem.reserved - campaignItem.rewarded;
} // asset _tokensAvailable

// an unusable feed is an error here, graduation has no fallback path
graduation_snapshot launchfund::_graduation(const campaigns& campaignItem, const settings& config) {
	auto feed = _readPrice(config);
	CHECK_OK(check_feed(feed));
	CHECKC(is_fresh(feed, time_ms()), ledger_error::price_feed_error);

	auto nativeUnit = unit_of(config.nativeSymbol);
	auto tokenUnit = unit_of(campaignItem.supply.symbol);
	auto usdPerNative = (double)feed.price / (double)unit_of(config.stableSymbol);

	auto marketCap = market_cap_usd(campaignItem.raised.amount, campaignItem.distributed.amount,
		campaignItem.supply.amount, usdPerNative, nativeUnit, tokenUnit);

	return evaluate_graduation(marketCap, campaignItem.raised.amount, default_graduation_terms(nativeUnit));
} // graduation_snapshot _graduation

void launchfund::_tradelog(uint64_t campaignId, name account, string side, asset native, asset tokens, double price) {
	action(
		permission_level{ _self, "active"_n },
		_self, "tradelog"_n,
		make_tuple(campaignId, account, side, native, tokens, price)
	).send();
} // void _tradelog

void launchfund::_fundlog(uint64_t campaignId, name creator, asset native, asset paid, uint64_t milestone) {
	action(
		permission_level{ _self, "active"_n },
		_self, "fundlog"_n,
		make_tuple(campaignId, creator, native, paid, milestone)
	).send();
} // void _fundlog

void launchfund::_gradlog(uint64_t campaignId, symbol_code poolId, asset native, asset tokens, asset fee) {
	action(
		permission_level{ _self, "active"_n },
		_self, "gradlog"_n,
		make_tuple(campaignId, poolId, native, tokens, fee)
	).send();
} // void _gradlog
