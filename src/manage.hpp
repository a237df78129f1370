// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

void launchfund::init(name nativeContract, symbol nativeSymbol, name stableContract, symbol stableSymbol,
		name swapRouter, symbol swapPair, name oracle, symbol_code oracleFeed, name dex, name feeAccount) {

  require_auth(_self);

	CHECKC(nativeSymbol.is_valid() && stableSymbol.is_valid(), ledger_error::invalid_config);
	CHECKC(swapPair.is_valid() && oracleFeed.is_valid(), ledger_error::invalid_config);
	CHECKC(nativeSymbol != stableSymbol, ledger_error::invalid_config);

	for (auto account : { nativeContract, stableContract, swapRouter, oracle, dex, feeAccount }) {
		CHECKC(is_account(account), ledger_error::invalid_config);
	}

	settings_i config(_self, _self.value);
	auto item = config.find(0);

	// symbols are baked into every campaign row
	if (item != config.end()) {
		CHECKC(item->nativeSymbol == nativeSymbol && item->stableSymbol == stableSymbol,
			ledger_error::invalid_config);
	}

	auto fill = [&](auto& r) {
		r.nativeContract = nativeContract;
		r.nativeSymbol = nativeSymbol;
		r.stableContract = stableContract;
		r.stableSymbol = stableSymbol;
		r.swapRouter = swapRouter;
		r.swapPair = swapPair;
		r.oracle = oracle;
		r.oracleFeed = oracleFeed;
		r.dex = dex;
		r.feeAccount = feeAccount;
	};

	if (item == config.end()) {
		config.emplace(_self, fill);
	}
	else {
		config.modify(item, same_payer, fill);
	}

} // void init

void launchfund::pause(bool value) {
  require_auth(_self);

	information_i information(_self, _self.value);
	auto infoItem = information.begin();

	if (information.begin() == information.end()) {
	  information.emplace(_self, [&](auto& r) {
	    r.campaignsCount = 0;
	    r.isPaused = value;
	  });
	}
	else {
	  eosio_assert(infoItem->isPaused != value, "contract is already in this state");
	  information.modify(information.begin(), same_payer, [&](auto& r) {
	    r.isPaused = value;
	  });
	}
} // void pause

void launchfund::claimfees(uint64_t campaignId) {
  _assertPaused();
	auto config = _settings();
	require_auth(config.feeAccount);

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(campaignItem->platformFee.amount > 0, ledger_error::nothing_to_withdraw);

	auto fee = campaignItem->platformFee;
	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.platformFee.amount = 0;
	});

	_transfer(config.feeAccount, fee, "LaunchFund: platform fee", config.nativeContract);

} // void claimfees

void launchfund::tradelog(uint64_t campaignId, name account, string side, asset native, asset tokens, double price) {
	require_auth(_self);
} // void tradelog

void launchfund::fundlog(uint64_t campaignId, name creator, asset native, asset paid, uint64_t milestone) {
	require_auth(_self);
} // void fundlog

void launchfund::gradlog(uint64_t campaignId, symbol_code poolId, asset native, asset tokens, asset fee) {
	require_auth(_self);
} // void gradlog
