// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

void launchfund::transfer(name from, name to, asset quantity, string memo) {
	if (to != _self || from == _self) { return; }

	auto config = _settings();

	// stable coming back from a conversion
	if (from == config.swapRouter) { return; }

	_assertPaused();
	require_auth(from);

	// check transfer
	CHECKC(quantity.symbol.is_valid(), ledger_error::invalid_amount);
	CHECKC(quantity.amount > 0, ledger_error::invalid_amount);

	string kind;
	uint64_t campaignId = 0;
	eosio_assert(parse_memo(memo, kind, campaignId), "incorrectly formatted memo");

	// fetch campaign
	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);

	auto code = name(get_code());

	// creator is putting the supply in escrow
	if (kind == "supply") {
		eosio_assert(code == campaignItem->tokenContract, "you have to use the contract specified");
		_supply(from, *campaignItem, quantity);
	}

	// contributor is buying
	else if (kind == "buy") {
		eosio_assert(code == config.nativeContract, "you have to use the native token contract");
		CHECKC(quantity.symbol == config.nativeSymbol, ledger_error::invalid_amount);
		_buy(from, campaignId, quantity);
	}

	// holder is selling back to the curve
	else if (kind == "sell") {
		eosio_assert(code == campaignItem->tokenContract, "you have to use the campaign token contract");
		CHECKC(quantity.symbol == campaignItem->supply.symbol, ledger_error::invalid_amount);
		_sell(from, campaignId, quantity);
	}

	else {
		eosio_assert(false, "incorrectly formatted memo");
	}

} // void launchfund::transfer

void launchfund::_supply(name from, const campaigns& campaignItem, asset quantity) {
	CHECKC(from == campaignItem.creator, ledger_error::unauthorized);
	CHECKC(!campaignItem.supplyReceived, ledger_error::already_exists);
	CHECKC(campaignItem.active, ledger_error::campaign_inactive);
	CHECKC(quantity == campaignItem.supply, ledger_error::invalid_amount);

	campaigns_i campaigns(_self, _self.value);
	campaigns.modify(campaigns.find(campaignItem.campaignId), same_payer, [&](auto& r) {
		r.supplyReceived = true;
	});

} // void _supply
