// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

void launchfund::_buy(name buyer, uint64_t campaignId, asset quantity) {
	auto config = _settings();
	auto now = time_ms();

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);

	CHECKC(!campaignItem->graduated, ledger_error::already_graduated);
	CHECKC(campaignItem->active, ledger_error::campaign_inactive);
	CHECKC(campaignItem->supplyReceived, ledger_error::campaign_inactive);
	CHECKC(now < campaignItem->endTimestamp, ledger_error::campaign_inactive);

	auto nativeUnit = unit_of(config.nativeSymbol);
	auto tokenUnit = unit_of(campaignItem->supply.symbol);

	auto purchase = quote_purchase(quantity.amount, campaignItem->raised.amount, nativeUnit, tokenUnit);
	CHECK_OK(purchase.error);

	auto tokens = asset(purchase.tokens, campaignItem->supply.symbol);
	CHECKC(tokens <= _tokensAvailable(*campaignItem), ledger_error::insufficient_liquidity);

	auto split = split_purchase(quantity.amount, campaignItem->fundingRatio);
	CHECK_OK(split.error);

	// only the creator bucket is converted, the oracle is read only when needed
	auto strategy = (conversion_strategy)campaignItem->conversionStrategy;
	auto conversion = conversion_plan{ ledger_error::none, 0, 0, 0, split.creator, false };
	if (purchase_share(split.creator, strategy) > 0) {
		conversion = plan_purchase_conversion(split.creator, strategy,
			_readPrice(config), _readPool(config), now, nativeUnit);
		CHECK_OK(conversion.error);
	}

	if (conversion.fellBack) {
		PRINT_("conversion deferred");
	}
	if (conversion.convert > 0) {
		_swap(config, asset(conversion.convert, config.nativeSymbol), conversion.minReturn);
	}

	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.raised.amount += quantity.amount;
		r.distributed += tokens;
		r.fundingNative.amount += conversion.keep;
		r.fundingStable.amount += conversion.minReturn;
		r.fundingBasis.amount += conversion.convert;
		r.liquidityReserve.amount += split.liquidity;
		r.tradingPool.amount += split.trading;
		r.platformFee.amount += split.fee;
		r.lastPrice = purchase.price;
	});

	// upsert holder
	holders_i holders(_self, campaignId);
	auto holderItem = holders.find(buyer.value);
	if (holderItem == holders.end()) {
		holders.emplace(_self, [&](auto& r) {
			r.account = buyer;
			r.purchased = tokens;
			r.rewards = asset(0, tokens.symbol);
			r.contributed = quantity;
			r.bundlePaid = false;
		});
	}
	else {
		holders.modify(holderItem, same_payer, [&](auto& r) {
			r.purchased += tokens;
			r.contributed += quantity;
		});
	}

	_transfer(buyer, tokens, "LaunchFund: tokens purchase", campaignItem->tokenContract);
	_tradelog(campaignId, buyer, "buy", quantity, tokens, purchase.price);

} // void launchfund::_buy

void launchfund::_sell(name seller, uint64_t campaignId, asset quantity) {
	auto config = _settings();

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);

	CHECKC(!campaignItem->graduated, ledger_error::already_graduated);
	CHECKC(campaignItem->supplyReceived, ledger_error::campaign_inactive);

	// only tokens bought through the curve can be sold back
	holders_i holders(_self, campaignId);
	auto holderItem = holders.find(seller.value);
	CHECKC(holderItem != holders.end(), ledger_error::insufficient_balance);
	CHECKC(holderItem->purchased >= quantity, ledger_error::insufficient_balance);

	auto state = sale_state{
		campaignItem->raised.amount,
		campaignItem->distributed.amount,
		campaignItem->tradingPool.amount,
		campaignItem->withdrawn.amount,
		campaignItem->fundingRatio
	};

	auto nativeUnit = unit_of(config.nativeSymbol);
	auto tokenUnit = unit_of(campaignItem->supply.symbol);

	auto sale = quote_sale(quantity.amount, state, nativeUnit, tokenUnit);
	CHECK_OK(sale.error);

	auto price = ((double)sale.gross / (double)nativeUnit) / ((double)quantity.amount / (double)tokenUnit);

	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.raised.amount -= sale.gross;
		r.distributed -= quantity;
		r.tradingPool.amount -= sale.gross;
		r.platformFee.amount += sale.fee;
		r.lastPrice = price;
	});

	holders.modify(holderItem, same_payer, [&](auto& r) {
		r.purchased -= quantity;
	});

	auto payout = asset(sale.net, config.nativeSymbol);
	_transfer(seller, payout, "LaunchFund: tokens sale", config.nativeContract);
	_tradelog(campaignId, seller, "sell", payout, quantity, price);

} // void launchfund::_sell

void launchfund::getprice(uint64_t campaignId) {
	auto config = _settings();

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);

	auto nativeUnit = unit_of(config.nativeSymbol);
	auto tokenUnit = unit_of(campaignItem->supply.symbol);
	auto raised = campaignItem->raised.amount;

	PRINT("campaignId", campaignId);
	PRINT("rate", curve_rate(raised, nativeUnit));
	PRINT("price", spot_price(raised, nativeUnit));
	PRINT("average", average_price(raised, campaignItem->distributed.amount, nativeUnit, tokenUnit));
	PRINT("last", campaignItem->lastPrice);
	PRINT("raised", campaignItem->raised);
	PRINT("distributed", campaignItem->distributed);

} // void launchfund::getprice

// preview of a purchase, same formulas as a buy
void launchfund::quote(uint64_t campaignId, asset quantity) {
	auto config = _settings();
	CHECKC(quantity.symbol == config.nativeSymbol, ledger_error::invalid_amount);

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(!campaignItem->graduated, ledger_error::already_graduated);

	auto nativeUnit = unit_of(config.nativeSymbol);
	auto tokenUnit = unit_of(campaignItem->supply.symbol);

	auto purchase = quote_purchase(quantity.amount, campaignItem->raised.amount, nativeUnit, tokenUnit);
	CHECK_OK(purchase.error);

	auto split = split_purchase(quantity.amount, campaignItem->fundingRatio);
	CHECK_OK(split.error);

	auto native = [&](int64_t amount) { return asset(amount, config.nativeSymbol); };

	PRINT("tokens", asset(purchase.tokens, campaignItem->supply.symbol));
	PRINT("rate", purchase.rate);
	PRINT("price", purchase.price);
	PRINT("creator", native(split.creator));
	PRINT("liquidity", native(split.liquidity));
	PRINT("trading", native(split.trading));
	PRINT("fee", native(split.fee));

} // void launchfund::quote
