// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

void launchfund::newcampaign(name creator, string campaignName, string description, asset target,
		uint64_t endTimestamp, vector<milestoneInfo> milestones, uint64_t fundingRatio,
		uint8_t conversionStrategy, name tokenContract, asset supply) {

  _assertPaused();
	require_auth(creator);

	auto config = _settings();
	auto now = time_ms();

	CHECKC(!campaignName.empty() && campaignName.size() <= MAX_NAME_LENGTH, ledger_error::invalid_config);
	CHECKC(description.size() <= MAX_DESCRIPTION_LENGTH, ledger_error::invalid_config);

	CHECKC(target.symbol == config.nativeSymbol, ledger_error::invalid_config);
	CHECKC(target.is_valid() && target.amount > 0, ledger_error::invalid_amount);

	CHECKC(is_account(tokenContract), ledger_error::invalid_config);
	CHECKC(supply.symbol.is_valid(), ledger_error::invalid_config);
	CHECKC(supply.symbol != config.nativeSymbol && supply.symbol != config.stableSymbol,
		ledger_error::invalid_config);
	CHECKC(supply.is_valid() && supply.amount > 0, ledger_error::invalid_amount);

	CHECKC(fundingRatio <= 100, ledger_error::invalid_config);
	CHECKC(valid_strategy(conversionStrategy), ledger_error::invalid_config);

	CHECKC(endTimestamp > now, ledger_error::invalid_config);
	CHECKC(endTimestamp - now >= MIN_CAMPAIGN_DURATION, ledger_error::invalid_config);
	CHECKC(endTimestamp - now <= MAX_CAMPAIGN_DURATION, ledger_error::invalid_config);

	vector<milestone_terms> terms;
	for (auto& milestone : milestones) {
		CHECKC(milestone.requiredAmount.symbol == config.nativeSymbol, ledger_error::invalid_schedule);
		CHECKC(milestone.title.size() <= MAX_NAME_LENGTH, ledger_error::invalid_config);
		CHECKC(milestone.description.size() <= MAX_DESCRIPTION_LENGTH, ledger_error::invalid_config);
		terms.push_back(milestone_terms{ milestone.requiredAmount.amount, milestone.unlockTimestamp });
	}
	CHECK_OK(validate_schedule(terms));

	// one active campaign per creator and name
	campaigns_i campaigns(_self, _self.value);
	auto identityKey = campaign_key(creator.value, campaignName);
	auto identityIndex = campaigns.get_index<"byidentity"_n>();
	auto item = identityIndex.lower_bound(identityKey);

	while (item != identityIndex.end() && item->identityKey == identityKey) {
		CHECKC(!(item->active && item->creator == creator && item->campaignName == campaignName),
			ledger_error::already_exists);
		item++;
	}

	auto campaignId = campaigns.available_primary_key();
	auto native = [&](int64_t amount) { return asset(amount, config.nativeSymbol); };
	auto tokens = [&](int64_t amount) { return asset(amount, supply.symbol); };

	campaigns.emplace(creator, [&](auto& r) {
		r.campaignId = campaignId;
		r.creator = creator;
		r.campaignName = campaignName;
		r.description = description;
		r.identityKey = identityKey;
		r.createdTimestamp = now;
		r.endTimestamp = endTimestamp;

		r.tokenContract = tokenContract;
		r.supply = supply;
		r.supplyReceived = false;
		r.distributed = tokens(0);
		r.reserved = tokens(0);
		r.rewarded = tokens(0);

		r.target = target;
		r.raised = native(0);
		r.fundingRatio = fundingRatio;
		r.liquidityRatio = 100 - fundingRatio;
		r.conversionStrategy = conversionStrategy;

		r.fundingNative = native(0);
		r.fundingStable = asset(0, config.stableSymbol);
		r.fundingBasis = native(0);
		r.liquidityReserve = native(0);
		r.tradingPool = native(0);
		r.platformFee = native(0);

		r.withdrawn = native(0);
		r.currentMilestone = 0;
		r.milestonesCount = milestones.size();
		r.lastPrice = spot_price(0, unit_of(config.nativeSymbol));

		r.active = true;
		r.graduated = false;
		r.poolId = symbol_code();
		r.hasAirdrop = false;
	});

	// save milestones
	milestones_i table(_self, campaignId);
	for (auto& milestone : milestones) {
		table.emplace(creator, [&](auto& r) {
			r.id = table.available_primary_key();
			r.title = milestone.title;
			r.description = milestone.description;
			r.requiredAmount = milestone.requiredAmount;
			r.unlockTimestamp = milestone.unlockTimestamp;
		});
	}

	// update campaigns count
	information_i information(_self, _self.value);
	if (information.begin() == information.end()) {
	  information.emplace(_self, [&](auto& r) {
	    r.campaignsCount = 1;
	    r.isPaused = false;
	  });
	}
	else {
	  information.modify(information.begin(), same_payer, [&](auto& r) {
	    r.campaignsCount += 1;
	  });
	}

	PRINT("campaignId", campaignId);

} // void launchfund::newcampaign

void launchfund::close(name caller, uint64_t campaignId) {
  _assertPaused();
	require_auth(caller);

	campaigns_i campaigns(_self, _self.value);
	auto campaignItem = campaigns.find(campaignId);
	CHECKC(campaignItem != campaigns.end(), ledger_error::not_found);
	CHECKC(caller == campaignItem->creator, ledger_error::unauthorized);
	CHECKC(campaignItem->active, ledger_error::campaign_inactive);

	// the name becomes free, escrow and pools stay for sells and withdrawals
	campaigns.modify(campaignItem, same_payer, [&](auto& r) {
		r.active = false;
	});

} // void launchfund::close
