// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#include <eosiolib/asset.hpp>

#include "constants.hpp"
#include "errors.hpp"
#include "identity.hpp"
#include "curve.hpp"
#include "allocation.hpp"
#include "conversion.hpp"
#include "roadmap.hpp"
#include "airdrop.hpp"
#include "graduation.hpp"
#include "methods.hpp"

using namespace eosio;
using namespace std;

CONTRACT launchfund : public contract {

public:
	using contract::contract;

	launchfund(name receiver, name code, datastream<const char*> ds)
		: contract(receiver, code, ds) {}

	struct milestoneInfo { string title; string description; asset requiredAmount; uint64_t unlockTimestamp; };

	struct taskInfo { uint8_t type; asset reward; string verificationData; uint64_t maxCompletions; };

	void transfer(name from, name to, asset quantity, string memo);

	ACTION init(name nativeContract, symbol nativeSymbol, name stableContract, symbol stableSymbol,
		name swapRouter, symbol swapPair, name oracle, symbol_code oracleFeed, name dex, name feeAccount);

	ACTION pause(bool value);

	ACTION newcampaign(name creator, string campaignName, string description, asset target,
		uint64_t endTimestamp, vector<milestoneInfo> milestones, uint64_t fundingRatio,
		uint8_t conversionStrategy, name tokenContract, asset supply);

	ACTION close(name caller, uint64_t campaignId);
	ACTION withdraw(name caller, uint64_t campaignId, asset quantity);
	ACTION withdrawms(name caller, uint64_t campaignId);
	ACTION getprice(uint64_t campaignId);
	ACTION quote(uint64_t campaignId, asset quantity);

	ACTION newairdrop(name caller, uint64_t campaignId, uint8_t mode, vector<taskInfo> tasks,
		asset budget, asset bundleReward, uint64_t endTimestamp);
	ACTION settask(name caller, uint64_t campaignId, uint64_t taskIndex, bool active);
	ACTION setairdrop(name caller, uint64_t campaignId, bool active);
	ACTION submittask(name account, uint64_t campaignId, uint64_t taskIndex, string proof);
	ACTION approvetask(name caller, uint64_t campaignId, name account, uint64_t taskIndex);
	ACTION rejecttask(name caller, uint64_t campaignId, name account, uint64_t taskIndex, string reason);

	ACTION evalgrad(uint64_t campaignId);
	ACTION graduate(name executor, uint64_t campaignId);
	ACTION claimfees(uint64_t campaignId);

	// receipts
	ACTION tradelog(uint64_t campaignId, name account, string side, asset native, asset tokens, double price);
	ACTION fundlog(uint64_t campaignId, name creator, asset native, asset paid, uint64_t milestone);
	ACTION gradlog(uint64_t campaignId, symbol_code poolId, asset native, asset tokens, asset fee);

private:

	// structs

	TABLE information {
		uint64_t campaignsCount;
		bool isPaused;

		uint64_t primary_key() const { return 0; }
	};

	TABLE settings {
		name nativeContract;
		symbol nativeSymbol;
		name stableContract;
		symbol stableSymbol;
		name swapRouter;
		symbol swapPair;
		name oracle;
		symbol_code oracleFeed;
		name dex;
		name feeAccount;

		uint64_t primary_key() const { return 0; }
	};

	TABLE campaigns {
		uint64_t campaignId;
		name creator;
		string campaignName;
		string description;
		uint128_t identityKey;
		uint64_t createdTimestamp;
		uint64_t endTimestamp;

		// campaign tokens held in escrow
		name tokenContract;
		asset supply;
		bool supplyReceived;
		asset distributed;  // sold through the curve, net of sells
		asset reserved;     // airdrop budget not yet paid
		asset rewarded;     // airdrop rewards paid out

		// native currency
		asset target;
		asset raised;
		uint64_t fundingRatio;
		uint64_t liquidityRatio;
		uint8_t conversionStrategy;

		// funding pool
		asset fundingNative;
		asset fundingStable;
		asset fundingBasis;  // native cost of fundingStable

		asset liquidityReserve;
		asset tradingPool;
		asset platformFee;

		asset withdrawn;
		uint64_t currentMilestone;
		uint64_t milestonesCount;
		double lastPrice;

		bool active;
		bool graduated;
		symbol_code poolId;
		bool hasAirdrop;

		uint64_t primary_key() const { return campaignId; }
		uint128_t by_identity() const { return identityKey; }
		uint64_t by_creator() const { return creator.value; }
	};

	TABLE milestones {
		uint64_t id;
		string title;
		string description;
		asset requiredAmount;
		uint64_t unlockTimestamp;

		uint64_t primary_key() const { return id; }
	};

	TABLE holders {
		name account;
		asset purchased;    // sellable through the curve
		asset rewards;
		asset contributed;
		bool bundlePaid;

		uint64_t primary_key() const { return account.value; }
	};

	TABLE airdrop {
		uint8_t mode;   // reward_mode
		asset budget;
		asset distributed;
		asset bundleReward;
		bool active;
		uint64_t createdTimestamp;
		uint64_t endTimestamp;

		uint64_t primary_key() const { return 0; }
	};

	TABLE tasks {
		uint64_t id;
		uint8_t type;   // task_type
		asset reward;
		string verificationData;
		uint64_t maxCompletions;
		uint64_t completions;
		bool active;

		uint64_t primary_key() const { return id; }
	};

	TABLE completions {
		uint64_t key;
		name account;
		uint64_t taskIndex;
		uint8_t status;  // completion_status
		string proof;
		string reason;
		uint64_t submittedTimestamp;
		uint64_t decidedTimestamp;

		uint64_t primary_key() const { return key; }
		uint128_t by_user_task() const { return ((uint128_t)account.value << 64) | taskIndex; }
		uint64_t by_user() const { return account.value; }
	};

	// tables

	typedef multi_index<"information"_n, information> information_i;
	typedef multi_index<"settings"_n, settings> settings_i;
	typedef multi_index<"milestones"_n, milestones> milestones_i;
	typedef multi_index<"holders"_n, holders> holders_i;
	typedef multi_index<"airdrop"_n, airdrop> airdrop_i;
	typedef multi_index<"tasks"_n, tasks> tasks_i;

	typedef multi_index<"campaigns"_n, campaigns,
		indexed_by<"byidentity"_n, const_mem_fun<campaigns, uint128_t, &campaigns::by_identity>>,
		indexed_by<"bycreator"_n, const_mem_fun<campaigns, uint64_t, &campaigns::by_creator>>
			> campaigns_i;

	typedef multi_index<"completions"_n, completions,
		indexed_by<"byusertask"_n, const_mem_fun<completions, uint128_t, &completions::by_user_task>>,
		indexed_by<"byuser"_n, const_mem_fun<completions, uint64_t, &completions::by_user>>
			> completions_i;

  // to request the router pool

  struct exchange_state {
    asset supply;

    struct connector {
       asset balance;
       double weight = .5;
    };

    connector base;
    connector quote;

    uint64_t primary_key()const { return supply.symbol.raw(); }
  };

  typedef eosio::multi_index< "markets"_n, exchange_state > markets_i;

  // to request the oracle

  struct feed {
    symbol_code pair;
    uint64_t price;       // stable smallest units per whole native unit
    uint64_t timestamp;   // ms

    uint64_t primary_key()const { return pair.raw(); }
  };

  typedef eosio::multi_index< "feeds"_n, feed > feeds_i;

	// helper methods
	void _transfer(name account, asset quantity, string memo, name contract);
	void _assertPaused();
	settings _settings();
	price_reading _readPrice(const settings& config);
	pool_reading _readPool(const settings& config);
	void _swap(const settings& config, asset native, int64_t minReturn);
	vector<milestone_terms> _roadmap(uint64_t campaignId);
	asset _tokensAvailable(const campaigns& campaignItem);
	graduation_snapshot _graduation(const campaigns& campaignItem, const settings& config);
	void _withdraw(name caller, uint64_t campaignId, int64_t requested);
	static pool_terms _poolTerms(const airdrop& item);
	static task_terms _taskTerms(const tasks& item);

	// transfer handlers
	void _supply(name from, const campaigns& campaignItem, asset quantity);
	void _buy(name buyer, uint64_t campaignId, asset quantity);
	void _sell(name seller, uint64_t campaignId, asset quantity);

	// receipts
	void _tradelog(uint64_t campaignId, name account, string side, asset native, asset tokens, double price);
	void _fundlog(uint64_t campaignId, name creator, asset native, asset paid, uint64_t milestone);
	void _gradlog(uint64_t campaignId, symbol_code poolId, asset native, asset tokens, asset fee);

}; // CONTRACT launchfund
