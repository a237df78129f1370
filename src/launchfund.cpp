// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#include "launchfund.hpp"
#include "helper.hpp"
#include "transfer.hpp"
#include "newcampaign.hpp"
#include "trade.hpp"
#include "withdraw.hpp"
#include "tasks.hpp"
#include "graduate.hpp"
#include "manage.hpp"

// dispatch

extern "C" {

	void apply(uint64_t receiver, uint64_t code, uint64_t action) {

		if (code == receiver) {
			switch (action) {
				EOSIO_DISPATCH_HELPER(launchfund,
						(init)(pause)(newcampaign)(close)
						(withdraw)(withdrawms)(getprice)(quote)
						(newairdrop)(settask)(setairdrop)
						(submittask)(approvetask)(rejecttask)
						(evalgrad)(graduate)(claimfees)
						(tradelog)(fundlog)(gradlog))
			}
		}
		else if (action == "transfer"_n.value && code != receiver) {
			execute_action(name(receiver), name(code), &launchfund::transfer);
		}
	}
};
