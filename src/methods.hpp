// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>

#include "errors.hpp"

using namespace eosio;
using namespace std;

#define PRINT(x, y) eosio::print(x); eosio::print(": "); eosio::print(y); eosio::print("\n");
#define PRINT_(x) eosio::print(x); eosio::print("\n");

// abort the transaction with a coded ledger error
#define CHECKC(exp, code) { if (!(exp)) eosio_assert(false, error_message(code)); }
#define CHECK_OK(result) { auto _e = (result); eosio_assert(_e == ledger_error::none, error_message(_e)); }

// METHODS

bool is_number(const string& s) {
	return !s.empty() && s.find_first_not_of("0123456789") == string::npos;
}

uint64_t time_ms() {
	return current_time() / 1'000;
}

uint64_t get_percent(uint64_t value, uint64_t percent) {
	return value * percent / 100;
}

// 10^precision
int64_t unit_of(const symbol& sym) {
	int64_t unit = 1;
	for (uint8_t i = 0; i < sym.precision(); ++i) { unit *= 10; }
	return unit;
}

// "<action>:<campaignId>"
bool parse_memo(const string& memo, string& action, uint64_t& campaignId) {
	auto separator = memo.find(':');
	if (separator == string::npos) { return false; }

	action = memo.substr(0, separator);
	auto id = memo.substr(separator + 1);
	if (!is_number(id) || id.size() > 19) { return false; }

	campaignId = stoull(id);
	return true;
}
