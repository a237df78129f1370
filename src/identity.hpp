// Copyright © LaunchFund 2026.
// This file is part of LaunchFund.

#pragma once
#include <cstdint>
#include <string>

inline uint64_t fnv1a64(const std::string& text) {
	uint64_t hash = 14695981039346656037ULL;
	for (auto c : text) {
		hash ^= (uint8_t)c;
		hash *= 1099511628211ULL;
	}
	return hash;
}

// creator account in the high half, name hash in the low half
inline unsigned __int128 campaign_key(uint64_t creator, const std::string& name) {
	return ((unsigned __int128)creator << 64) | fnv1a64(name);
}
