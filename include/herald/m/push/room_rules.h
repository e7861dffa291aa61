// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.
#pragma once
#define HAVE_HERALD_M_PUSH_ROOM_RULES_H

/// Caches the push rules of the local members of one room.
///
/// The cache is keyed by the state group of the room it was last brought up
/// to date with. For an event at that state group the cached rules are
/// returned outright. Otherwise only the memberships in the event's state not
/// already known are resolved through the store; the cache grows by merging
/// them in and never has to be re-derived when users join or leave.
///
/// No lock is held while the store is consulted. Instead the sequence
/// number is captured before the lookups and compared before merging; an
/// invalidation in the meantime increments it, and the stale results are
/// then returned to the caller without being merged.
///
struct herald::m::push::room_rules
{
	using members = std::map<std::string, member>;  // membership event_id ->
	using missing = std::map<std::string, std::string>;  // user_id -> membership event_id

	m::homeserver &hs;
	std::string room_id;
	push::invalidator invalidator;
	std::string state_group;  // empty is invalid
	members member_map;
	rules_by_user rules;
	uint64_t sequence {0};

  private:
	rules_by_user resolve(const missing &, members &) const;
	bool commit(const uint64_t &sequence, members &&, const rules_by_user &, const std::string &state_group);

  public:
	bool valid(const event::context &) const noexcept;
	rules_by_user refresh(const event::context &);
	void invalidate() noexcept;

	room_rules(m::homeserver &, std::string room_id, push::invalidator);
	room_rules(room_rules &&) = delete;
	room_rules(const room_rules &) = delete;
	~room_rules() noexcept;
};
