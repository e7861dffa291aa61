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
#define HAVE_HERALD_M_PUSH_BULK_H

/// Calculates the outcome of push rules for an event for all users in the
/// room at once.
///
/// The rules come from the room's entry in the homeserver's room_cache. Each
/// candidate must be permitted to see the event; the sender is never a
/// candidate. The first enabled rule of each candidate matching the event
/// decides the candidate's actions. A failure of any lookup propagates
/// and nothing is returned; the outcome for the event is then unknown
/// rather than empty.
struct herald::m::push::bulk
{
	static conf::item<bool> invite;

	m::homeserver &hs;
	match::func matcher;

  private:
	rules_by_user get_rules(const event &, const event::context &);
	bool matching(const event &, const rule &, const match::opts &, memo &) const;

  public:
	actions_by_user operator()(const event &, const event::context &);

	bulk(m::homeserver &, match::func = {});
};
