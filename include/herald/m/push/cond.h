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
#define HAVE_HERALD_M_PUSH_COND_H

/// PushCondition
struct herald::m::push::cond
{
	/// Required. The kind of condition to apply. See conditions for more
	/// information on the allowed kinds and how they work.
	std::string kind;

	/// Required for event_match conditions. The dot- separated field of the
	/// event to match.
	std::string key;

	/// Required for event_match conditions. The glob-style pattern to match
	/// against. The pattern must match the whole value, except for the
	/// content.body key where it must match a run of whole words.
	std::string pattern;

	/// Required for room_member_count conditions. A decimal integer optionally
	/// prefixed by one of, ==, <, >, >= or <=. A prefix of < matches rooms
	/// where the member count is strictly less than the given number and so
	/// forth. If no prefix is present, this parameter defaults to ==.
	std::string is;

	/// Identifier shared by every copy of this condition in every ruleset.
	/// Only conditions whose outcome doesn't depend on the recipient carry
	/// one; the outcome is then computed once per event. Empty otherwise.
	std::string id;

	cond() = default;
	explicit cond(const Json::Value &);
};
