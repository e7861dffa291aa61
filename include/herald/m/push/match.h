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
#define HAVE_HERALD_M_PUSH_MATCH_H

/// Condition evaluation. Decides whether a single condition holds for an
/// event from the perspective of one recipient. The builtin matcher is
/// constructed as a boolean; anything satisfying match::func may be
/// substituted for it.
struct herald::m::push::match
{
	struct opts;
	using func = std::function<bool (const event &, const cond &, const opts &)>;
	using cond_kind_func = bool (*)(const event &, const cond &, const opts &);

	static const string_view cond_kind_name[5];
	static const cond_kind_func cond_kind[6];

	bool ret;

	explicit operator bool() const noexcept
	{
		return ret;
	}

	match(const event &, const cond &, const opts &);
};

struct herald::m::push::match::opts
{
	/// The recipient.
	string_view user_id;

	/// The recipient's display name in the room, if any.
	string_view display_name;

	/// Number of joined members of the room at the event.
	size_t member_count {0};
};
