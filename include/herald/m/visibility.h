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
#define HAVE_HERALD_M_VISIBILITY_H

namespace herald::m
{
	struct visibility;
}

/// Interface to the history visibility filter. Given a set of recipients
/// and a set of events along with the state context of each event, reports
/// which of those events each recipient is permitted to see.
struct herald::m::visibility
{
	using recipient = std::pair<std::string, bool>;                 // user_id, is_peeking
	using recipients = std::vector<recipient>;
	using contexts = std::map<std::string, const event::context *>; // event_id ->
	using visible = std::map<std::string, std::vector<std::string>>; // user_id -> event_ids

	virtual visible filter(const recipients &, const std::vector<const event *> &, const contexts &) = 0;

	virtual ~visibility() noexcept = default;
};
