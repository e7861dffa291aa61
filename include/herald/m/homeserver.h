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
#define HAVE_HERALD_M_HOMESERVER_H

/// The top-level context of the server. It is constructed at startup with
/// the collaborators it is given and owns the state shared by all push
/// evaluation, chiefly the registry of per-room rule caches. Whatever
/// constructs a push::bulk is given a reference to it.
struct herald::m::homeserver
{
	struct opts
	{
		/// The server name; the host part of every local user id.
		std::string origin;

		/// Capacity of the rules_cache; zero for the configured default.
		size_t rules_cache_size {0};
	};

	/// Options from the user.
	const struct opts opts;

	/// Datastore
	push::store &store;

	/// History visibility filter
	m::visibility &visibility;

	/// Per-room push rule caches
	push::room_cache rules_cache;

	bool is_mine(const string_view &user_id) const noexcept;
	size_t rules_changed(const string_view &user_id);

	homeserver(struct opts, push::store &, m::visibility &);
	homeserver(homeserver &&) = delete;
	homeserver(const homeserver &) = delete;
	~homeserver() noexcept;
};
