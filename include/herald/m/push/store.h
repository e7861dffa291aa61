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
#define HAVE_HERALD_M_PUSH_STORE_H

/// Membership established by an m.room.member event.
struct herald::m::push::member
{
	std::string event_id;
	std::string user_id;
	std::string membership;
};

/// Profile of a member in a room.
struct herald::m::push::profile
{
	std::string display_name;
};

/// Interface to the datastore. The push system invokes these and never
/// implements them. Any of them may fail by throwing (store unavailable);
/// such failures propagate out of the push system undisturbed.
///
/// Lookups taking an invalidator register it with the data they read: the
/// store invokes it on any future change to that data (pusher added or
/// removed, receipt added, rules changed). Registering the same invalidator
/// repeatedly must be cheap.
struct herald::m::push::store
{
	using user_ids = std::set<std::string>;

	/// Whether the user is controlled by an application service.
	virtual bool is_appservice_user(const string_view &user_id) = 0;

	/// Membership rows for exactly the given m.room.member event ids; ids
	/// unknown to the store are absent from the result.
	virtual std::vector<member> get_members(const std::vector<std::string> &event_ids) = 0;

	virtual bool has_pusher(const string_view &user_id) = 0;
	virtual std::map<std::string, bool> have_pushers(const user_ids &, const invalidator &) = 0;

	/// Users with a read receipt in the room.
	virtual user_ids get_receipt_users(const string_view &room_id, const invalidator &) = 0;

	/// Rules of each user; a null value when the user has none.
	virtual rules_by_user get_rules(const user_ids &, const invalidator &) = 0;
	virtual std::shared_ptr<const rules> get_user_rules(const string_view &user_id) = 0;

	/// Joined members of the event's room at the event, with profiles.
	virtual std::map<std::string, profile> get_joined_members(const event &, const event::context &) = 0;

	virtual ~store() noexcept = default;
};
