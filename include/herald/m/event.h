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
#define HAVE_HERALD_M_EVENT_H

namespace herald::m
{
	struct event;

	// Content membership of an m.room.member event or empty
	string_view membership(const event &);

	bool is_member(const event &) noexcept;
}

/// The Main Event
///
/// An event as seen by the push system. Once constructed an event is not
/// modified; every interface takes it by const reference.
///
struct herald::m::event
{
	struct context;

	/// Required. The globally unique event identifier.
	std::string event_id;

	/// Required. Room identifier.
	std::string room_id;

	/// Required. The type of event.
	std::string type;

	/// Required. Contains the fully-qualified ID of the user who sent this event.
	std::string sender;

	/// Present if, and only if, this event is a state event.
	std::optional<std::string> state_key;

	/// Required. The fields in this object will vary depending on the type of event.
	Json::Value content;

	event() = default;
	explicit event(const Json::Value &);
};

/// The state of the room at an event, supplied by state resolution with each
/// event. The state group is an opaque token; two contexts with equal
/// non-empty state groups carry identical state. An empty state group never
/// equals anything.
struct herald::m::event::context
{
	using state_key = std::pair<std::string, std::string>;  // (type, state_key)
	using state_ids = std::map<state_key, std::string>;     // -> event_id

	std::string state_group;
	state_ids current_state;

	context() = default;
	context(std::string state_group, state_ids current_state);
	explicit context(const Json::Value &);
};
