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
#define HAVE_HERALD_TESTS_FIXTURE_H

#include <herald/matrix.h>
#include <catch2/catch.hpp>

namespace herald::test
{
	namespace push = m::push;

	struct fixture;

	extern const std::string origin;
	extern const std::string room_id;

	// One rule: notify on any m.room.message.
	push::rules notify_on_message();

	// A rule from its conditions and actions.
	push::rule make_rule(const std::string &rule_id, const Json::Value &conditions, const Json::Value &actions, const bool &enabled = true);

	m::event message(const std::string &sender, const std::string &body = "hello", const std::string &event_id = "$message");
	m::event invite(const std::string &sender, const std::string &invitee, const std::string &event_id = "$invite");
}

/// A homeserver at example.org over a store held in memory, and the state of
/// one room which the test builds up.
struct herald::test::fixture
{
	push::memory store;
	m::homeserver hs;
	m::event::context::state_ids state;
	size_t groups {0};

	// Adds an m.room.member event to the store and to the room state.
	std::string member(const std::string &user_id, const std::string &membership = "join");

	// Adds a pusher and the rules for a local user.
	void subscribe(const std::string &user_id, push::rules = notify_on_message());

	// A context at the room state with a new state group.
	m::event::context context();

	// A context at the room state with the given state group.
	m::event::context context(const std::string &state_group) const;

	std::shared_ptr<push::room_rules> room();

	explicit fixture(const size_t &cache_size = 0);
};
